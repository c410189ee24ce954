#ifndef ICAMERACAPTURE_H
#define ICAMERACAPTURE_H

#include <QFuture>
#include <QImage>
#include <QMutex>
#include <QObject>
#include <QPromise>
#include <QString>
#include <atomic>
#include <memory>

#include "scrollcapture/ScrollCaptureTypes.h"

/**
 * @brief Abstract still-photo camera with a single capture slot
 *
 * Only one capture may be outstanding at a time. requestCapture() claims
 * the slot and returns a future that resolves with the frame, or finishes
 * without a result when the capture fails or is abandoned. While the slot
 * is taken isInFlight() is true and further requests resolve immediately
 * with no result.
 *
 * Implementations override startCapture() and complete the request with
 * deliverFrame() or deliverFailure(), from any thread. Completions carrying
 * a request id other than the pending one are dropped.
 */
class ICameraCapture : public QObject
{
    Q_OBJECT

public:
    explicit ICameraCapture(QObject *parent = nullptr);
    ~ICameraCapture() override;

    /**
     * @brief Claim the capture slot and start a photo capture
     * @param flash Flash mode for this shot
     * @return Future resolving with the captured frame
     */
    QFuture<QImage> requestCapture(FlashMode flash = FlashMode::Auto);

    bool isInFlight() const { return m_inFlight.load(); }

    /**
     * @brief Release the slot without waiting for the outstanding capture
     *
     * The pending future finishes with no result. A frame delivered later
     * for the abandoned request is ignored.
     * @return true if a request was pending
     */
    bool abandonPendingCapture();

    virtual QString cameraName() const = 0;

signals:
    void inFlightChanged(bool inFlight);

protected:
    virtual void startCapture(quint64 requestId, FlashMode flash) = 0;

    // Called after the slot was released by abandonPendingCapture().
    virtual void cancelCapture(quint64 requestId) { Q_UNUSED(requestId); }

    bool deliverFrame(quint64 requestId, const QImage &frame);
    bool deliverFailure(quint64 requestId, const QString &reason);

private:
    bool completePending(quint64 requestId, const QImage *frame);

    mutable QMutex m_mutex;
    std::unique_ptr<QPromise<QImage>> m_pending;
    quint64 m_pendingId = 0;
    quint64 m_nextRequestId = 1;
    std::atomic<bool> m_inFlight{false};
};

#endif // ICAMERACAPTURE_H
