#ifndef FRAMEBUFFER_H
#define FRAMEBUFFER_H

#include <QImage>
#include <QMutex>
#include <QSize>
#include <QString>
#include <QVector>

#include "scrollcapture/ScrollCaptureTypes.h"

/**
 * @brief Ordered frames of one scroll-capture session
 *
 * Append-only; capture order is append order. The first frame fixes the
 * reference size and later frames are normalized to it or rejected.
 * All methods are thread-safe: the capture callback appends while the UI
 * reads count() and progress().
 */
class FrameBuffer
{
public:
    enum class AppendStatus {
        Appended,
        Normalized,
        Rejected
    };

    struct AppendResult {
        AppendStatus status = AppendStatus::Rejected;
        int sequenceIndex = -1;
        QString reason;
    };

    explicit FrameBuffer(int expectedSegments = 20);

    void setExpectedSegments(int segments);
    int expectedSegments() const;

    // When disabled, frames whose size differs from the first are rejected.
    void setNormalizeMismatched(bool enabled);
    bool normalizeMismatched() const;

    AppendResult append(const QImage &frame);
    void reset();

    int count() const;
    bool isEmpty() const;
    // min(count / expectedSegments, 1.0); saturates, never limits appends.
    double progress() const;

    QSize referenceSize() const;
    QImage first() const;
    QVector<CapturedFrame> frames() const;
    QVector<QImage> images() const;

private:
    mutable QMutex m_mutex;
    QVector<CapturedFrame> m_frames;
    QSize m_referenceSize;
    int m_expectedSegments;
    bool m_normalizeMismatched = true;
};

#endif // FRAMEBUFFER_H
