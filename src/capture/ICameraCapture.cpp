#include "capture/ICameraCapture.h"

#include <QDebug>
#include <QMutexLocker>
#include <QPromise>

namespace {

QFuture<QImage> finishedWithoutResult()
{
    QPromise<QImage> promise;
    promise.start();
    promise.finish();
    return promise.future();
}

} // namespace

ICameraCapture::ICameraCapture(QObject *parent)
    : QObject(parent)
{
}

ICameraCapture::~ICameraCapture()
{
    std::unique_ptr<QPromise<QImage>> pending;
    {
        QMutexLocker locker(&m_mutex);
        pending = std::move(m_pending);
        m_pendingId = 0;
    }
    if (pending) {
        pending->finish();
    }
}

QFuture<QImage> ICameraCapture::requestCapture(FlashMode flash)
{
    bool expected = false;
    if (!m_inFlight.compare_exchange_strong(expected, true)) {
        qDebug() << "ICameraCapture: Capture already in flight, request ignored";
        return finishedWithoutResult();
    }

    QFuture<QImage> future;
    quint64 requestId = 0;
    {
        QMutexLocker locker(&m_mutex);
        m_pending = std::make_unique<QPromise<QImage>>();
        m_pending->start();
        future = m_pending->future();
        requestId = m_nextRequestId++;
        m_pendingId = requestId;
    }

    emit inFlightChanged(true);
    startCapture(requestId, flash);
    return future;
}

bool ICameraCapture::abandonPendingCapture()
{
    std::unique_ptr<QPromise<QImage>> pending;
    quint64 requestId = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_pending) {
            return false;
        }
        pending = std::move(m_pending);
        requestId = m_pendingId;
        m_pendingId = 0;
        m_inFlight.store(false);
    }

    qDebug() << "ICameraCapture: Abandoned capture request" << requestId;
    cancelCapture(requestId);
    pending->finish();
    emit inFlightChanged(false);
    return true;
}

bool ICameraCapture::deliverFrame(quint64 requestId, const QImage &frame)
{
    return completePending(requestId, &frame);
}

bool ICameraCapture::deliverFailure(quint64 requestId, const QString &reason)
{
    qWarning() << "ICameraCapture: Capture" << requestId << "failed:" << reason;
    return completePending(requestId, nullptr);
}

bool ICameraCapture::completePending(quint64 requestId, const QImage *frame)
{
    std::unique_ptr<QPromise<QImage>> pending;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_pending || requestId != m_pendingId) {
            qDebug() << "ICameraCapture: Dropping completion for stale request" << requestId;
            return false;
        }
        pending = std::move(m_pending);
        m_pendingId = 0;
        // Slot is free before the future resolves so continuations may capture again
        m_inFlight.store(false);
    }

    if (frame && !frame->isNull()) {
        pending->addResult(*frame);
    }
    pending->finish();
    emit inFlightChanged(false);
    return true;
}
