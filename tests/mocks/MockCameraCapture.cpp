#include "MockCameraCapture.h"

#include <QTimer>

MockCameraCapture::MockCameraCapture(QObject *parent)
    : ICameraCapture(parent)
{
    // Default test frame (100x100 white)
    m_nextFrame = QImage(100, 100, QImage::Format_RGB32);
    m_nextFrame.fill(Qt::white);
}

void MockCameraCapture::setNextFrame(const QImage &frame)
{
    m_nextFrame = frame;
    m_frameSequence.clear();
    m_frameSequenceIndex = 0;
}

void MockCameraCapture::setFrameSequence(const QList<QImage> &frames)
{
    m_frameSequence = frames;
    m_frameSequenceIndex = 0;
}

bool MockCameraCapture::respond()
{
    return finishOutstanding(takeNextFrame(), false, QString());
}

bool MockCameraCapture::respondWith(const QImage &frame)
{
    return finishOutstanding(frame, false, QString());
}

bool MockCameraCapture::fail(const QString &reason)
{
    return finishOutstanding(QImage(), true, reason);
}

bool MockCameraCapture::respondToRequest(quint64 requestId, const QImage &frame)
{
    return finishRequest(requestId, frame, false, QString());
}

bool MockCameraCapture::failRequest(quint64 requestId, const QString &reason)
{
    return finishRequest(requestId, QImage(), true, reason);
}

void MockCameraCapture::resetCounters()
{
    m_startCalls = 0;
    m_cancelCalls = 0;
    m_maxOutstanding = m_outstanding.load();
}

void MockCameraCapture::startCapture(quint64 requestId, FlashMode flash)
{
    ++m_startCalls;
    const int outstanding = ++m_outstanding;
    if (outstanding > m_maxOutstanding.load()) {
        m_maxOutstanding = outstanding;
    }
    m_lastRequestId = requestId;
    m_lastFlashMode = flash;

    switch (m_mode) {
    case ResponseMode::Immediate:
        respond();
        break;
    case ResponseMode::Deferred:
        QTimer::singleShot(0, this, [this, requestId]() {
            if (m_lastRequestId == requestId && isInFlight()) {
                respond();
            }
        });
        break;
    case ResponseMode::Manual:
        break;
    }
}

void MockCameraCapture::cancelCapture(quint64 requestId)
{
    Q_UNUSED(requestId);
    ++m_cancelCalls;
    --m_outstanding;
}

QImage MockCameraCapture::takeNextFrame()
{
    if (!m_frameSequence.isEmpty()) {
        const int index = qMin(m_frameSequenceIndex, static_cast<int>(m_frameSequence.size()) - 1);
        ++m_frameSequenceIndex;
        return m_frameSequence.at(index);
    }
    return m_nextFrame;
}

bool MockCameraCapture::finishOutstanding(const QImage &frame, bool failed, const QString &reason)
{
    if (!isInFlight()) {
        return false;
    }
    return finishRequest(m_lastRequestId, frame, failed, reason);
}

bool MockCameraCapture::finishRequest(quint64 requestId, const QImage &frame,
                                      bool failed, const QString &reason)
{
    // Decrement first: the gate may issue the next request from the completion
    --m_outstanding;
    const bool delivered = failed
        ? deliverFailure(requestId, reason)
        : deliverFrame(requestId, frame);
    if (!delivered) {
        ++m_outstanding;
    }
    return delivered;
}
