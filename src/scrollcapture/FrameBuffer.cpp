#include "scrollcapture/FrameBuffer.h"
#include "utils/FrameNormalizer.h"

#include <QDebug>
#include <QMutexLocker>
#include <QtGlobal>

FrameBuffer::FrameBuffer(int expectedSegments)
    : m_expectedSegments(qMax(1, expectedSegments))
{
}

void FrameBuffer::setExpectedSegments(int segments)
{
    QMutexLocker locker(&m_mutex);
    m_expectedSegments = qMax(1, segments);
}

int FrameBuffer::expectedSegments() const
{
    QMutexLocker locker(&m_mutex);
    return m_expectedSegments;
}

void FrameBuffer::setNormalizeMismatched(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_normalizeMismatched = enabled;
}

bool FrameBuffer::normalizeMismatched() const
{
    QMutexLocker locker(&m_mutex);
    return m_normalizeMismatched;
}

FrameBuffer::AppendResult FrameBuffer::append(const QImage &frame)
{
    AppendResult result;

    if (frame.isNull()) {
        result.reason = QStringLiteral("Frame is empty");
        qWarning() << "FrameBuffer: Rejected empty frame";
        return result;
    }

    QSize reference;
    bool normalize = true;
    {
        QMutexLocker locker(&m_mutex);
        reference = m_referenceSize;
        normalize = m_normalizeMismatched;
    }

    // Normalization may be slow on large photos; keep it outside the lock.
    // Appends come from a single writer so the reference cannot change meanwhile.
    QImage accepted = frame;
    result.status = AppendStatus::Appended;
    if (reference.isValid() && frame.size() != reference) {
        if (!normalize) {
            result.status = AppendStatus::Rejected;
            result.reason = QStringLiteral("Frame size %1x%2 differs from %3x%4")
                                .arg(frame.width()).arg(frame.height())
                                .arg(reference.width()).arg(reference.height());
            qWarning() << "FrameBuffer:" << result.reason;
            return result;
        }

        const FrameNormalizer::Result normalized = FrameNormalizer::normalize(frame, reference);
        if (normalized.status == FrameNormalizer::Status::Rejected) {
            result.status = AppendStatus::Rejected;
            result.reason = normalized.reason;
            qWarning() << "FrameBuffer: Rejected frame -" << result.reason;
            return result;
        }
        accepted = normalized.image;
        result.status = AppendStatus::Normalized;
    }

    QMutexLocker locker(&m_mutex);
    if (!m_referenceSize.isValid()) {
        m_referenceSize = accepted.size();
    }
    CapturedFrame captured;
    captured.image = accepted;
    captured.sequenceIndex = static_cast<int>(m_frames.size());
    m_frames.append(captured);
    result.sequenceIndex = captured.sequenceIndex;
    return result;
}

void FrameBuffer::reset()
{
    QMutexLocker locker(&m_mutex);
    m_frames.clear();
    m_referenceSize = QSize();
}

int FrameBuffer::count() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_frames.size());
}

bool FrameBuffer::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_frames.isEmpty();
}

double FrameBuffer::progress() const
{
    QMutexLocker locker(&m_mutex);
    return qMin(static_cast<double>(m_frames.size()) / m_expectedSegments, 1.0);
}

QSize FrameBuffer::referenceSize() const
{
    QMutexLocker locker(&m_mutex);
    return m_referenceSize;
}

QImage FrameBuffer::first() const
{
    QMutexLocker locker(&m_mutex);
    return m_frames.isEmpty() ? QImage() : m_frames.first().image;
}

QVector<CapturedFrame> FrameBuffer::frames() const
{
    QMutexLocker locker(&m_mutex);
    return m_frames;
}

QVector<QImage> FrameBuffer::images() const
{
    QMutexLocker locker(&m_mutex);
    QVector<QImage> images;
    images.reserve(m_frames.size());
    for (const CapturedFrame &frame : m_frames) {
        images.append(frame.image);
    }
    return images;
}
