#include "scrollcapture/ReceiptStitcher.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QPainter>
#include <QtMath>

#include <limits>
#include <new>

ReceiptStitcher::ReceiptStitcher(const StitchConfig &config)
    : m_config(config)
{
}

int ReceiptStitcher::blendHeight(int frameHeight, double overlapRatio)
{
    if (frameHeight <= 0) {
        return 0;
    }
    const double ratio = qBound(0.0, overlapRatio, 1.0);
    return qBound(0, qRound(frameHeight * ratio), frameHeight);
}

int ReceiptStitcher::canvasHeight(int frameHeight, int frameCount, double overlapRatio)
{
    if (frameHeight <= 0 || frameCount <= 0) {
        return 0;
    }
    const int effective = frameHeight - blendHeight(frameHeight, overlapRatio);
    return frameHeight + (frameCount - 1) * effective;
}

int ReceiptStitcher::stripCount(int blendHeight, int stripHeight)
{
    if (blendHeight <= 0) {
        return 0;
    }
    const int step = qMax(1, stripHeight);
    // Last strip is clipped to the band so every band row is covered
    return (blendHeight + step - 1) / step;
}

double ReceiptStitcher::stripOpacity(int strip, int strips)
{
    if (strips <= 0) {
        return 1.0;
    }
    return qBound(0.0, static_cast<double>(strip) / strips, 1.0);
}

ReceiptStitcher::Result ReceiptStitcher::composite(const QVector<QImage> &frames) const
{
    Result result;
    result.frameCount = static_cast<int>(frames.size());

    if (frames.isEmpty()) {
        result.outcome = Outcome::Empty;
        return result;
    }

    if (frames.size() == 1) {
        result.outcome = Outcome::Single;
        result.image = frames.first();
        return result;
    }

    const QSize frameSize = frames.first().size();
    for (const QImage &frame : frames) {
        if (frame.isNull() || frame.size() != frameSize) {
            result.outcome = Outcome::Failed;
            result.failureReason = QStringLiteral("Frames differ in size");
            qWarning() << "ReceiptStitcher: Frame size mismatch, expected" << frameSize
                       << "got" << frame.size();
            return result;
        }
    }

    const int height = frameSize.height();
    const int blend = blendHeight(height, m_config.overlapRatio);
    const int effective = height - blend;
    if (effective <= 0) {
        result.outcome = Outcome::Failed;
        result.failureReason = QStringLiteral("Overlap leaves no new rows per frame");
        return result;
    }

    const qint64 canvasRows = static_cast<qint64>(height)
        + static_cast<qint64>(frames.size() - 1) * effective;
    const qint64 pixels = canvasRows * frameSize.width();
    if (canvasRows > std::numeric_limits<int>::max() || pixels > m_config.maxOutputPixels) {
        result.outcome = Outcome::Failed;
        result.failureReason = QStringLiteral("Stitched image would be %1 pixels").arg(pixels);
        qWarning() << "ReceiptStitcher:" << result.failureReason;
        return result;
    }

    try {
        return compose(frames, blend, effective, static_cast<int>(canvasRows));
    } catch (const std::bad_alloc &) {
        result.outcome = Outcome::Failed;
        result.failureReason = QStringLiteral("Out of memory while compositing");
        qWarning() << "ReceiptStitcher:" << result.failureReason;
        return result;
    }
}

ReceiptStitcher::Result ReceiptStitcher::compose(const QVector<QImage> &frames,
                                                 int blend, int effective, int height) const
{
    QElapsedTimer timer;
    timer.start();

    Result result;
    result.frameCount = static_cast<int>(frames.size());
    result.blendHeight = blend;
    result.effectiveHeight = effective;

    const int width = frames.first().width();
    const int frameHeight = frames.first().height();

    QImage canvas(width, height, QImage::Format_RGB32);
    if (canvas.isNull()) {
        result.outcome = Outcome::Failed;
        result.failureReason = QStringLiteral("Could not allocate %1x%2 canvas").arg(width).arg(height);
        qWarning() << "ReceiptStitcher:" << result.failureReason;
        return result;
    }
    canvas.fill(m_config.background);

    const int stripHeight = qMax(1, m_config.blendStripHeightPx);
    const int strips = stripCount(blend, stripHeight);

    QPainter painter(&canvas);
    painter.drawImage(QPoint(0, 0), frames.first());

    for (int i = 1; i < frames.size(); ++i) {
        const QImage &frame = frames.at(i);
        const int y = i * effective;

        // Rows below the band have nothing underneath them yet
        painter.setOpacity(1.0);
        painter.drawImage(QRect(0, y + blend, width, frameHeight - blend),
                          frame,
                          QRect(0, blend, width, frameHeight - blend));

        for (int strip = 0; strip < strips; ++strip) {
            const int top = strip * stripHeight;
            const int rows = qMin(stripHeight, blend - top);
            const double opacity = stripOpacity(strip, strips);
            if (opacity <= 0.0) {
                continue;
            }
            painter.setOpacity(opacity);
            painter.drawImage(QRect(0, y + top, width, rows),
                              frame,
                              QRect(0, top, width, rows));
        }
    }
    painter.end();

    qDebug() << "ReceiptStitcher: Composited" << frames.size() << "frames into"
             << canvas.size() << "in" << timer.elapsed() << "ms";

    result.outcome = Outcome::Stitched;
    result.image = canvas;
    return result;
}
