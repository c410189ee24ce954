#include "utils/FrameNormalizer.h"

#include <QDebug>
#include <QtMath>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace {

// Format_RGB32 is B-G-R-A in memory on little-endian targets, which is
// OpenCV's CV_8UC4 layout, so the buffer can be wrapped without cvtColor.
cv::Mat wrapRgb32(const QImage& rgb)
{
    return cv::Mat(rgb.height(), rgb.width(), CV_8UC4,
                   const_cast<uchar*>(rgb.constBits()),
                   static_cast<size_t>(rgb.bytesPerLine()));
}

QImage matToImage(const cv::Mat& mat)
{
    return QImage(mat.data, mat.cols, mat.rows,
                  static_cast<int>(mat.step),
                  QImage::Format_RGB32).copy();
}

} // namespace

namespace FrameNormalizer {

QImage scaleToWidth(const QImage& frame, int width)
{
    if (frame.isNull() || width <= 0) {
        return QImage();
    }

    const QImage rgb = frame.convertToFormat(QImage::Format_RGB32);
    if (rgb.width() == width) {
        return rgb;
    }

    const int height = qMax(1, qRound(static_cast<double>(rgb.height()) * width / rgb.width()));
    const int interpolation = width < rgb.width() ? cv::INTER_AREA : cv::INTER_LINEAR;

    cv::Mat scaled;
    cv::resize(wrapRgb32(rgb), scaled, cv::Size(width, height), 0, 0, interpolation);
    return matToImage(scaled);
}

Result normalize(const QImage& frame, const QSize& reference)
{
    Result result;

    if (frame.isNull()) {
        result.reason = QStringLiteral("Frame is empty");
        return result;
    }
    if (!reference.isValid() || frame.size() == reference) {
        result.status = Status::Unchanged;
        result.image = frame;
        return result;
    }

    QImage scaled = scaleToWidth(frame, reference.width());
    if (scaled.isNull()) {
        result.reason = QStringLiteral("Frame could not be rescaled");
        return result;
    }

    if (scaled.height() < reference.height()) {
        result.reason = QStringLiteral("Frame %1x%2 is too short for %3x%4")
                            .arg(frame.width()).arg(frame.height())
                            .arg(reference.width()).arg(reference.height());
        return result;
    }

    if (scaled.height() > reference.height()) {
        scaled = scaled.copy(0, 0, reference.width(), reference.height());
    }

    qDebug() << "FrameNormalizer: Normalized" << frame.size() << "to" << scaled.size();
    result.status = Status::Normalized;
    result.image = scaled;
    return result;
}

} // namespace FrameNormalizer
