#ifndef RECEIPTCAPTURE_FRAMENORMALIZER_H
#define RECEIPTCAPTURE_FRAMENORMALIZER_H

#include <QImage>
#include <QSize>
#include <QString>

// Brings camera frames to a common size before they enter a capture session.
//
// A frame whose width differs from the reference is rescaled to the
// reference width with its aspect ratio preserved (INTER_AREA when
// shrinking, INTER_LINEAR when growing). A frame that is then taller than
// the reference is cropped from the top edge down. A frame that ends up
// shorter than the reference cannot be made to fit and is rejected.

namespace FrameNormalizer {

enum class Status {
    Unchanged,
    Normalized,
    Rejected
};

struct Result {
    Status status = Status::Rejected;
    QImage image;
    QString reason;
};

Result normalize(const QImage& frame, const QSize& reference);

// Rescales to the given width, keeping aspect ratio. Output is Format_RGB32.
QImage scaleToWidth(const QImage& frame, int width);

} // namespace FrameNormalizer

#endif // RECEIPTCAPTURE_FRAMENORMALIZER_H
