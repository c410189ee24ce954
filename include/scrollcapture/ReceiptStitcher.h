#ifndef RECEIPTSTITCHER_H
#define RECEIPTSTITCHER_H

#include <QImage>
#include <QString>
#include <QVector>

#include "scrollcapture/ScrollCaptureTypes.h"

/**
 * @brief Composites an ordered run of equally sized frames into one tall image
 *
 * Frames are assumed to advance by a fixed fraction of their height
 * (1 - overlapRatio). No pixel registration is performed. Each frame after
 * the first is laid at y = i * effectiveHeight; its lower part is drawn
 * opaque and its top band of blendHeight rows is cross-faded over the
 * previous frame in thin strips whose opacity rises linearly from 0 to 1.
 *
 *   blendHeight     = round(H * overlapRatio)
 *   effectiveHeight = H - blendHeight
 *   canvasHeight    = H + (n - 1) * effectiveHeight
 */
class ReceiptStitcher
{
public:
    enum class Outcome {
        Empty,      // no frames
        Single,     // one frame, returned unchanged
        Stitched,
        Failed
    };

    struct Result {
        Outcome outcome = Outcome::Empty;
        QImage image;
        int frameCount = 0;
        int blendHeight = 0;
        int effectiveHeight = 0;
        QString failureReason;
    };

    explicit ReceiptStitcher(const StitchConfig &config = StitchConfig());

    void setConfig(const StitchConfig &config) { m_config = config; }
    StitchConfig config() const { return m_config; }

    // Never throws; allocation failures are reported as Outcome::Failed.
    Result composite(const QVector<QImage> &frames) const;

    static int blendHeight(int frameHeight, double overlapRatio);
    static int canvasHeight(int frameHeight, int frameCount, double overlapRatio);
    static int stripCount(int blendHeight, int stripHeight);
    static double stripOpacity(int strip, int strips);

private:
    Result compose(const QVector<QImage> &frames, int blend, int effective, int height) const;

    StitchConfig m_config;
};

#endif // RECEIPTSTITCHER_H
