#ifndef SCROLLCAPTURETYPES_H
#define SCROLLCAPTURETYPES_H

#include <QColor>
#include <QImage>
#include <QMetaType>
#include <QString>
#include <QtGlobal>

// One raw accelerometer reading, in g. y is the vertical axis in portrait.
struct MotionSample {
    double x = 0.0;         // lateral
    double y = 0.0;         // vertical
    double z = 0.0;         // depth
    qint64 timestampMs = 0;
};

struct SmoothedMotion {
    double velocity = 0.0;   // moving average of the vertical axis
    bool stable = true;      // |x| and |z| of the latest sample under threshold
    bool movingDown = false;
};

enum class ScrollSpeed {
    Stationary,
    TooSlow,
    Perfect,
    TooFast
};

struct CapturedFrame {
    QImage image;
    int sequenceIndex = 0;   // position in capture order, starting at 0
};

enum class ScrollCaptureState {
    Idle,
    Capturing,
    Stitching,
    Ready,
    Empty
};

enum class FlashMode {
    Off,
    Auto,
    On
};

struct StitchConfig {
    double overlapRatio = 0.38;             // fraction of each frame shared with the previous one
    int blendStripHeightPx = 2;             // height of one alpha strip in the blend band
    qint64 maxOutputPixels = 400'000'000;   // refuse canvases larger than this
    QColor background = Qt::white;
};

struct ScrollCaptureConfig {
    int captureIntervalMs = 500;
    int sensorIntervalMs = 50;
    int smoothingWindow = 10;
    double stabilityThreshold = 0.15;
    int captureTimeoutMs = 3000;
    int expectedSegments = 20;
    bool normalizeMismatchedFrames = true;
    FlashMode flashMode = FlashMode::Auto;
    StitchConfig stitch;
};

struct ScrollCaptureResult {
    enum class Outcome {
        Ready,
        Empty
    };

    Outcome outcome = Outcome::Empty;
    QImage image;
    int frameCount = 0;
    bool stitched = false;
    bool usedFallback = false;
    QString reason;
};

Q_DECLARE_METATYPE(MotionSample)
Q_DECLARE_METATYPE(SmoothedMotion)
Q_DECLARE_METATYPE(ScrollSpeed)
Q_DECLARE_METATYPE(ScrollCaptureState)
Q_DECLARE_METATYPE(ScrollCaptureResult)

#endif // SCROLLCAPTURETYPES_H
