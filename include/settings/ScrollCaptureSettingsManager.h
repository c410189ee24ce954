#ifndef SCROLLCAPTURESETTINGSMANAGER_H
#define SCROLLCAPTURESETTINGSMANAGER_H

#include "scrollcapture/ScrollCaptureTypes.h"

class ScrollCaptureSettingsManager
{
public:
    static ScrollCaptureSettingsManager& instance();

    int loadCaptureIntervalMs() const;
    void saveCaptureIntervalMs(int intervalMs);

    int loadSensorIntervalMs() const;
    void saveSensorIntervalMs(int intervalMs);

    int loadSmoothingWindow() const;
    void saveSmoothingWindow(int samples);

    double loadStabilityThreshold() const;
    void saveStabilityThreshold(double threshold);

    double loadOverlapRatio() const;
    void saveOverlapRatio(double ratio);

    int loadBlendStripHeight() const;
    void saveBlendStripHeight(int heightPx);

    int loadCaptureTimeoutMs() const;
    void saveCaptureTimeoutMs(int timeoutMs);

    int loadExpectedSegments() const;
    void saveExpectedSegments(int segments);

    qint64 loadMaxOutputPixels() const;
    void saveMaxOutputPixels(qint64 maxOutputPixels);

    bool loadNormalizeMismatchedFrames() const;
    void saveNormalizeMismatchedFrames(bool enabled);

    FlashMode loadFlashMode() const;
    void saveFlashMode(FlashMode mode);

    // Assembles every stored value into a session configuration.
    ScrollCaptureConfig loadConfig() const;

    static constexpr int kDefaultCaptureIntervalMs = 500;
    static constexpr int kDefaultSensorIntervalMs = 50;
    static constexpr int kDefaultSmoothingWindow = 10;
    static constexpr double kDefaultStabilityThreshold = 0.15;
    static constexpr double kDefaultOverlapRatio = 0.38;
    static constexpr int kDefaultBlendStripHeight = 2;
    static constexpr int kDefaultCaptureTimeoutMs = 3000;
    static constexpr int kDefaultExpectedSegments = 20;
    static constexpr qint64 kDefaultMaxOutputPixels = 400'000'000;
    static constexpr bool kDefaultNormalizeMismatchedFrames = true;
    static constexpr FlashMode kDefaultFlashMode = FlashMode::Auto;

private:
    ScrollCaptureSettingsManager() = default;
    ~ScrollCaptureSettingsManager() = default;
    ScrollCaptureSettingsManager(const ScrollCaptureSettingsManager&) = delete;
    ScrollCaptureSettingsManager& operator=(const ScrollCaptureSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyCaptureIntervalMs =
        "scrollCapture/captureIntervalMs";
    static constexpr const char* kSettingsKeySensorIntervalMs =
        "scrollCapture/sensorIntervalMs";
    static constexpr const char* kSettingsKeySmoothingWindow =
        "scrollCapture/smoothingWindow";
    static constexpr const char* kSettingsKeyStabilityThreshold =
        "scrollCapture/stabilityThreshold";
    static constexpr const char* kSettingsKeyOverlapRatio =
        "scrollCapture/overlapRatio";
    static constexpr const char* kSettingsKeyBlendStripHeight =
        "scrollCapture/blendStripHeight";
    static constexpr const char* kSettingsKeyCaptureTimeoutMs =
        "scrollCapture/captureTimeoutMs";
    static constexpr const char* kSettingsKeyExpectedSegments =
        "scrollCapture/expectedSegments";
    static constexpr const char* kSettingsKeyMaxOutputPixels =
        "scrollCapture/maxOutputPixels";
    static constexpr const char* kSettingsKeyNormalizeMismatchedFrames =
        "scrollCapture/normalizeMismatchedFrames";
    static constexpr const char* kSettingsKeyFlashMode =
        "scrollCapture/flashMode";
};

#endif // SCROLLCAPTURESETTINGSMANAGER_H
