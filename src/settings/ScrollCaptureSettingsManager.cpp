#include "settings/ScrollCaptureSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

namespace {

int clampCaptureIntervalMs(int intervalMs)
{
    return qBound(100, intervalMs, 5000);
}

int clampSensorIntervalMs(int intervalMs)
{
    return qBound(10, intervalMs, 1000);
}

int clampSmoothingWindow(int samples)
{
    return qBound(1, samples, 100);
}

double clampStabilityThreshold(double threshold)
{
    return qBound(0.01, threshold, 1.0);
}

double clampOverlapRatio(double ratio)
{
    return qBound(0.05, ratio, 0.90);
}

int clampBlendStripHeight(int heightPx)
{
    return qBound(1, heightPx, 64);
}

int clampCaptureTimeoutMs(int timeoutMs)
{
    return qBound(250, timeoutMs, 30000);
}

int clampExpectedSegments(int segments)
{
    return qBound(1, segments, 200);
}

qint64 clampMaxOutputPixels(qint64 maxOutputPixels)
{
    return qBound<qint64>(1'000'000, maxOutputPixels, 1'000'000'000);
}

FlashMode clampFlashMode(int rawMode)
{
    const int bounded = qBound(0, rawMode, 2);
    return static_cast<FlashMode>(bounded);
}

} // namespace

ScrollCaptureSettingsManager& ScrollCaptureSettingsManager::instance()
{
    static ScrollCaptureSettingsManager instance;
    return instance;
}

int ScrollCaptureSettingsManager::loadCaptureIntervalMs() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeyCaptureIntervalMs, kDefaultCaptureIntervalMs).toInt();
    return clampCaptureIntervalMs(stored);
}

void ScrollCaptureSettingsManager::saveCaptureIntervalMs(int intervalMs)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyCaptureIntervalMs, clampCaptureIntervalMs(intervalMs));
}

int ScrollCaptureSettingsManager::loadSensorIntervalMs() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeySensorIntervalMs, kDefaultSensorIntervalMs).toInt();
    return clampSensorIntervalMs(stored);
}

void ScrollCaptureSettingsManager::saveSensorIntervalMs(int intervalMs)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeySensorIntervalMs, clampSensorIntervalMs(intervalMs));
}

int ScrollCaptureSettingsManager::loadSmoothingWindow() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeySmoothingWindow, kDefaultSmoothingWindow).toInt();
    return clampSmoothingWindow(stored);
}

void ScrollCaptureSettingsManager::saveSmoothingWindow(int samples)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeySmoothingWindow, clampSmoothingWindow(samples));
}

double ScrollCaptureSettingsManager::loadStabilityThreshold() const
{
    auto settings = ReceiptCapture::getSettings();
    const double stored = settings.value(kSettingsKeyStabilityThreshold,
                                         kDefaultStabilityThreshold).toDouble();
    return clampStabilityThreshold(stored);
}

void ScrollCaptureSettingsManager::saveStabilityThreshold(double threshold)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyStabilityThreshold, clampStabilityThreshold(threshold));
}

double ScrollCaptureSettingsManager::loadOverlapRatio() const
{
    auto settings = ReceiptCapture::getSettings();
    const double stored = settings.value(kSettingsKeyOverlapRatio, kDefaultOverlapRatio).toDouble();
    return clampOverlapRatio(stored);
}

void ScrollCaptureSettingsManager::saveOverlapRatio(double ratio)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyOverlapRatio, clampOverlapRatio(ratio));
}

int ScrollCaptureSettingsManager::loadBlendStripHeight() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeyBlendStripHeight, kDefaultBlendStripHeight).toInt();
    return clampBlendStripHeight(stored);
}

void ScrollCaptureSettingsManager::saveBlendStripHeight(int heightPx)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyBlendStripHeight, clampBlendStripHeight(heightPx));
}

int ScrollCaptureSettingsManager::loadCaptureTimeoutMs() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeyCaptureTimeoutMs, kDefaultCaptureTimeoutMs).toInt();
    return clampCaptureTimeoutMs(stored);
}

void ScrollCaptureSettingsManager::saveCaptureTimeoutMs(int timeoutMs)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyCaptureTimeoutMs, clampCaptureTimeoutMs(timeoutMs));
}

int ScrollCaptureSettingsManager::loadExpectedSegments() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeyExpectedSegments, kDefaultExpectedSegments).toInt();
    return clampExpectedSegments(stored);
}

void ScrollCaptureSettingsManager::saveExpectedSegments(int segments)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyExpectedSegments, clampExpectedSegments(segments));
}

qint64 ScrollCaptureSettingsManager::loadMaxOutputPixels() const
{
    auto settings = ReceiptCapture::getSettings();
    const qint64 stored = settings.value(kSettingsKeyMaxOutputPixels,
                                         kDefaultMaxOutputPixels).toLongLong();
    return clampMaxOutputPixels(stored);
}

void ScrollCaptureSettingsManager::saveMaxOutputPixels(qint64 maxOutputPixels)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyMaxOutputPixels, clampMaxOutputPixels(maxOutputPixels));
}

bool ScrollCaptureSettingsManager::loadNormalizeMismatchedFrames() const
{
    auto settings = ReceiptCapture::getSettings();
    return settings.value(kSettingsKeyNormalizeMismatchedFrames,
                          kDefaultNormalizeMismatchedFrames).toBool();
}

void ScrollCaptureSettingsManager::saveNormalizeMismatchedFrames(bool enabled)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyNormalizeMismatchedFrames, enabled);
}

FlashMode ScrollCaptureSettingsManager::loadFlashMode() const
{
    auto settings = ReceiptCapture::getSettings();
    const int stored = settings.value(kSettingsKeyFlashMode,
                                      static_cast<int>(kDefaultFlashMode)).toInt();
    return clampFlashMode(stored);
}

void ScrollCaptureSettingsManager::saveFlashMode(FlashMode mode)
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue(kSettingsKeyFlashMode, static_cast<int>(mode));
}

ScrollCaptureConfig ScrollCaptureSettingsManager::loadConfig() const
{
    ScrollCaptureConfig config;
    config.captureIntervalMs = loadCaptureIntervalMs();
    config.sensorIntervalMs = loadSensorIntervalMs();
    config.smoothingWindow = loadSmoothingWindow();
    config.stabilityThreshold = loadStabilityThreshold();
    config.captureTimeoutMs = loadCaptureTimeoutMs();
    config.expectedSegments = loadExpectedSegments();
    config.normalizeMismatchedFrames = loadNormalizeMismatchedFrames();
    config.flashMode = loadFlashMode();
    config.stitch.overlapRatio = loadOverlapRatio();
    config.stitch.blendStripHeightPx = loadBlendStripHeight();
    config.stitch.maxOutputPixels = loadMaxOutputPixels();
    return config;
}
