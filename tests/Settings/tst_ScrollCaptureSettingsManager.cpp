#include <QtTest/QtTest>

#include "settings/ScrollCaptureSettingsManager.h"
#include "settings/Settings.h"

class tst_ScrollCaptureSettingsManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testSingletonInstance();

    void testTimingDefaults();
    void testTimingRoundtrip();
    void testTimingClamp();

    void testMotionDefaults();
    void testMotionRoundtrip();
    void testThresholdClamp();

    void testStitchDefaults();
    void testStitchRoundtrip();
    void testStitchClamp();

    void testFlashModeRoundtrip();
    void testFlashModeClampsStoredValue();
    void testNormalizeRoundtrip();

    void testLoadConfigAssemblesValues();

private:
    void clearSettings();
};

void tst_ScrollCaptureSettingsManager::init()
{
    clearSettings();
}

void tst_ScrollCaptureSettingsManager::cleanup()
{
    clearSettings();
}

void tst_ScrollCaptureSettingsManager::clearSettings()
{
    auto settings = ReceiptCapture::getSettings();
    settings.remove("scrollCapture");
    settings.sync();
}

void tst_ScrollCaptureSettingsManager::testSingletonInstance()
{
    auto& instance1 = ScrollCaptureSettingsManager::instance();
    auto& instance2 = ScrollCaptureSettingsManager::instance();
    QCOMPARE(&instance1, &instance2);
}

void tst_ScrollCaptureSettingsManager::testTimingDefaults()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    QCOMPARE(manager.loadCaptureIntervalMs(), ScrollCaptureSettingsManager::kDefaultCaptureIntervalMs);
    QCOMPARE(manager.loadSensorIntervalMs(), ScrollCaptureSettingsManager::kDefaultSensorIntervalMs);
    QCOMPARE(manager.loadCaptureTimeoutMs(), ScrollCaptureSettingsManager::kDefaultCaptureTimeoutMs);
    QCOMPARE(manager.loadCaptureIntervalMs(), 500);
    QCOMPARE(manager.loadSensorIntervalMs(), 50);
}

void tst_ScrollCaptureSettingsManager::testTimingRoundtrip()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveCaptureIntervalMs(750);
    manager.saveSensorIntervalMs(20);
    manager.saveCaptureTimeoutMs(5000);

    QCOMPARE(manager.loadCaptureIntervalMs(), 750);
    QCOMPARE(manager.loadSensorIntervalMs(), 20);
    QCOMPARE(manager.loadCaptureTimeoutMs(), 5000);
}

void tst_ScrollCaptureSettingsManager::testTimingClamp()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveCaptureIntervalMs(5);
    QCOMPARE(manager.loadCaptureIntervalMs(), 100);
    manager.saveCaptureIntervalMs(100000);
    QCOMPARE(manager.loadCaptureIntervalMs(), 5000);

    manager.saveSensorIntervalMs(0);
    QCOMPARE(manager.loadSensorIntervalMs(), 10);

    manager.saveCaptureTimeoutMs(1);
    QCOMPARE(manager.loadCaptureTimeoutMs(), 250);

    // Out-of-range values written by other tools are clamped on load
    auto settings = ReceiptCapture::getSettings();
    settings.setValue("scrollCapture/captureTimeoutMs", 999999);
    settings.sync();
    QCOMPARE(manager.loadCaptureTimeoutMs(), 30000);
}

void tst_ScrollCaptureSettingsManager::testMotionDefaults()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    QCOMPARE(manager.loadSmoothingWindow(), 10);
    QCOMPARE(manager.loadStabilityThreshold(), 0.15);
    QCOMPARE(manager.loadExpectedSegments(), 20);
}

void tst_ScrollCaptureSettingsManager::testMotionRoundtrip()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveSmoothingWindow(4);
    manager.saveStabilityThreshold(0.25);
    manager.saveExpectedSegments(35);

    QCOMPARE(manager.loadSmoothingWindow(), 4);
    QCOMPARE(manager.loadStabilityThreshold(), 0.25);
    QCOMPARE(manager.loadExpectedSegments(), 35);
}

void tst_ScrollCaptureSettingsManager::testThresholdClamp()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveStabilityThreshold(-1.0);
    QCOMPARE(manager.loadStabilityThreshold(), 0.01);
    manager.saveStabilityThreshold(3.0);
    QCOMPARE(manager.loadStabilityThreshold(), 1.0);

    manager.saveSmoothingWindow(0);
    QCOMPARE(manager.loadSmoothingWindow(), 1);
    manager.saveExpectedSegments(1000);
    QCOMPARE(manager.loadExpectedSegments(), 200);
}

void tst_ScrollCaptureSettingsManager::testStitchDefaults()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    QCOMPARE(manager.loadOverlapRatio(), 0.38);
    QCOMPARE(manager.loadBlendStripHeight(), 2);
    QCOMPARE(manager.loadMaxOutputPixels(), ScrollCaptureSettingsManager::kDefaultMaxOutputPixels);
}

void tst_ScrollCaptureSettingsManager::testStitchRoundtrip()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveOverlapRatio(0.5);
    manager.saveBlendStripHeight(4);
    manager.saveMaxOutputPixels(50'000'000);

    QCOMPARE(manager.loadOverlapRatio(), 0.5);
    QCOMPARE(manager.loadBlendStripHeight(), 4);
    QCOMPARE(manager.loadMaxOutputPixels(), qint64(50'000'000));
}

void tst_ScrollCaptureSettingsManager::testStitchClamp()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveOverlapRatio(0.0);
    QCOMPARE(manager.loadOverlapRatio(), 0.05);
    manager.saveOverlapRatio(1.0);
    QCOMPARE(manager.loadOverlapRatio(), 0.90);

    manager.saveBlendStripHeight(0);
    QCOMPARE(manager.loadBlendStripHeight(), 1);
    manager.saveBlendStripHeight(500);
    QCOMPARE(manager.loadBlendStripHeight(), 64);

    manager.saveMaxOutputPixels(10);
    QCOMPARE(manager.loadMaxOutputPixels(), qint64(1'000'000));
}

void tst_ScrollCaptureSettingsManager::testFlashModeRoundtrip()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    QCOMPARE(manager.loadFlashMode(), FlashMode::Auto);

    manager.saveFlashMode(FlashMode::Off);
    QCOMPARE(manager.loadFlashMode(), FlashMode::Off);
    manager.saveFlashMode(FlashMode::On);
    QCOMPARE(manager.loadFlashMode(), FlashMode::On);
}

void tst_ScrollCaptureSettingsManager::testFlashModeClampsStoredValue()
{
    auto settings = ReceiptCapture::getSettings();
    settings.setValue("scrollCapture/flashMode", 7);
    settings.sync();

    QCOMPARE(ScrollCaptureSettingsManager::instance().loadFlashMode(), FlashMode::On);
}

void tst_ScrollCaptureSettingsManager::testNormalizeRoundtrip()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    QVERIFY(manager.loadNormalizeMismatchedFrames());

    manager.saveNormalizeMismatchedFrames(false);
    QVERIFY(!manager.loadNormalizeMismatchedFrames());
}

void tst_ScrollCaptureSettingsManager::testLoadConfigAssemblesValues()
{
    auto& manager = ScrollCaptureSettingsManager::instance();
    manager.saveCaptureIntervalMs(300);
    manager.saveOverlapRatio(0.4);
    manager.saveFlashMode(FlashMode::Off);
    manager.saveNormalizeMismatchedFrames(false);

    const ScrollCaptureConfig config = manager.loadConfig();
    QCOMPARE(config.captureIntervalMs, 300);
    QCOMPARE(config.sensorIntervalMs, 50);
    QCOMPARE(config.smoothingWindow, 10);
    QCOMPARE(config.captureTimeoutMs, 3000);
    QCOMPARE(config.stitch.overlapRatio, 0.4);
    QCOMPARE(config.stitch.blendStripHeightPx, 2);
    QCOMPARE(config.flashMode, FlashMode::Off);
    QVERIFY(!config.normalizeMismatchedFrames);
}

QTEST_MAIN(tst_ScrollCaptureSettingsManager)
#include "tst_ScrollCaptureSettingsManager.moc"
