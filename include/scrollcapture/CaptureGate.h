#ifndef CAPTUREGATE_H
#define CAPTUREGATE_H

#include <QFuture>
#include <QImage>
#include <QObject>

#include "scrollcapture/ScrollCaptureTypes.h"

class QTimer;
class ICameraCapture;
class MotionSampler;

/**
 * @brief Periodic, motion-gated capture trigger
 *
 * On every tick the gate requests one frame when the phone is stable and
 * the camera has no capture in flight, and independently refreshes the
 * speed indicator from the latest smoothed velocity. Each request is bounded
 * by a timeout that releases a stuck camera slot so later ticks and stop()
 * are never starved.
 */
class CaptureGate : public QObject
{
    Q_OBJECT

public:
    struct Config {
        int intervalMs = 500;
        int captureTimeoutMs = 3000;
        FlashMode flashMode = FlashMode::Auto;   // On is requested as Auto
    };

    CaptureGate(MotionSampler *sampler, ICameraCapture *camera, QObject *parent = nullptr);
    ~CaptureGate() override;

    void setConfig(const Config &config);
    Config config() const { return m_config; }

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Requests a frame regardless of stability. Still honours the single slot.
    bool captureNow();

    ScrollSpeed currentSpeed() const { return m_currentSpeed; }
    int tickCount() const { return m_tickCount; }
    int requestCount() const { return m_requestCount; }
    int timeoutCount() const { return m_timeoutCount; }

public slots:
    void tick();

signals:
    void ticked(int tickNumber);
    void speedChanged(ScrollSpeed speed);
    void captureRequested(int requestNumber);
    void frameCaptured(const QImage &frame);
    void captureFailed();
    void captureTimedOut();

private slots:
    void onCaptureTimeout();

private:
    bool issueCapture();
    void watchCapture(const QFuture<QImage> &future);
    void handleCaptureFinished(const QFuture<QImage> &future);

    MotionSampler *m_sampler;
    ICameraCapture *m_camera;
    Config m_config;

    QTimer *m_tickTimer;
    QTimer *m_timeoutTimer;

    bool m_running = false;
    quint64 m_requestGeneration = 0;
    ScrollSpeed m_currentSpeed = ScrollSpeed::Stationary;
    int m_tickCount = 0;
    int m_requestCount = 0;
    int m_timeoutCount = 0;
};

#endif // CAPTUREGATE_H
