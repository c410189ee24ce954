#ifndef CAPTURESESSION_H
#define CAPTURESESSION_H

#include <QFuture>
#include <QImage>
#include <QObject>
#include <memory>

#include "scrollcapture/FrameBuffer.h"
#include "scrollcapture/ReceiptStitcher.h"
#include "scrollcapture/ScrollCaptureTypes.h"

class CaptureGate;
class ICameraCapture;
class IMotionSensor;
class MotionSampler;

/**
 * @brief Long-receipt scroll capture: lifecycle and wiring
 *
 *   Idle --start()--> Capturing --stop()--> Stitching --> Ready | Empty
 *
 * start() resets the frame buffer, subscribes to motion, starts the gate
 * and immediately requests frame 0 so every session has at least one frame.
 * stop() halts the gate and the sensor synchronously, then resolves the
 * outcome: no frames is Empty, one frame is Ready as-is, two or more are
 * stitched on a worker thread. A failed stitch falls back to the first
 * frame. The session owns its camera and motion sensor.
 */
class CaptureSession : public QObject
{
    Q_OBJECT

public:
    CaptureSession(std::unique_ptr<ICameraCapture> camera,
                   std::unique_ptr<IMotionSensor> sensor,
                   QObject *parent = nullptr);
    ~CaptureSession() override;

    // Starts from the stored ScrollCaptureSettingsManager values.
    // Applied on the next start().
    void setConfig(const ScrollCaptureConfig &config);
    ScrollCaptureConfig config() const { return m_config; }

    ScrollCaptureState state() const { return m_state; }
    bool isActive() const;

    int frameCount() const;
    double progress() const;
    ScrollSpeed currentSpeed() const;
    ScrollCaptureResult result() const { return m_result; }

    MotionSampler *motionSampler() const { return m_sampler.get(); }
    CaptureGate *captureGate() const { return m_gate.get(); }
    ICameraCapture *camera() const { return m_camera.get(); }

public slots:
    void start();
    void stop();
    void retake();
    void accept();
    void cancel();

signals:
    void stateChanged(ScrollCaptureState state);
    void progressChanged(double progress, int frameCount);
    void speedChanged(ScrollSpeed speed);
    void frameRejected(const QString &reason);
    void finished(const ScrollCaptureResult &result);
    void accepted(const QImage &image);

private:
    void setState(ScrollCaptureState newState);
    void applyConfig();
    void haltAcquisition();
    void onFrameCaptured(const QImage &frame);
    void beginStitching();
    void onStitchFinished(const ReceiptStitcher::Result &stitched, const QImage &fallback);
    void finishWithResult(const ScrollCaptureResult &result);

    // Declaration order matters: the sampler and gate hold raw pointers to
    // the camera and sensor and must be destroyed first.
    std::unique_ptr<ICameraCapture> m_camera;
    std::unique_ptr<IMotionSensor> m_sensor;
    std::unique_ptr<MotionSampler> m_sampler;
    std::unique_ptr<CaptureGate> m_gate;

    FrameBuffer m_frameBuffer;
    ScrollCaptureConfig m_config;
    ScrollCaptureState m_state = ScrollCaptureState::Idle;
    ScrollCaptureResult m_result;

    quint64 m_generation = 0;
    QFuture<ReceiptStitcher::Result> m_stitchFuture;
};

#endif // CAPTURESESSION_H
