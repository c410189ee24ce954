#include "scrollcapture/CaptureSession.h"
#include "scrollcapture/CaptureGate.h"
#include "capture/ICameraCapture.h"
#include "motion/IMotionSensor.h"
#include "motion/MotionSampler.h"
#include "settings/ScrollCaptureSettingsManager.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent>

CaptureSession::CaptureSession(std::unique_ptr<ICameraCapture> camera,
                               std::unique_ptr<IMotionSensor> sensor,
                               QObject *parent)
    : QObject(parent)
    , m_camera(std::move(camera))
    , m_sensor(std::move(sensor))
    , m_sampler(std::make_unique<MotionSampler>(m_sensor.get()))
    , m_gate(std::make_unique<CaptureGate>(m_sampler.get(), m_camera.get()))
    , m_config(ScrollCaptureSettingsManager::instance().loadConfig())
{
    qRegisterMetaType<ScrollCaptureState>("ScrollCaptureState");
    qRegisterMetaType<ScrollSpeed>("ScrollSpeed");
    qRegisterMetaType<ScrollCaptureResult>("ScrollCaptureResult");

    connect(m_gate.get(), &CaptureGate::frameCaptured, this, &CaptureSession::onFrameCaptured);
    connect(m_gate.get(), &CaptureGate::speedChanged, this, &CaptureSession::speedChanged);
    connect(m_gate.get(), &CaptureGate::captureTimedOut, this, []() {
        qWarning() << "CaptureSession: Frame lost to capture timeout";
    });
}

CaptureSession::~CaptureSession()
{
    haltAcquisition();
    ++m_generation;
    if (m_stitchFuture.isRunning()) {
        m_stitchFuture.waitForFinished();
    }
}

void CaptureSession::setConfig(const ScrollCaptureConfig &config)
{
    m_config = config;
}

bool CaptureSession::isActive() const
{
    return m_state == ScrollCaptureState::Capturing || m_state == ScrollCaptureState::Stitching;
}

int CaptureSession::frameCount() const
{
    return m_frameBuffer.count();
}

double CaptureSession::progress() const
{
    return m_frameBuffer.progress();
}

ScrollSpeed CaptureSession::currentSpeed() const
{
    return m_gate->currentSpeed();
}

void CaptureSession::start()
{
    if (isActive()) {
        qDebug() << "CaptureSession: Restarting active session";
    }

    // Timer and sensor must be down before the buffer is reset
    haltAcquisition();
    ++m_generation;

    m_frameBuffer.reset();
    m_result = ScrollCaptureResult();
    applyConfig();

    setState(ScrollCaptureState::Capturing);
    emit progressChanged(0.0, 0);

    m_sampler->start();
    m_gate->start();

    // Frame 0 does not wait for stability
    m_gate->captureNow();
}

void CaptureSession::stop()
{
    if (m_state != ScrollCaptureState::Capturing) {
        qDebug() << "CaptureSession: stop() ignored, not capturing";
        return;
    }

    haltAcquisition();

    const int count = m_frameBuffer.count();
    qDebug() << "CaptureSession: Stopped with" << count << "frames";

    if (count == 0) {
        ScrollCaptureResult result;
        result.outcome = ScrollCaptureResult::Outcome::Empty;
        result.reason = QStringLiteral("Nothing captured");
        finishWithResult(result);
        return;
    }

    if (count == 1) {
        ScrollCaptureResult result;
        result.outcome = ScrollCaptureResult::Outcome::Ready;
        result.image = m_frameBuffer.first();
        result.frameCount = 1;
        finishWithResult(result);
        return;
    }

    beginStitching();
}

void CaptureSession::retake()
{
    qDebug() << "CaptureSession: Retake requested";
    cancel();
    start();
}

void CaptureSession::accept()
{
    if (m_state != ScrollCaptureState::Ready) {
        qWarning() << "CaptureSession: accept() without a ready image";
        return;
    }

    const QImage image = m_result.image;
    m_frameBuffer.reset();
    m_result = ScrollCaptureResult();
    setState(ScrollCaptureState::Idle);
    emit accepted(image);
}

void CaptureSession::cancel()
{
    haltAcquisition();
    ++m_generation;
    m_frameBuffer.reset();
    m_result = ScrollCaptureResult();
    setState(ScrollCaptureState::Idle);
}

void CaptureSession::setState(ScrollCaptureState newState)
{
    if (m_state == newState) {
        return;
    }

    qDebug() << "CaptureSession: State changed from" << static_cast<int>(m_state)
             << "to" << static_cast<int>(newState);
    m_state = newState;
    emit stateChanged(newState);
}

void CaptureSession::applyConfig()
{
    MotionSampler::Config samplerConfig;
    samplerConfig.intervalMs = m_config.sensorIntervalMs;
    samplerConfig.windowSize = m_config.smoothingWindow;
    samplerConfig.stabilityThreshold = m_config.stabilityThreshold;
    m_sampler->setConfig(samplerConfig);

    CaptureGate::Config gateConfig;
    gateConfig.intervalMs = m_config.captureIntervalMs;
    gateConfig.captureTimeoutMs = m_config.captureTimeoutMs;
    gateConfig.flashMode = m_config.flashMode;
    m_gate->setConfig(gateConfig);

    m_frameBuffer.setExpectedSegments(m_config.expectedSegments);
    m_frameBuffer.setNormalizeMismatched(m_config.normalizeMismatchedFrames);
}

void CaptureSession::haltAcquisition()
{
    m_gate->stop();
    m_sampler->stop();
}

void CaptureSession::onFrameCaptured(const QImage &frame)
{
    if (m_state != ScrollCaptureState::Capturing) {
        qDebug() << "CaptureSession: Dropping frame outside capture";
        return;
    }

    const FrameBuffer::AppendResult appended = m_frameBuffer.append(frame);
    if (appended.status == FrameBuffer::AppendStatus::Rejected) {
        emit frameRejected(appended.reason);
        return;
    }

    emit progressChanged(m_frameBuffer.progress(), m_frameBuffer.count());
}

void CaptureSession::beginStitching()
{
    setState(ScrollCaptureState::Stitching);

    const QVector<QImage> frames = m_frameBuffer.images();
    const QImage fallback = frames.first();
    const StitchConfig stitchConfig = m_config.stitch;
    const quint64 generation = m_generation;

    auto *watcher = new QFutureWatcher<ReceiptStitcher::Result>(this);
    connect(watcher, &QFutureWatcher<ReceiptStitcher::Result>::finished, this,
            [this, watcher, generation, fallback]() {
        const ReceiptStitcher::Result stitched = watcher->result();
        watcher->deleteLater();
        if (generation != m_generation) {
            qDebug() << "CaptureSession: Discarding stitch result of a superseded session";
            return;
        }
        onStitchFinished(stitched, fallback);
    });

    m_stitchFuture = QtConcurrent::run([frames, stitchConfig]() {
        ReceiptStitcher stitcher(stitchConfig);
        return stitcher.composite(frames);
    });
    watcher->setFuture(m_stitchFuture);
}

void CaptureSession::onStitchFinished(const ReceiptStitcher::Result &stitched, const QImage &fallback)
{
    ScrollCaptureResult result;
    result.outcome = ScrollCaptureResult::Outcome::Ready;
    result.frameCount = stitched.frameCount;

    if (stitched.outcome == ReceiptStitcher::Outcome::Stitched && !stitched.image.isNull()) {
        result.image = stitched.image;
        result.stitched = true;
    } else {
        qWarning() << "CaptureSession: Stitching failed, using first frame -"
                   << stitched.failureReason;
        result.image = fallback;
        result.usedFallback = true;
        result.reason = stitched.failureReason;
    }

    finishWithResult(result);
}

void CaptureSession::finishWithResult(const ScrollCaptureResult &result)
{
    m_result = result;
    setState(result.outcome == ScrollCaptureResult::Outcome::Empty
        ? ScrollCaptureState::Empty
        : ScrollCaptureState::Ready);
    emit finished(m_result);
}
