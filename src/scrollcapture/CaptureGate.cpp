#include "scrollcapture/CaptureGate.h"
#include "scrollcapture/SpeedClassifier.h"
#include "capture/ICameraCapture.h"
#include "motion/MotionSampler.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QTimer>

CaptureGate::CaptureGate(MotionSampler *sampler, ICameraCapture *camera, QObject *parent)
    : QObject(parent)
    , m_sampler(sampler)
    , m_camera(camera)
    , m_tickTimer(new QTimer(this))
    , m_timeoutTimer(new QTimer(this))
{
    m_tickTimer->setInterval(m_config.intervalMs);
    connect(m_tickTimer, &QTimer::timeout, this, &CaptureGate::tick);

    m_timeoutTimer->setSingleShot(true);
    connect(m_timeoutTimer, &QTimer::timeout, this, &CaptureGate::onCaptureTimeout);
}

CaptureGate::~CaptureGate()
{
    stop();
}

void CaptureGate::setConfig(const Config &config)
{
    m_config = config;
    m_tickTimer->setInterval(m_config.intervalMs);
}

void CaptureGate::start()
{
    // QTimer::start() on an active timer restarts it, so a second start()
    // never produces a second tick stream.
    m_running = true;
    m_tickCount = 0;
    m_requestCount = 0;
    m_timeoutCount = 0;
    m_currentSpeed = ScrollSpeed::Stationary;
    m_tickTimer->start(m_config.intervalMs);

    qDebug() << "CaptureGate: Started, interval" << m_config.intervalMs << "ms";
}

void CaptureGate::stop()
{
    m_tickTimer->stop();
    m_timeoutTimer->stop();

    if (!m_running) {
        return;
    }
    m_running = false;

    // Invalidate watchers of the outstanding request before releasing the slot
    ++m_requestGeneration;
    if (m_camera && m_camera->isInFlight()) {
        m_camera->abandonPendingCapture();
    }

    qDebug() << "CaptureGate: Stopped after" << m_tickCount << "ticks,"
             << m_requestCount << "requests";
}

bool CaptureGate::captureNow()
{
    if (!m_running) {
        return false;
    }
    return issueCapture();
}

void CaptureGate::tick()
{
    if (!m_running) {
        return;
    }

    ++m_tickCount;
    emit ticked(m_tickCount);

    if (m_sampler && m_sampler->isStable() && m_camera && !m_camera->isInFlight()) {
        issueCapture();
    }

    // Speed guidance refreshes every tick, whether or not a frame was requested
    const double velocity = m_sampler ? m_sampler->velocity() : 0.0;
    m_currentSpeed = SpeedClassifier::classify(velocity);
    emit speedChanged(m_currentSpeed);
}

bool CaptureGate::issueCapture()
{
    if (!m_camera) {
        return false;
    }
    if (m_camera->isInFlight()) {
        qDebug() << "CaptureGate: Camera busy, skipping capture";
        return false;
    }

    // Scroll frames never force the flash on; On falls back to Auto
    const FlashMode flash = m_config.flashMode == FlashMode::Off ? FlashMode::Off : FlashMode::Auto;
    const QFuture<QImage> future = m_camera->requestCapture(flash);
    ++m_requestCount;
    emit captureRequested(m_requestCount);

    if (future.isFinished()) {
        handleCaptureFinished(future);
    } else {
        watchCapture(future);
    }
    return true;
}

void CaptureGate::watchCapture(const QFuture<QImage> &future)
{
    const quint64 generation = m_requestGeneration;

    auto *watcher = new QFutureWatcher<QImage>(this);
    connect(watcher, &QFutureWatcher<QImage>::finished, this, [this, watcher, generation]() {
        const QFuture<QImage> finished = watcher->future();
        watcher->deleteLater();
        if (generation != m_requestGeneration) {
            return;
        }
        handleCaptureFinished(finished);
    });
    watcher->setFuture(future);

    if (m_config.captureTimeoutMs > 0) {
        m_timeoutTimer->start(m_config.captureTimeoutMs);
    }
}

void CaptureGate::handleCaptureFinished(const QFuture<QImage> &future)
{
    m_timeoutTimer->stop();

    if (future.resultCount() == 0) {
        qDebug() << "CaptureGate: Capture finished without a frame";
        emit captureFailed();
        return;
    }

    const QImage frame = future.result();
    if (frame.isNull()) {
        emit captureFailed();
        return;
    }
    emit frameCaptured(frame);
}

void CaptureGate::onCaptureTimeout()
{
    // The frame may have been delivered from another thread after the timer
    // fired; only a request that is still pending counts as timed out.
    if (!m_camera || !m_camera->abandonPendingCapture()) {
        return;
    }

    // The watcher's finished signal is queued, so it still sees this bump
    ++m_requestGeneration;
    ++m_timeoutCount;

    qWarning() << "CaptureGate: Capture timed out after" << m_config.captureTimeoutMs
               << "ms, releasing camera slot";
    emit captureTimedOut();
}
