#include "motion/MotionSampler.h"
#include "motion/IMotionSensor.h"

#include <QDebug>
#include <cmath>
#include <numeric>

MotionSampler::MotionSampler(IMotionSensor *sensor, QObject *parent)
    : QObject(parent)
    , m_sensor(sensor)
{
    if (m_sensor) {
        connect(m_sensor, &IMotionSensor::sampleReady, this, &MotionSampler::addSample);
    }
}

MotionSampler::~MotionSampler()
{
    stop();
}

void MotionSampler::setConfig(const Config &config)
{
    m_config = config;
    if (m_config.windowSize < 1) {
        m_config.windowSize = 1;
    }
    while (static_cast<int>(m_history.size()) > m_config.windowSize) {
        m_history.pop_front();
    }
}

bool MotionSampler::start()
{
    if (m_running) {
        return true;
    }

    m_history.clear();
    m_current = SmoothedMotion();
    m_running = true;

    // Without an accelerometer the sampler stays "stable" so capture still works
    if (!m_sensor) {
        qWarning() << "MotionSampler: No motion sensor attached";
        return false;
    }
    if (!m_sensor->start(m_config.intervalMs)) {
        qWarning() << "MotionSampler: Motion sensor unavailable";
        return false;
    }

    qDebug() << "MotionSampler: Started at" << m_config.intervalMs << "ms interval";
    return true;
}

void MotionSampler::stop()
{
    if (m_sensor && m_sensor->isActive()) {
        m_sensor->stop();
    }
    m_running = false;
    m_history.clear();
    m_current = SmoothedMotion();
}

void MotionSampler::addSample(const MotionSample &sample)
{
    if (!m_running) {
        return;
    }

    m_history.push_back(sample.y);
    while (static_cast<int>(m_history.size()) > m_config.windowSize) {
        m_history.pop_front();
    }

    const double sum = std::accumulate(m_history.begin(), m_history.end(), 0.0);
    m_current.velocity = sum / static_cast<double>(m_history.size());
    m_current.movingDown = m_current.velocity > m_config.movingDownThreshold;
    m_current.stable = std::abs(sample.x) < m_config.stabilityThreshold
        && std::abs(sample.z) < m_config.stabilityThreshold;

    emit motionUpdated(m_current);
}
