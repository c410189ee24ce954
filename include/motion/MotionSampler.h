#ifndef MOTIONSAMPLER_H
#define MOTIONSAMPLER_H

#include <QObject>
#include <deque>

#include "scrollcapture/ScrollCaptureTypes.h"

class IMotionSensor;

/**
 * @brief Turns raw accelerometer samples into scroll guidance signals
 *
 * The vertical axis is smoothed with a plain moving average over the last
 * N samples. Stability is judged on the current sample only: the phone is
 * stable when neither the lateral nor the depth axis exceeds the threshold.
 *
 * Usage:
 *   sampler.start();           // subscribes to the sensor
 *   ... motionUpdated() fires per sample ...
 *   sampler.stop();            // unsubscribes and clears history
 */
class MotionSampler : public QObject
{
    Q_OBJECT

public:
    struct Config {
        int intervalMs = 50;            // 20 Hz
        int windowSize = 10;            // samples in the moving average
        double stabilityThreshold = 0.15;
        double movingDownThreshold = 0.05;
    };

    explicit MotionSampler(IMotionSensor *sensor, QObject *parent = nullptr);
    ~MotionSampler() override;

    void setConfig(const Config &config);
    Config config() const { return m_config; }

    bool start();
    void stop();
    bool isRunning() const { return m_running; }

    void addSample(const MotionSample &sample);

    SmoothedMotion current() const { return m_current; }
    double velocity() const { return m_current.velocity; }
    bool isStable() const { return m_current.stable; }
    bool isMovingDown() const { return m_current.movingDown; }
    int historySize() const { return static_cast<int>(m_history.size()); }

signals:
    void motionUpdated(const SmoothedMotion &motion);

private:
    IMotionSensor *m_sensor;
    Config m_config;
    std::deque<double> m_history;
    SmoothedMotion m_current;
    bool m_running = false;
};

#endif // MOTIONSAMPLER_H
