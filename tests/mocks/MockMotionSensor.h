#ifndef MOCKMOTIONSENSOR_H
#define MOCKMOTIONSENSOR_H

#include "motion/IMotionSensor.h"

class QTimer;

/**
 * @brief Mock accelerometer for testing
 *
 * Samples are pushed by the test, or repeated on a timer at the subscribed
 * interval once setRepeatingSample() is set. Nothing is emitted while the
 * sensor is stopped.
 */
class MockMotionSensor : public IMotionSensor
{
    Q_OBJECT

public:
    explicit MockMotionSensor(QObject *parent = nullptr);
    ~MockMotionSensor() override = default;

    bool start(int intervalMs) override;
    void stop() override;
    bool isActive() const override { return m_active; }

    // ========== Mock Control Methods ==========

    void setAvailable(bool available) { m_available = available; }

    /**
     * @brief Emit one sample (ignored while inactive)
     */
    bool pushSample(const MotionSample &sample);
    bool pushSample(double x, double y, double z);

    /**
     * @brief Emit this sample every interval while active
     */
    void setRepeatingSample(const MotionSample &sample);

    // ========== Spy Methods ==========

    int startCallCount() const { return m_startCalls; }
    int stopCallCount() const { return m_stopCalls; }
    int emittedCount() const { return m_emitted; }
    int lastIntervalMs() const { return m_intervalMs; }

private:
    QTimer *m_repeatTimer;
    MotionSample m_repeatSample;
    bool m_repeat = false;
    bool m_available = true;
    bool m_active = false;
    int m_intervalMs = 0;
    int m_startCalls = 0;
    int m_stopCalls = 0;
    int m_emitted = 0;
    qint64 m_clockMs = 0;
};

#endif // MOCKMOTIONSENSOR_H
