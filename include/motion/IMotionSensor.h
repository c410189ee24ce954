#ifndef IMOTIONSENSOR_H
#define IMOTIONSENSOR_H

#include <QObject>
#include "scrollcapture/ScrollCaptureTypes.h"

/**
 * @brief Abstract accelerometer source
 *
 * Platform adapters (Core Motion, Android sensor manager, a replay file)
 * implement this interface and emit sampleReady() at the requested rate
 * while active. stop() must take effect immediately: no sample may be
 * emitted after it returns.
 */
class IMotionSensor : public QObject
{
    Q_OBJECT

public:
    explicit IMotionSensor(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~IMotionSensor() = default;

    /**
     * @brief Subscribe to accelerometer updates
     * @param intervalMs Update period in milliseconds
     * @return false if no accelerometer is available
     */
    virtual bool start(int intervalMs) = 0;

    /**
     * @brief Unsubscribe from accelerometer updates
     */
    virtual void stop() = 0;

    virtual bool isActive() const = 0;

signals:
    void sampleReady(const MotionSample &sample);
};

#endif // IMOTIONSENSOR_H
