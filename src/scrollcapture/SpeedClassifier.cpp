#include "scrollcapture/SpeedClassifier.h"

#include <QCoreApplication>
#include <cmath>

namespace SpeedClassifier {

ScrollSpeed classify(double velocity)
{
    if (!std::isfinite(velocity)) {
        return ScrollSpeed::Stationary;
    }

    const double absVelocity = std::abs(velocity);
    if (absVelocity < kStationaryThreshold) {
        return ScrollSpeed::Stationary;
    }
    if (absVelocity < kSlowThreshold) {
        return ScrollSpeed::TooSlow;
    }
    if (absVelocity > kFastThreshold) {
        return ScrollSpeed::TooFast;
    }
    return ScrollSpeed::Perfect;
}

QString guidanceText(ScrollSpeed speed)
{
    switch (speed) {
    case ScrollSpeed::Stationary:
        return QCoreApplication::translate("SpeedClassifier", "Start moving down");
    case ScrollSpeed::TooSlow:
        return QCoreApplication::translate("SpeedClassifier", "Move a bit faster");
    case ScrollSpeed::Perfect:
        return QCoreApplication::translate("SpeedClassifier", "Perfect speed");
    case ScrollSpeed::TooFast:
        return QCoreApplication::translate("SpeedClassifier", "Slow down");
    }
    return QString();
}

QColor indicatorColor(ScrollSpeed speed)
{
    switch (speed) {
    case ScrollSpeed::Stationary:
        return QColor(Qt::gray);
    case ScrollSpeed::TooSlow:
        return QColor(Qt::yellow);
    case ScrollSpeed::Perfect:
        return QColor(Qt::green);
    case ScrollSpeed::TooFast:
        return QColor(255, 165, 0);
    }
    return QColor();
}

} // namespace SpeedClassifier
