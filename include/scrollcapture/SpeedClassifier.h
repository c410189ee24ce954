#ifndef SPEEDCLASSIFIER_H
#define SPEEDCLASSIFIER_H

#include <QColor>
#include <QString>

#include "scrollcapture/ScrollCaptureTypes.h"

// Maps smoothed vertical velocity (g) to scroll guidance.
//
//   |v| <  0.02          Stationary
//   0.02 <= |v| < 0.08   TooSlow
//   0.08 <= |v| <= 0.30  Perfect
//   |v| >  0.30          TooFast

namespace SpeedClassifier {

inline constexpr double kStationaryThreshold = 0.02;
inline constexpr double kSlowThreshold = 0.08;
inline constexpr double kFastThreshold = 0.30;

ScrollSpeed classify(double velocity);

// Short hint shown next to the speed indicator.
QString guidanceText(ScrollSpeed speed);
QColor indicatorColor(ScrollSpeed speed);

} // namespace SpeedClassifier

#endif // SPEEDCLASSIFIER_H
