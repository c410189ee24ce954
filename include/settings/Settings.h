#pragma once

#include <QSettings>
#include <QString>
#include "version.h"

namespace ReceiptCapture {

inline constexpr const char* kOrganizationName = RECEIPTCAPTURE_ORGANIZATION_NAME;
inline constexpr const char* kApplicationName = RECEIPTCAPTURE_APP_NAME;

inline bool isDebugSettingsNamespace()
{
    return QString::fromLatin1(RECEIPTCAPTURE_APP_BUNDLE_ID).endsWith(QStringLiteral(".debug"));
}

inline QString settingsApplicationName()
{
    if (isDebugSettingsNamespace()) {
        return QString::fromLatin1(kApplicationName) + QStringLiteral("-Debug");
    }
    return QString::fromLatin1(kApplicationName);
}

inline QSettings getSettings()
{
    return QSettings(QString::fromLatin1(kOrganizationName), settingsApplicationName());
}

} // namespace ReceiptCapture
