#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(crCore)
Q_DECLARE_LOGGING_CATEGORY(crIndex)
Q_DECLARE_LOGGING_CATEGORY(crRetrieval)
Q_DECLARE_LOGGING_CATEGORY(crAnswer)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
