#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(pmCore)
Q_DECLARE_LOGGING_CATEGORY(pmStore)
Q_DECLARE_LOGGING_CATEGORY(pmMatch)
Q_DECLARE_LOGGING_CATEGORY(pmFeedback)
Q_DECLARE_LOGGING_CATEGORY(pmIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
