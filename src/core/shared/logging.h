#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rbCore)
Q_DECLARE_LOGGING_CATEGORY(rbMatch)
Q_DECLARE_LOGGING_CATEGORY(rbStore)
Q_DECLARE_LOGGING_CATEGORY(rbCli)

namespace rb {

// Categories default to info and above; this toggles rulebot.match debug
// output (per-candidate scores and match summaries).
void setMatchDebugLogging(bool enabled);

} // namespace rb

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
