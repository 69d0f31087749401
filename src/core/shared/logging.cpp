#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rbCore, "rulebot.core", QtInfoMsg)
Q_LOGGING_CATEGORY(rbMatch, "rulebot.match", QtInfoMsg)
Q_LOGGING_CATEGORY(rbStore, "rulebot.store", QtInfoMsg)
Q_LOGGING_CATEGORY(rbCli, "rulebot.cli", QtInfoMsg)

namespace rb {

void setMatchDebugLogging(bool enabled)
{
    QLoggingCategory::setFilterRules(enabled ? QStringLiteral("rulebot.match.debug=true")
                                             : QStringLiteral("rulebot.match.debug=false"));
}

} // namespace rb
