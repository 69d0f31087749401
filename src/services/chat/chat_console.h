#pragma once

#include "core/query/rules_engine.h"

#include <QJsonObject>
#include <QString>
#include <QTextStream>

namespace rb {

struct ChatConsoleOptions {
    QString botSlug = QStringLiteral("cozy-cafe");
    bool showDebug = false;   // print the winning score detail after each answer
    bool json = false;        // print chat-response JSON instead of plain answers
};

// ChatConsole -- line-oriented chat against one bot.
class ChatConsole {
public:
    ChatConsole(RulesEngine& engine, const ChatConsoleOptions& options);

    // Read messages until "exit"/"quit" (any case) or end of input.
    int run(QTextStream& in, QTextStream& out);

    // Answer a single message.
    void respond(const QString& message, QTextStream& out);

    // {bot, message, matched, answer, confidence}
    static QJsonObject chatResponse(const QString& botSlug, const QString& message,
                                    const MatchResult& result);

private:
    static bool isExitCommand(const QString& line);

    RulesEngine& m_engine;
    ChatConsoleOptions m_options;
};

} // namespace rb
