#include "chat_console.h"
#include "core/shared/logging.h"

#include <QJsonDocument>

namespace rb {

ChatConsole::ChatConsole(RulesEngine& engine, const ChatConsoleOptions& options)
    : m_engine(engine)
    , m_options(options)
{
}

bool ChatConsole::isExitCommand(const QString& line)
{
    const QString lowered = line.toLower();
    return lowered == QLatin1String("exit") || lowered == QLatin1String("quit");
}

QJsonObject ChatConsole::chatResponse(const QString& botSlug, const QString& message,
                                      const MatchResult& result)
{
    QJsonObject json;
    json[QStringLiteral("bot")] = botSlug;
    json[QStringLiteral("message")] = message;
    json[QStringLiteral("matched")] = result.matched;
    json[QStringLiteral("answer")] = result.answer;
    json[QStringLiteral("confidence")] = result.confidence;
    return json;
}

void ChatConsole::respond(const QString& message, QTextStream& out)
{
    const MatchResult result = m_engine.matchRule(m_options.botSlug, message);

    if (m_options.json) {
        QJsonObject response = chatResponse(m_options.botSlug, message, result);
        if (m_options.showDebug && result.debug.has_value()) {
            response[QStringLiteral("debug")] = result.debug->toJson();
        }
        out << QJsonDocument(response).toJson(QJsonDocument::Compact) << '\n';
    } else {
        out << result.answer << '\n';
        if (m_options.showDebug && result.debug.has_value()) {
            out << "   [via] "
                << QJsonDocument(result.debug->toJson()).toJson(QJsonDocument::Compact)
                << '\n';
        }
    }
    out.flush();
}

int ChatConsole::run(QTextStream& in, QTextStream& out)
{
    out << "RuleBot CLI - chatting with bot '" << m_options.botSlug
        << "'. Type 'exit' to quit.\n";
    if (m_options.showDebug) {
        out << "DEBUG mode is ON - showing scoring details.\n\n";
    }

    while (true) {
        out << "> ";
        out.flush();

        QString line;
        if (!in.readLineInto(&line)) {
            out << "\nBye!\n";
            break;
        }

        const QString message = line.trimmed();
        if (isExitCommand(message)) {
            out << "Bye!\n";
            break;
        }
        respond(message, out);
    }

    out.flush();
    LOG_DEBUG(rbCli, "chat session with '%s' ended", qUtf8Printable(m_options.botSlug));
    return 0;
}

} // namespace rb
