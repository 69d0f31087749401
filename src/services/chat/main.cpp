#include "chat_console.h"
#include "core/index/sqlite_store.h"
#include "core/query/rules_engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("rulebot-cli"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("RuleBot CLI tester"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption botOption({QStringLiteral("b"), QStringLiteral("bot")},
                                       QStringLiteral("Bot slug to chat with."),
                                       QStringLiteral("slug"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("Path to the rulebot database."),
                                      QStringLiteral("path"));
    const QCommandLineOption messageOption({QStringLiteral("m"), QStringLiteral("message")},
                                           QStringLiteral("Answer one message and exit."),
                                           QStringLiteral("text"));
    const QCommandLineOption jsonOption(QStringLiteral("json"),
                                        QStringLiteral("Print chat responses as JSON."));
    const QCommandLineOption debugOption(QStringLiteral("debug"),
                                         QStringLiteral("Show scoring details."));
    parser.addOptions({botOption, dbOption, messageOption, jsonOption, debugOption});
    parser.process(app);

    // Environment is read exactly once, here.
    rb::Settings settings = rb::SettingsManager::load().value_or(rb::Settings{});
    settings = rb::SettingsManager::applyEnvironment(settings);
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (parser.isSet(debugOption)) {
        settings.debug = true;
    }
    rb::setMatchDebugLogging(settings.debug);

    QDir().mkpath(QFileInfo(settings.dbPath).absolutePath());
    auto store = rb::SQLiteStore::open(settings.dbPath);
    if (!store) {
        LOG_ERROR(rbCli, "Cannot open database at %s", qUtf8Printable(settings.dbPath));
        return 1;
    }

    rb::RulesEngine engine(*store, rb::EngineConfig::fromSettings(settings));

    rb::ChatConsoleOptions options;
    options.botSlug = parser.isSet(botOption) ? parser.value(botOption)
                                              : settings.defaultBotSlug;
    options.showDebug = settings.debug;
    options.json = parser.isSet(jsonOption);

    rb::ChatConsole console(engine, options);
    QTextStream out(stdout);
    if (parser.isSet(messageOption)) {
        console.respond(parser.value(messageOption), out);
        return 0;
    }

    QTextStream in(stdin);
    return console.run(in, out);
}
