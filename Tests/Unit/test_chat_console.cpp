#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "core/index/sqlite_store.h"
#include "core/query/rules_engine.h"
#include "services/chat/chat_console.h"

class TestChatConsole : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testInteractiveSessionEndsOnExit();
    void testEndOfInputSaysBye();
    void testDebugShowsScoreDetail();
    void testJsonResponseShape();

private:
    QTemporaryDir* m_dir = nullptr;
    std::optional<rb::SQLiteStore> m_store;
};

void TestChatConsole::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
    m_store = rb::SQLiteStore::open(m_dir->path() + "/chat.db");
    QVERIFY(m_store.has_value());

    auto botId = m_store->addBot(QStringLiteral("cozy-cafe"), QStringLiteral("Cozy Cafe"),
                                 QStringLiteral("Sorry, I'm not sure about that."));
    QVERIFY(botId.has_value());
    QVERIFY(m_store->addQna(*botId, QStringLiteral("Do you have WiFi?"),
                            QStringLiteral("Yes! We have free WiFi."),
                            QStringLiteral("wifi,internet,password,work,laptop"), 9)
                .has_value());
}

void TestChatConsole::cleanup()
{
    m_store.reset();
    delete m_dir;
    m_dir = nullptr;
}

void TestChatConsole::testInteractiveSessionEndsOnExit()
{
    rb::RulesEngine engine(*m_store);
    rb::ChatConsole console(engine, rb::ChatConsoleOptions{});

    QString input = QStringLiteral("  do you have wifi?  \nwhat is the meaning of life\nQUIT\nwifi\n");
    QString output;
    QTextStream in(&input);
    QTextStream out(&output);

    QCOMPARE(console.run(in, out), 0);

    QVERIFY(output.startsWith(QStringLiteral("RuleBot CLI - chatting with bot 'cozy-cafe'")));
    QVERIFY(output.contains(QStringLiteral("> Yes! We have free WiFi.\n")));
    QVERIFY(output.contains(QStringLiteral("> Sorry, I'm not sure about that.\n")));
    QVERIFY(output.endsWith(QStringLiteral("> Bye!\n")));
    QCOMPARE(output.count(QStringLiteral("Yes! We have free WiFi.")), 1);
    QVERIFY(!output.contains(QStringLiteral("[via]")));
}

void TestChatConsole::testEndOfInputSaysBye()
{
    rb::RulesEngine engine(*m_store);
    rb::ChatConsole console(engine, rb::ChatConsoleOptions{});

    QString input = QStringLiteral("wifi");
    QString output;
    QTextStream in(&input);
    QTextStream out(&output);

    QCOMPARE(console.run(in, out), 0);
    QVERIFY(output.contains(QStringLiteral("Yes! We have free WiFi.")));
    QVERIFY(output.endsWith(QStringLiteral("\nBye!\n")));
}

void TestChatConsole::testDebugShowsScoreDetail()
{
    rb::EngineConfig config;
    config.debug = true;
    rb::RulesEngine engine(*m_store, config);

    rb::ChatConsoleOptions options;
    options.showDebug = true;
    rb::ChatConsole console(engine, options);

    QString output;
    QTextStream out(&output);
    console.respond(QStringLiteral("wifi password please"), out);

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines[0], QStringLiteral("Yes! We have free WiFi."));
    QVERIFY(lines[1].startsWith(QStringLiteral("   [via] {")));
    QVERIFY(lines[1].contains(QStringLiteral("\"matched_keywords\":[\"wifi\",\"password\"]")));
}

void TestChatConsole::testJsonResponseShape()
{
    rb::RulesEngine engine(*m_store);
    rb::ChatConsoleOptions options;
    options.json = true;
    rb::ChatConsole console(engine, options);

    QString output;
    QTextStream out(&output);
    console.respond(QStringLiteral("wifi password please"), out);

    const QJsonDocument doc = QJsonDocument::fromJson(output.trimmed().toUtf8());
    QVERIFY(doc.isObject());
    const QJsonObject json = doc.object();
    QCOMPARE(json.value(QStringLiteral("bot")).toString(), QStringLiteral("cozy-cafe"));
    QCOMPARE(json.value(QStringLiteral("message")).toString(),
             QStringLiteral("wifi password please"));
    QVERIFY(json.value(QStringLiteral("matched")).toBool());
    QCOMPARE(json.value(QStringLiteral("answer")).toString(),
             QStringLiteral("Yes! We have free WiFi."));
    QCOMPARE(json.value(QStringLiteral("confidence")).toInt(), 49);
    QVERIFY(!json.contains(QStringLiteral("debug")));
}

QTEST_MAIN(TestChatConsole)
#include "test_chat_console.moc"
