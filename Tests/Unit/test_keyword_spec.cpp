#include <QtTest/QtTest>

#include "core/query/keyword_spec.h"

class TestKeywordSpec : public QObject {
    Q_OBJECT

private slots:
    void testEmptySpec();
    void testPlainPhrasesLowercasedAndTrimmed();
    void testRePrefixIsCaseInsensitiveRegex();
    void testSlashWrappedRegexFlags();
    void testMalformedRegexIsDropped();
    void testSpecOrderPreserved();
    void testSingleSlashIsPhrase();
    void testSingleTokenPhraseNeedsWordBoundary();
    void testMultiTokenPhraseIsSubstring();
    void testAnchoredRegexMatchesWholeText();
};

void TestKeywordSpec::testEmptySpec()
{
    QVERIFY(rb::KeywordSpecParser::parse(QString()).isEmpty());
    QVERIFY(rb::KeywordSpecParser::parse(QStringLiteral(" , ,, ")).isEmpty());
}

void TestKeywordSpec::testPlainPhrasesLowercasedAndTrimmed()
{
    const auto parsed = rb::KeywordSpecParser::parse(QStringLiteral(" WiFi , Free Internet,laptop "));
    QCOMPARE(parsed.phrases(),
             QStringList({QStringLiteral("wifi"), QStringLiteral("free internet"),
                          QStringLiteral("laptop")}));
    QVERIFY(parsed.patterns().isEmpty());
}

void TestKeywordSpec::testRePrefixIsCaseInsensitiveRegex()
{
    const auto parsed = rb::KeywordSpecParser::parse(QStringLiteral("re: ^HOURS?$ "));
    QCOMPARE(parsed.matchers.size(), size_t(1));
    const rb::KeywordMatcher& matcher = parsed.matchers.front();
    QCOMPARE(matcher.kind, rb::KeywordMatcher::Kind::Regex);
    QCOMPARE(matcher.text, QStringLiteral("^HOURS?$"));
    QVERIFY(matcher.matches(QStringLiteral("hours")));
    QVERIFY(matcher.matches(QStringLiteral("hour")));
}

void TestKeywordSpec::testSlashWrappedRegexFlags()
{
    const auto parsed = rb::KeywordSpecParser::parse(
        QStringLiteral("/Open|Close/i,/Open|Close/"));
    QCOMPARE(parsed.patterns(),
             QStringList({QStringLiteral("Open|Close"), QStringLiteral("Open|Close")}));

    const auto& insensitive = parsed.matchers.at(0);
    const auto& sensitive = parsed.matchers.at(1);
    QVERIFY(insensitive.matches(QStringLiteral("when do you open")));
    QVERIFY(!sensitive.matches(QStringLiteral("when do you open")));
    QVERIFY(sensitive.matches(QStringLiteral("Open now")));
}

void TestKeywordSpec::testMalformedRegexIsDropped()
{
    const auto parsed = rb::KeywordSpecParser::parse(
        QStringLiteral("wifi,re:(unclosed,/[abc/,password"));
    QCOMPARE(parsed.phrases(),
             QStringList({QStringLiteral("wifi"), QStringLiteral("password")}));
    QVERIFY(parsed.patterns().isEmpty());
    QCOMPARE(parsed.rejectedPatterns,
             QStringList({QStringLiteral("(unclosed"), QStringLiteral("[abc")}));
}

void TestKeywordSpec::testSpecOrderPreserved()
{
    const auto parsed = rb::KeywordSpecParser::parse(
        QStringLiteral("zeta,re:b+,alpha,/a+/,mid"));
    QCOMPARE(parsed.phrases(),
             QStringList({QStringLiteral("zeta"), QStringLiteral("alpha"), QStringLiteral("mid")}));
    QCOMPARE(parsed.patterns(), QStringList({QStringLiteral("b+"), QStringLiteral("a+")}));
    QCOMPARE(parsed.matchers.at(1).kind, rb::KeywordMatcher::Kind::Regex);
}

void TestKeywordSpec::testSingleSlashIsPhrase()
{
    const auto parsed = rb::KeywordSpecParser::parse(QStringLiteral("/,/usr"));
    QCOMPARE(parsed.phrases(), QStringList({QStringLiteral("/"), QStringLiteral("/usr")}));
}

void TestKeywordSpec::testSingleTokenPhraseNeedsWordBoundary()
{
    QVERIFY(!rb::KeywordSpecParser::phraseInText(QStringLiteral("category"), QStringLiteral("cat")));
    QVERIFY(rb::KeywordSpecParser::phraseInText(QStringLiteral("i have a cat"), QStringLiteral("cat")));
    QVERIFY(rb::KeywordSpecParser::phraseInText(QStringLiteral("cat"), QStringLiteral("cat")));
    QVERIFY(!rb::KeywordSpecParser::phraseInText(QStringLiteral("cats"), QStringLiteral("cat")));
}

void TestKeywordSpec::testMultiTokenPhraseIsSubstring()
{
    QVERIFY(rb::KeywordSpecParser::phraseInText(QStringLiteral("is there free wifi here"),
                                                QStringLiteral("free wifi")));
    // Containment, not word boundaries
    QVERIFY(rb::KeywordSpecParser::phraseInText(QStringLiteral("carefree wifi"),
                                                QStringLiteral("free wifi")));
    QVERIFY(!rb::KeywordSpecParser::phraseInText(QStringLiteral("free the wifi"),
                                                 QStringLiteral("free wifi")));
}

void TestKeywordSpec::testAnchoredRegexMatchesWholeText()
{
    const auto parsed = rb::KeywordSpecParser::parse(QStringLiteral("re:^hours$"));
    QCOMPARE(parsed.matchers.size(), size_t(1));
    const auto& matcher = parsed.matchers.front();
    QVERIFY(matcher.matches(QStringLiteral("hours")));
    QVERIFY(!matcher.matches(QStringLiteral("your hours")));
    QVERIFY(!matcher.matches(QStringLiteral("hours please")));
}

QTEST_MAIN(TestKeywordSpec)
#include "test_keyword_spec.moc"
