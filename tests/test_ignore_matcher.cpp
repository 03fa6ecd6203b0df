#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include "engine/ignore_matcher.hpp"

class IgnoreMatcherTests : public QObject
{
    Q_OBJECT
private slots:
    void init();

    void testDefaultPatterns();
    void testSegmentAndWholePathMatching();
    void testOverrideFileAddsPatterns();
    void testReloadPicksUpEdits();
    void testPathsOutsideRootAreNotIgnored();

private:
    std::unique_ptr<QTemporaryDir> m_root;
    std::filesystem::path rootPath() const;
    void writeOverride(const std::string &content);
};

void IgnoreMatcherTests::init()
{
    m_root = std::make_unique<QTemporaryDir>();
    QVERIFY(m_root->isValid());
}

std::filesystem::path IgnoreMatcherTests::rootPath() const
{
    return std::filesystem::path(m_root->path().toStdString());
}

void IgnoreMatcherTests::writeOverride(const std::string &content)
{
    std::ofstream out(rootPath() / tidemark::IgnoreMatcher::kOverrideFileName);
    out << content;
}

void IgnoreMatcherTests::testDefaultPatterns()
{
    tidemark::IgnoreMatcher matcher(rootPath());

    QVERIFY(matcher.isIgnoredRelative(".git"));
    QVERIFY(matcher.isIgnoredRelative(".git/objects/ab/cdef"));
    QVERIFY(matcher.isIgnoredRelative("web/node_modules/react/index.js"));
    QVERIFY(matcher.isIgnoredRelative("build/output.tmp"));
    QVERIFY(matcher.isIgnoredRelative("pkg/__pycache__/mod.cpython-311.pyc"));
    QVERIFY(matcher.isIgnoredRelative(".tidemark_backup/a.txt"));

    QVERIFY(!matcher.isIgnoredRelative("src/main.cpp"));
    QVERIFY(!matcher.isIgnoredRelative("notes/git.txt"));
    QVERIFY(!matcher.isIgnoredRelative(""));
}

void IgnoreMatcherTests::testSegmentAndWholePathMatching()
{
    const tidemark::IgnoreRules rules({"build", "docs/*.md", "*.bak"});

    QVERIFY(rules.matches("build/out.o"));
    QVERIFY(rules.matches("sub/build/out.o"));
    QVERIFY(rules.matches("docs/readme.md"));
    // '*' crosses separators when the whole path is matched.
    QVERIFY(rules.matches("docs/api/index.md"));
    QVERIFY(rules.matches("a/b/c.bak"));

    QVERIFY(!rules.matches("builder/out.o"));
    QVERIFY(!rules.matches("readme.md"));
}

void IgnoreMatcherTests::testOverrideFileAddsPatterns()
{
    writeOverride("# local rules\n\n  dist  \n*.cache\n");
    tidemark::IgnoreMatcher matcher(rootPath());

    QVERIFY(matcher.isIgnoredRelative("dist/app.js"));
    QVERIFY(matcher.isIgnoredRelative("data/x.cache"));
    QVERIFY(matcher.isIgnoredRelative(".git/HEAD"));
    QVERIFY(!matcher.isIgnoredRelative("# local rules"));

    const auto patterns = matcher.patterns();
    QCOMPARE(patterns.size(), tidemark::IgnoreMatcher::defaultPatterns().size() + 2);
    QCOMPARE(QString::fromStdString(patterns.back()), QStringLiteral("*.cache"));
}

void IgnoreMatcherTests::testReloadPicksUpEdits()
{
    tidemark::IgnoreMatcher matcher(rootPath());
    QVERIFY(!matcher.isIgnoredRelative("secrets/key.pem"));

    const auto before = matcher.rules();
    writeOverride("secrets\n");
    QVERIFY(!matcher.isIgnoredRelative("secrets/key.pem"));

    matcher.reload();
    QVERIFY(matcher.isIgnoredRelative("secrets/key.pem"));
    // Rules taken before the reload stay unchanged.
    QVERIFY(!before->matches("secrets/key.pem"));
}

void IgnoreMatcherTests::testPathsOutsideRootAreNotIgnored()
{
    tidemark::IgnoreMatcher matcher(rootPath());

    QVERIFY(matcher.isIgnored(rootPath() / ".git" / "config"));
    QVERIFY(!matcher.isIgnored(rootPath() / "src" / "main.cpp"));
    QVERIFY(!matcher.isIgnored(std::filesystem::path("/somewhere/else/.git/config")));
}

QTEST_MAIN(IgnoreMatcherTests)
#include "test_ignore_matcher.moc"
