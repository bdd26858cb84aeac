#include <QtTest/QtTest>

#include <string>
#include <vector>

#include "common/semver.hpp"

class SemverTests : public QObject
{
    Q_OBJECT
private slots:
    void testValidVersions();
    void testInvalidVersions();
    void testParsedFields();
    void testPrecedenceChain();
    void testBuildMetadataIgnored();
    void testInvalidOperandsNeverLess();
    void testToolsetBoundary();
};

void SemverTests::testValidVersions()
{
    const char *valid[] = {
        "0.9.0",
        "10.20.30",
        "1.2.3-alpha.1+build.5",
        "1.0.0-x-y-z.--",
        "1.0.0+21AF26D3----117B344092BD",
        "v1.0.0",
        " 1.0.0 ",
    };
    for (const char *value : valid) {
        QVERIFY2(snapforge::isValidVersion(value), value);
    }
}

void SemverTests::testInvalidVersions()
{
    const char *invalid[] = {
        "",
        "latest",
        "1.0",
        "1.0.0.0",
        "01.0.0",
        "1.02.0",
        "1.0.0-",
        "1.0.0+",
        "1.0.0-01",
        "1.0.0-alpha..1",
        "1.0.0-alpha_1",
        "a.b.c",
        "vv1.0.0",
    };
    for (const char *value : invalid) {
        QVERIFY2(!snapforge::isValidVersion(value), value);
    }
}

void SemverTests::testParsedFields()
{
    const auto version = snapforge::parseVersion("v2.11.3-rc.1+sha.5114f85");
    QVERIFY(version.has_value());
    QCOMPARE(version->major, std::uint64_t(2));
    QCOMPARE(version->minor, std::uint64_t(11));
    QCOMPARE(version->patch, std::uint64_t(3));
    QCOMPARE(version->preRelease, (std::vector<std::string>{"rc", "1"}));
    QCOMPARE(version->build, (std::vector<std::string>{"sha", "5114f85"}));
    QCOMPARE(QString::fromStdString(version->toString()),
             QStringLiteral("2.11.3-rc.1+sha.5114f85"));
}

void SemverTests::testPrecedenceChain()
{
    const std::vector<std::string> ordered = {
        "1.0.0-alpha",
        "1.0.0-alpha.1",
        "1.0.0-alpha.beta",
        "1.0.0-beta",
        "1.0.0-beta.2",
        "1.0.0-beta.11",
        "1.0.0-rc.1",
        "1.0.0",
        "1.0.1",
        "1.1.0",
        "1.10.0",
        "2.0.0",
    };

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        QVERIFY(!snapforge::versionLessThan(ordered[i], ordered[i]));
        for (std::size_t j = i + 1; j < ordered.size(); ++j) {
            const QByteArray pair = QByteArray::fromStdString(ordered[i] + " < " + ordered[j]);
            QVERIFY2(snapforge::versionLessThan(ordered[i], ordered[j]), pair.constData());
            QVERIFY2(!snapforge::versionLessThan(ordered[j], ordered[i]), pair.constData());
        }
    }
}

void SemverTests::testBuildMetadataIgnored()
{
    QVERIFY(!snapforge::versionLessThan("1.0.0+a", "1.0.0+b"));
    QVERIFY(!snapforge::versionLessThan("1.0.0+b", "1.0.0+a"));

    const auto a = snapforge::parseVersion("1.0.0+a");
    const auto b = snapforge::parseVersion("1.0.0+b");
    QVERIFY(a && b);
    QCOMPARE(snapforge::compareVersions(*a, *b), 0);
}

void SemverTests::testInvalidOperandsNeverLess()
{
    QVERIFY(!snapforge::versionLessThan("latest", "0.9.0"));
    QVERIFY(!snapforge::versionLessThan("0.9.0", "latest"));
    QVERIFY(!snapforge::versionLessThan("", ""));
}

void SemverTests::testToolsetBoundary()
{
    QVERIFY(snapforge::versionLessThan("0.8.9", "0.9.0"));
    QVERIFY(snapforge::versionLessThan("0.9.0-rc.1", "0.9.0"));
    QVERIFY(!snapforge::versionLessThan("0.9.0", "0.9.0"));
    QVERIFY(!snapforge::versionLessThan("0.12.0", "0.9.0"));
}

QTEST_MAIN(SemverTests)
#include "test_semver.moc"
