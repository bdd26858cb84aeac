#include <QtTest/QtTest>

#include <cstdint>
#include <optional>
#include <string>

#include "common/byte_size.hpp"

class ByteSizeTests : public QObject
{
    Q_OBJECT
private slots:
    void testParsesSizes_data();
    void testParsesSizes();
    void testRejectsMalformed_data();
    void testRejectsMalformed();
    void testRejectsOverflow();
    void testFormatUsesLargestExactUnit();
    void testFormatRoundTrips();
};

void ByteSizeTests::testParsesSizes_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<quint64>("expected");

    QTest::newRow("plain") << QStringLiteral("4096") << quint64(4096);
    QTest::newRow("zero") << QStringLiteral("0") << quint64(0);
    QTest::newRow("bytes suffix") << QStringLiteral("10B") << quint64(10);
    QTest::newRow("decimal kilo") << QStringLiteral("1k") << quint64(1000);
    QTest::newRow("decimal kilo upper") << QStringLiteral("1K") << quint64(1000);
    QTest::newRow("decimal giga") << QStringLiteral("1G") << quint64(1000000000);
    QTest::newRow("binary kibi") << QStringLiteral("2Ki") << quint64(2048);
    QTest::newRow("binary mebi") << QStringLiteral("128Mi") << quint64(134217728);
    QTest::newRow("binary mebi 256") << QStringLiteral("256Mi") << quint64(268435456);
    QTest::newRow("binary with B") << QStringLiteral("3GiB") << quint64(3221225472ULL);
    QTest::newRow("lowercase b is binary") << QStringLiteral("10Mb") << quint64(10485760);
    QTest::newRow("20Mb") << QStringLiteral("20Mb") << quint64(20971520);
    QTest::newRow("uppercase MB is binary") << QStringLiteral("1MB") << quint64(1048576);
    QTest::newRow("kb") << QStringLiteral("1kb") << quint64(1024);
    QTest::newRow("fraction") << QStringLiteral("1.5Mi") << quint64(1572864);
    QTest::newRow("fraction floors") << QStringLiteral("1.0001k") << quint64(1000);
    QTest::newRow("fraction decimal") << QStringLiteral("1.5k") << quint64(1500);
    QTest::newRow("surrounding space") << QStringLiteral("  64Ki ") << quint64(65536);
    QTest::newRow("space before unit") << QStringLiteral("3 GiB") << quint64(3221225472ULL);
}

void ByteSizeTests::testParsesSizes()
{
    QFETCH(QString, input);
    QFETCH(quint64, expected);

    const auto parsed = snapforge::parseByteSize(input.toStdString());
    QVERIFY2(parsed.has_value(), qPrintable(input));
    QCOMPARE(quint64(*parsed), expected);
}

void ByteSizeTests::testRejectsMalformed_data()
{
    QTest::addColumn<QString>("input");

    QTest::newRow("empty") << QString();
    QTest::newRow("blank") << QStringLiteral("   ");
    QTest::newRow("unknown unit") << QStringLiteral("12XB");
    QTest::newRow("unit only") << QStringLiteral("Mi");
    QTest::newRow("negative") << QStringLiteral("-5Mi");
    QTest::newRow("explicit plus") << QStringLiteral("+5Mi");
    QTest::newRow("leading dot") << QStringLiteral(".5Mi");
    QTest::newRow("trailing dot") << QStringLiteral("5.Mi");
    QTest::newRow("repeated unit") << QStringLiteral("5 Mi Mi");
    QTest::newRow("exponent") << QStringLiteral("1e3");
    QTest::newRow("hex") << QStringLiteral("0x10");
    QTest::newRow("words") << QStringLiteral("lots");
}

void ByteSizeTests::testRejectsMalformed()
{
    QFETCH(QString, input);
    QVERIFY2(!snapforge::parseByteSize(input.toStdString()).has_value(), qPrintable(input));
}

void ByteSizeTests::testRejectsOverflow()
{
    QVERIFY(!snapforge::parseByteSize("99999999999999999999").has_value());
    QVERIFY(!snapforge::parseByteSize("16384Pi").has_value());
    QVERIFY(!snapforge::parseByteSize("17179869184Gi").has_value());

    const auto largest = snapforge::parseByteSize("16383Pi");
    QVERIFY(largest.has_value());
    QCOMPARE(quint64(*largest), quint64(16383ULL << 50));
}

void ByteSizeTests::testFormatUsesLargestExactUnit()
{
    QCOMPARE(QString::fromStdString(snapforge::formatByteSize(0)), QStringLiteral("0"));
    QCOMPARE(QString::fromStdString(snapforge::formatByteSize(4096)), QStringLiteral("4Ki"));
    QCOMPARE(QString::fromStdString(snapforge::formatByteSize(268435456)),
             QStringLiteral("256Mi"));
    QCOMPARE(QString::fromStdString(snapforge::formatByteSize(1536)), QStringLiteral("1536"));
    QCOMPARE(QString::fromStdString(snapforge::formatByteSize(1000)), QStringLiteral("1000"));
}

void ByteSizeTests::testFormatRoundTrips()
{
    const char *inputs[] = {"128Mi", "10Mb", "1k", "3GiB", "1.5Mi", "7", "2Ti", "1.0001k"};
    for (const char *input : inputs) {
        const auto parsed = snapforge::parseByteSize(input);
        QVERIFY2(parsed.has_value(), input);
        const auto reparsed = snapforge::parseByteSize(snapforge::formatByteSize(*parsed));
        QVERIFY2(reparsed.has_value(), input);
        QCOMPARE(quint64(*reparsed), quint64(*parsed));
    }
}

QTEST_MAIN(ByteSizeTests)
#include "test_byte_size.moc"
