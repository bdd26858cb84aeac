#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugOnlyWithTrace();
    void testCorrelationScope();
    void testRotationKeepsBackups();
    void testConsoleBridgeRecordsMessages();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/snapforge/logs/snapforge-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    snapforge::logging::initLogging(QStringLiteral("snapforge-test"), false);

    snapforge::logging::logEvent(snapforge::logging::LogLevel::Info,
                                 QStringLiteral("snapforge-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 snapforge::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"output", std::string("bad \xff byte")}});

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QVERIFY(parsed.at("context").contains("output"));
}

void LoggingTests::testDebugOnlyWithTrace()
{
    QFile::remove(logPath(QStringLiteral(".log")));
    snapforge::logging::initLogging(QStringLiteral("snapforge-test"), false);

    SFLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugOnlyWithTrace"),
                QStringLiteral("hidden_debug"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                snapforge::logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));

    snapforge::logging::initLogging(QStringLiteral("snapforge-test"), true);
    QVERIFY(snapforge::logging::isTraceEnabled());
    SFLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugOnlyWithTrace"),
                QStringLiteral("visible_debug"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                snapforge::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QFile trace(logPath(QStringLiteral("-trace.log")));
    QVERIFY(trace.open(QIODevice::ReadOnly));
    QVERIFY(trace.readAll().contains("visible_debug"));
    snapforge::logging::initLogging(QStringLiteral("snapforge-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    QCOMPARE(snapforge::logging::currentCorrelationId(), QString());
    {
        snapforge::logging::CorrelationScope outer(QStringLiteral("build-a"));
        QCOMPARE(snapforge::logging::currentCorrelationId(), QStringLiteral("build-a"));
        {
            snapforge::logging::CorrelationScope inner(QStringLiteral("build-b"));
            QCOMPARE(snapforge::logging::currentCorrelationId(), QStringLiteral("build-b"));
        }
        QCOMPARE(snapforge::logging::currentCorrelationId(), QStringLiteral("build-a"));
    }
    QCOMPARE(snapforge::logging::currentCorrelationId(), QString());
}

void LoggingTests::testRotationKeepsBackups()
{
    snapforge::logging::LogConfig config;
    config.processName = QStringLiteral("rotating");
    config.directory = m_tempDir.filePath(QStringLiteral("custom-logs"));
    config.maxFileBytes = 600;
    config.maxBackups = 2;
    snapforge::logging::initLogging(config);
    QCOMPARE(snapforge::logging::logsDirPath(), config.directory);

    for (int i = 0; i < 20; ++i) {
        SFLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testRotationKeepsBackups"),
                   QStringLiteral("fill"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   snapforge::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"i", i}}));
    }

    const QString base = config.directory + QStringLiteral("/rotating.log");
    QVERIFY(QFile::exists(base));
    QVERIFY(QFile::exists(base + QStringLiteral(".1")));
    QVERIFY(QFile::exists(base + QStringLiteral(".2")));
    QVERIFY(!QFile::exists(base + QStringLiteral(".3")));
    QVERIFY(QFileInfo(base).size() <= config.maxFileBytes);

    snapforge::logging::initLogging(QStringLiteral("snapforge-test"), false);
}

void LoggingTests::testConsoleBridgeRecordsMessages()
{
    QFile::remove(logPath(QStringLiteral(".log")));
    snapforge::logging::initLogging(QStringLiteral("snapforge-test"), false);
    snapforge::logging::installConsoleBridge();

    QTest::ignoreMessage(QtWarningMsg, "bridge check");
    qWarning("bridge check");

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("component", "")), QStringLiteral("console"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("WARN"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("message", "")),
             QStringLiteral("bridge check"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
