#include <QDir>
#include <QSettings>
#include <QTemporaryDir>
#include <QtTest>

#ifndef Q_MOC_RUN
import corebridge.backend.appsettings;
#endif

class TestAppSettings : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWithoutFile();
    void roundTripsThroughIni();
    void clampsListLimits_data();
    void clampsListLimits();
    void rejectsOutOfRangePort();
    void configuresLogging_data();
    void configuresLogging();
};

void TestAppSettings::defaultsWithoutFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    AppSettings settings;
    settings.load(dir.filePath(QStringLiteral("missing.ini")));
    QCOMPARE(settings.logLevel(), QStringLiteral("info"));
    QCOMPARE(settings.serviceOptions().defaultAgentPort, quint16(19090));
    QCOMPARE(settings.serviceOptions().listLimitDefault, 50);
    QCOMPARE(settings.serviceOptions().listLimitMax, 200);
    QVERIFY(!settings.serviceOptions().tls.enabled);
    QVERIFY(settings.storePath().endsWith(QStringLiteral("corebridge-store.json")));
}

void TestAppSettings::roundTripsThroughIni()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString iniFile = dir.filePath(QStringLiteral("corebridge.ini"));

    AppSettings settings;
    settings.load(iniFile);
    settings.setDataDirectory(dir.filePath(QStringLiteral("data")));
    settings.setLogLevel(QStringLiteral("debug"));
    AgentCoreServiceOptions options = settings.serviceOptions();
    options.defaultAgentPort = 7000;
    options.timeout.defaultMs = 1500;
    options.tls.enabled = true;
    options.tls.caFile = QStringLiteral("/etc/corebridge/ca.pem");
    options.listLimitDefault = 20;
    options.listLimitMax = 100;
    settings.setServiceOptions(options);
    settings.save();

    AppSettings reloaded;
    reloaded.load(iniFile);
    QCOMPARE(reloaded.dataDirectory(), dir.filePath(QStringLiteral("data")));
    QCOMPARE(reloaded.storePath(), QDir(dir.filePath(QStringLiteral("data"))).filePath(QStringLiteral("corebridge-store.json")));
    QCOMPARE(reloaded.logLevel(), QStringLiteral("debug"));
    QCOMPARE(reloaded.serviceOptions().defaultAgentPort, quint16(7000));
    QCOMPARE(reloaded.serviceOptions().timeout.defaultMs, 1500);
    QVERIFY(reloaded.serviceOptions().tls.enabled);
    QCOMPARE(reloaded.serviceOptions().tls.caFile, QStringLiteral("/etc/corebridge/ca.pem"));
    QCOMPARE(reloaded.serviceOptions().listLimitDefault, 20);
    QCOMPARE(reloaded.serviceOptions().listLimitMax, 100);
}

void TestAppSettings::clampsListLimits_data()
{
    QTest::addColumn<int>("configuredDefault");
    QTest::addColumn<int>("configuredMax");
    QTest::addColumn<int>("expectedDefault");
    QTest::addColumn<int>("expectedMax");

    QTest::newRow("valid") << 10 << 40 << 10 << 40;
    QTest::newRow("default above max") << 80 << 40 << 40 << 40;
    QTest::newRow("non-positive max") << 10 << 0 << 10 << 200;
    QTest::newRow("non-positive default") << -5 << 300 << 50 << 300;
}

void TestAppSettings::clampsListLimits()
{
    QFETCH(int, configuredDefault);
    QFETCH(int, configuredMax);
    QFETCH(int, expectedDefault);
    QFETCH(int, expectedMax);

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString iniFile = dir.filePath(QStringLiteral("limits.ini"));
    {
        QSettings ini(iniFile, QSettings::IniFormat);
        ini.setValue(QStringLiteral("switch/listLimitDefault"), configuredDefault);
        ini.setValue(QStringLiteral("switch/listLimitMax"), configuredMax);
    }

    AppSettings settings;
    settings.load(iniFile);
    QCOMPARE(settings.serviceOptions().listLimitDefault, expectedDefault);
    QCOMPARE(settings.serviceOptions().listLimitMax, expectedMax);
}

void TestAppSettings::rejectsOutOfRangePort()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString iniFile = dir.filePath(QStringLiteral("port.ini"));
    {
        QSettings ini(iniFile, QSettings::IniFormat);
        ini.setValue(QStringLiteral("agent/defaultPort"), 70000);
    }

    AppSettings settings;
    settings.load(iniFile);
    QCOMPARE(settings.serviceOptions().defaultAgentPort, quint16(19090));
}

void TestAppSettings::configuresLogging_data()
{
    QTest::addColumn<QString>("level");
    QTest::addColumn<bool>("known");

    QTest::newRow("debug") << QStringLiteral("debug") << true;
    QTest::newRow("info upper") << QStringLiteral(" INFO ") << true;
    QTest::newRow("warning") << QStringLiteral("warning") << true;
    QTest::newRow("critical") << QStringLiteral("critical") << true;
    QTest::newRow("empty") << QString() << true;
    QTest::newRow("unknown") << QStringLiteral("verbose") << false;
}

void TestAppSettings::configuresLogging()
{
    QFETCH(QString, level);
    QFETCH(bool, known);
    QCOMPARE(configureLogging(level), known);
}

QTEST_GUILESS_MAIN(TestAppSettings)
#include "tst_appsettings.moc"
