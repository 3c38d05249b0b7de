module;
#include <QDir>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>
#include <QString>
#include <QtGlobal>

#include <memory>

module corebridge.backend.appsettings;
import corebridge.backend.localstore;

namespace {
std::unique_ptr<QSettings> openSettings(const QString& iniFile)
{
    if (iniFile.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(iniFile, QSettings::IniFormat);
}
}

bool configureLogging(const QString& level)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} "
                                      "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
                                      "%{if-critical}C%{endif}%{if-fatal}F%{endif} "
                                      "[%{category}] %{message}"));

    const QString normalized = level.trimmed().toLower();
    QString rules;
    bool known = true;
    if (normalized == QStringLiteral("debug")) {
        rules = QStringLiteral("corebridge.*.debug=true");
    } else if (normalized == QStringLiteral("warning")) {
        rules = QStringLiteral("corebridge.*.debug=false\ncorebridge.*.info=false");
    } else if (normalized == QStringLiteral("critical")) {
        rules = QStringLiteral("corebridge.*.debug=false\ncorebridge.*.info=false\ncorebridge.*.warning=false");
    } else {
        known = normalized.isEmpty() || normalized == QStringLiteral("info");
        rules = QStringLiteral("corebridge.*.debug=false\ncorebridge.*.info=true");
    }
    QLoggingCategory::setFilterRules(rules);
    return known;
}

AppSettings::AppSettings()
    : m_dataDirectory(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
    , m_logLevel(QStringLiteral("info"))
{
}

void AppSettings::load(const QString& iniFile)
{
    m_iniFile = iniFile;
    const std::unique_ptr<QSettings> settings = openSettings(m_iniFile);
    const AgentCoreServiceOptions defaults;

    const QString directory = settings->value(QStringLiteral("store/dataDirectory")).toString().trimmed();
    if (!directory.isEmpty()) {
        m_dataDirectory = directory;
    }
    m_logLevel = settings->value(QStringLiteral("log/level"), QStringLiteral("info")).toString().trimmed();

    const int port = settings->value(QStringLiteral("agent/defaultPort"), defaults.defaultAgentPort).toInt();
    m_options.defaultAgentPort = (port > 0 && port <= 65535) ? static_cast<quint16>(port) : defaults.defaultAgentPort;
    m_options.timeout.defaultMs = settings->value(QStringLiteral("agent/timeoutMs"), defaults.timeout.defaultMs).toInt();
    m_options.timeout.connectMs =
        settings->value(QStringLiteral("agent/connectTimeoutMs"), defaults.timeout.connectMs).toInt();
    m_options.keepalive.enabled =
        settings->value(QStringLiteral("agent/keepaliveEnabled"), defaults.keepalive.enabled).toBool();
    m_options.keepalive.timeMs =
        settings->value(QStringLiteral("agent/keepaliveTimeMs"), defaults.keepalive.timeMs).toInt();
    m_options.keepalive.timeoutMs =
        settings->value(QStringLiteral("agent/keepaliveTimeoutMs"), defaults.keepalive.timeoutMs).toInt();

    m_options.tls.enabled = settings->value(QStringLiteral("tls/enabled"), false).toBool();
    m_options.tls.caFile = settings->value(QStringLiteral("tls/caFile")).toString().trimmed();
    m_options.tls.certFile = settings->value(QStringLiteral("tls/certFile")).toString().trimmed();
    m_options.tls.keyFile = settings->value(QStringLiteral("tls/keyFile")).toString().trimmed();
    m_options.tls.insecureSkipVerify = settings->value(QStringLiteral("tls/insecureSkipVerify"), false).toBool();

    m_options.listLimitDefault =
        settings->value(QStringLiteral("switch/listLimitDefault"), defaults.listLimitDefault).toInt();
    m_options.listLimitMax = settings->value(QStringLiteral("switch/listLimitMax"), defaults.listLimitMax).toInt();
    if (m_options.listLimitMax <= 0) {
        m_options.listLimitMax = defaults.listLimitMax;
    }
    if (m_options.listLimitDefault <= 0 || m_options.listLimitDefault > m_options.listLimitMax) {
        m_options.listLimitDefault = qMin(defaults.listLimitDefault, m_options.listLimitMax);
    }
}

void AppSettings::save() const
{
    const std::unique_ptr<QSettings> settings = openSettings(m_iniFile);
    settings->setValue(QStringLiteral("store/dataDirectory"), m_dataDirectory);
    settings->setValue(QStringLiteral("log/level"), m_logLevel);
    settings->setValue(QStringLiteral("agent/defaultPort"), m_options.defaultAgentPort);
    settings->setValue(QStringLiteral("agent/timeoutMs"), m_options.timeout.defaultMs);
    settings->setValue(QStringLiteral("agent/connectTimeoutMs"), m_options.timeout.connectMs);
    settings->setValue(QStringLiteral("agent/keepaliveEnabled"), m_options.keepalive.enabled);
    settings->setValue(QStringLiteral("agent/keepaliveTimeMs"), m_options.keepalive.timeMs);
    settings->setValue(QStringLiteral("agent/keepaliveTimeoutMs"), m_options.keepalive.timeoutMs);
    settings->setValue(QStringLiteral("tls/enabled"), m_options.tls.enabled);
    settings->setValue(QStringLiteral("tls/caFile"), m_options.tls.caFile);
    settings->setValue(QStringLiteral("tls/certFile"), m_options.tls.certFile);
    settings->setValue(QStringLiteral("tls/keyFile"), m_options.tls.keyFile);
    settings->setValue(QStringLiteral("tls/insecureSkipVerify"), m_options.tls.insecureSkipVerify);
    settings->setValue(QStringLiteral("switch/listLimitDefault"), m_options.listLimitDefault);
    settings->setValue(QStringLiteral("switch/listLimitMax"), m_options.listLimitMax);
    settings->sync();
}

QString AppSettings::dataDirectory() const
{
    return m_dataDirectory;
}

void AppSettings::setDataDirectory(const QString& directory)
{
    m_dataDirectory = directory;
}

QString AppSettings::storePath() const
{
    return QDir(m_dataDirectory).filePath(LocalStore::defaultFileName());
}

QString AppSettings::logLevel() const
{
    return m_logLevel;
}

void AppSettings::setLogLevel(const QString& level)
{
    m_logLevel = level;
}

const AgentCoreServiceOptions& AppSettings::serviceOptions() const
{
    return m_options;
}

void AppSettings::setServiceOptions(const AgentCoreServiceOptions& options)
{
    m_options = options;
}
