module;
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QSaveFile>
#include <QString>

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>

module corebridge.backend.localstore;

namespace {
Q_LOGGING_CATEGORY(lcStore, "corebridge.store")

qsizetype findInstance(const QList<AgentCoreInstance>& instances, qint64 hostId, const QString& instanceId)
{
    for (qsizetype i = 0; i < instances.size(); ++i) {
        if (instances.at(i).agentHostId == hostId && instances.at(i).instanceId == instanceId) {
            return i;
        }
    }
    return -1;
}

qsizetype findSwitchLog(const QList<AgentCoreSwitchLog>& logs, qint64 id)
{
    for (qsizetype i = 0; i < logs.size(); ++i) {
        if (logs.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

template <typename T>
QJsonArray toJsonArrayOf(const QList<T>& values)
{
    QJsonArray array;
    for (const T& value : values) {
        array.append(value.toJson());
    }
    return array;
}
}

class LocalStore::HostRepository final : public AgentHostRepository
{
public:
    explicit HostRepository(LocalStore& store)
        : m_store(store)
    {
    }

    std::optional<AgentHost> findById(qint64 id, PipelineError *error) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const auto it = m_store.m_data.hosts.constFind(id);
        if (it == m_store.m_data.hosts.constEnd()) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Agent host %1 not found").arg(id));
            return std::nullopt;
        }
        return it.value();
    }

    bool setConfigTemplate(qint64 hostId, std::optional<qint64> templateId, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        if (!m_store.m_data.hosts.contains(hostId)) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Agent host %1 not found").arg(hostId));
            return false;
        }
        Data next = m_store.m_data;
        next.hosts[hostId].configTemplateId = templateId;
        return m_store.commit(next, error);
    }

private:
    LocalStore& m_store;
};

class LocalStore::TemplateRepository final : public ConfigTemplateRepository
{
public:
    explicit TemplateRepository(LocalStore& store)
        : m_store(store)
    {
    }

    std::optional<ConfigTemplate> create(const ConfigTemplate& tmpl, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        Data next = m_store.m_data;
        ConfigTemplate stored = tmpl;
        stored.id = next.nextTemplateId++;
        const QDateTime now = QDateTime::currentDateTimeUtc();
        stored.createdAt = stored.createdAt.isValid() ? stored.createdAt : now;
        stored.updatedAt = stored.createdAt;
        next.templates.insert(stored.id, stored);
        if (!m_store.commit(next, error)) {
            return std::nullopt;
        }
        return stored;
    }

    bool update(const ConfigTemplate& tmpl, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const auto it = m_store.m_data.templates.constFind(tmpl.id);
        if (it == m_store.m_data.templates.constEnd()) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Config template %1 not found").arg(tmpl.id));
            return false;
        }
        Data next = m_store.m_data;
        ConfigTemplate stored = tmpl;
        stored.createdAt = it->createdAt;
        stored.updatedAt = QDateTime::currentDateTimeUtc();
        next.templates.insert(stored.id, stored);
        return m_store.commit(next, error);
    }

    bool remove(qint64 id, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        if (!m_store.m_data.templates.contains(id)) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Config template %1 not found").arg(id));
            return false;
        }
        Data next = m_store.m_data;
        next.templates.remove(id);
        for (AgentHost& host : next.hosts) {
            if (host.configTemplateId == id) {
                host.configTemplateId.reset();
            }
        }
        return m_store.commit(next, error);
    }

    std::optional<ConfigTemplate> findById(qint64 id, PipelineError *error) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const auto it = m_store.m_data.templates.constFind(id);
        if (it == m_store.m_data.templates.constEnd()) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Config template %1 not found").arg(id));
            return std::nullopt;
        }
        return it.value();
    }

    QList<ConfigTemplate> list() const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        QList<ConfigTemplate> templates = m_store.m_data.templates.values();
        std::sort(templates.begin(), templates.end(), [](const ConfigTemplate& left, const ConfigTemplate& right) {
            return left.id < right.id;
        });
        return templates;
    }

private:
    LocalStore& m_store;
};

class LocalStore::InstanceRepository final : public AgentCoreInstanceRepository
{
public:
    explicit InstanceRepository(LocalStore& store)
        : m_store(store)
    {
    }

    bool create(const AgentCoreInstance& instance, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        if (findInstance(m_store.m_data.instances, instance.agentHostId, instance.instanceId) >= 0) {
            setError(error, ErrorCode::Conflict,
                     QStringLiteral("Instance '%1' already exists on agent host %2").arg(instance.instanceId).arg(instance.agentHostId));
            return false;
        }
        Data next = m_store.m_data;
        AgentCoreInstance stored = instance;
        const QDateTime now = QDateTime::currentDateTimeUtc();
        stored.createdAt = stored.createdAt.isValid() ? stored.createdAt : now;
        stored.updatedAt = stored.updatedAt.isValid() ? stored.updatedAt : stored.createdAt;
        next.instances.append(stored);
        return m_store.commit(next, error);
    }

    std::optional<AgentCoreInstance> findByHostAndInstance(qint64 hostId,
                                                           const QString& instanceId,
                                                           PipelineError *error) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const qsizetype index = findInstance(m_store.m_data.instances, hostId, instanceId);
        if (index < 0) {
            setError(error, ErrorCode::NotFound,
                     QStringLiteral("Instance '%1' not found on agent host %2").arg(instanceId).arg(hostId));
            return std::nullopt;
        }
        return m_store.m_data.instances.at(index);
    }

    QList<AgentCoreInstance> listByHost(qint64 hostId) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        QList<AgentCoreInstance> result;
        for (const AgentCoreInstance& instance : m_store.m_data.instances) {
            if (instance.agentHostId == hostId) {
                result.append(instance);
            }
        }
        return result;
    }

    bool updateStatus(qint64 hostId,
                      const QString& instanceId,
                      InstanceStatus status,
                      const QString& errorMessage,
                      PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const qsizetype index = findInstance(m_store.m_data.instances, hostId, instanceId);
        if (index < 0) {
            setError(error, ErrorCode::NotFound,
                     QStringLiteral("Instance '%1' not found on agent host %2").arg(instanceId).arg(hostId));
            return false;
        }
        Data next = m_store.m_data;
        AgentCoreInstance& instance = next.instances[index];
        instance.status = status;
        instance.errorMessage = errorMessage;
        instance.updatedAt = QDateTime::currentDateTimeUtc();
        return m_store.commit(next, error);
    }

    bool remove(qint64 hostId, const QString& instanceId, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const qsizetype index = findInstance(m_store.m_data.instances, hostId, instanceId);
        if (index < 0) {
            setError(error, ErrorCode::NotFound,
                     QStringLiteral("Instance '%1' not found on agent host %2").arg(instanceId).arg(hostId));
            return false;
        }
        Data next = m_store.m_data;
        next.instances.removeAt(index);
        return m_store.commit(next, error);
    }

private:
    LocalStore& m_store;
};

class LocalStore::SwitchLogRepository final : public AgentCoreSwitchLogRepository
{
public:
    explicit SwitchLogRepository(LocalStore& store)
        : m_store(store)
    {
    }

    std::optional<qint64> create(const AgentCoreSwitchLog& log, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        Data next = m_store.m_data;
        AgentCoreSwitchLog stored = log;
        stored.id = next.nextSwitchLogId++;
        if (!stored.createdAt.isValid()) {
            stored.createdAt = QDateTime::currentDateTimeUtc();
        }
        next.switchLogs.append(stored);
        if (!m_store.commit(next, error)) {
            return std::nullopt;
        }
        return stored.id;
    }

    bool updateStatus(qint64 id, const SwitchLogUpdate& update, PipelineError *error) override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const qsizetype index = findSwitchLog(m_store.m_data.switchLogs, id);
        if (index < 0) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Switch log %1 not found").arg(id));
            return false;
        }

        const AgentCoreSwitchLog& current = m_store.m_data.switchLogs.at(index);
        if (isTerminalStatus(current.status)) {
            setError(error, ErrorCode::Conflict,
                     QStringLiteral("Switch log %1 is already %2").arg(id).arg(switchStatusName(current.status)));
            return false;
        }

        Data next = m_store.m_data;
        AgentCoreSwitchLog& log = next.switchLogs[index];
        log.status = update.status;
        log.message = update.message;
        if (!update.toInstanceId.isEmpty()) {
            log.toInstanceId = update.toInstanceId;
        }
        if (isTerminalStatus(update.status)) {
            log.completedAt = update.completedAt.value_or(QDateTime::currentDateTimeUtc());
        }
        return m_store.commit(next, error);
    }

    std::optional<AgentCoreSwitchLog> findById(qint64 id, PipelineError *error) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        const qsizetype index = findSwitchLog(m_store.m_data.switchLogs, id);
        if (index < 0) {
            setError(error, ErrorCode::NotFound, QStringLiteral("Switch log %1 not found").arg(id));
            return std::nullopt;
        }
        return m_store.m_data.switchLogs.at(index);
    }

    SwitchLogPage list(const SwitchLogFilter& filter) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        QList<AgentCoreSwitchLog> matching;
        for (const AgentCoreSwitchLog& log : m_store.m_data.switchLogs) {
            if (filter.agentHostId.has_value() && log.agentHostId != filter.agentHostId.value()) {
                continue;
            }
            if (filter.status.has_value() && log.status != filter.status.value()) {
                continue;
            }
            if (filter.start.has_value() && log.createdAt < filter.start.value()) {
                continue;
            }
            if (filter.end.has_value() && log.createdAt > filter.end.value()) {
                continue;
            }
            matching.append(log);
        }

        std::sort(matching.begin(), matching.end(), [](const AgentCoreSwitchLog& left, const AgentCoreSwitchLog& right) {
            if (left.createdAt != right.createdAt) {
                return left.createdAt > right.createdAt;
            }
            return left.id > right.id;
        });

        SwitchLogPage page;
        page.total = matching.size();
        const qsizetype offset = qMax(0, filter.offset);
        const qsizetype limit = qMax(0, filter.limit);
        page.rows = matching.mid(offset, limit);
        return page;
    }

private:
    LocalStore& m_store;
};

class LocalStore::Inventory final : public NodeInventory
{
public:
    explicit Inventory(LocalStore& store)
        : m_store(store)
    {
    }

    QList<Inbound> inboundsForHost(qint64 hostId) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        return m_store.m_data.inbounds.value(hostId);
    }

    QList<UserConfig> usersForHost(qint64 hostId) const override
    {
        QMutexLocker locker(&m_store.m_mutex);
        return m_store.m_data.users.value(hostId);
    }

private:
    LocalStore& m_store;
};

LocalStore::LocalStore(const QString& path)
    : m_path(path)
    , m_hostRepository(std::make_unique<HostRepository>(*this))
    , m_templateRepository(std::make_unique<TemplateRepository>(*this))
    , m_instanceRepository(std::make_unique<InstanceRepository>(*this))
    , m_switchLogRepository(std::make_unique<SwitchLogRepository>(*this))
    , m_inventory(std::make_unique<Inventory>(*this))
{
}

LocalStore::~LocalStore() = default;

QString LocalStore::defaultFileName()
{
    return QStringLiteral("corebridge-store.json");
}

QString LocalStore::path() const
{
    return m_path;
}

bool LocalStore::load(PipelineError *error)
{
    QMutexLocker locker(&m_mutex);
    if (m_path.isEmpty()) {
        return true;
    }

    QFile file(m_path);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, ErrorCode::Storage, QStringLiteral("Failed to open store file: %1").arg(m_path));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(error, ErrorCode::Storage,
                 QStringLiteral("Store file %1 is corrupt: %2").arg(m_path, parseError.errorString()));
        return false;
    }

    m_data = fromJson(doc.object());
    qCDebug(lcStore) << "Loaded store" << m_path << "hosts:" << m_data.hosts.size()
                     << "templates:" << m_data.templates.size() << "switch logs:" << m_data.switchLogs.size();
    return true;
}

std::optional<qint64> LocalStore::saveHost(const AgentHost& host, PipelineError *error)
{
    QMutexLocker locker(&m_mutex);
    Data next = m_data;
    AgentHost stored = host;
    if (stored.id <= 0) {
        stored.id = next.nextHostId++;
    } else {
        next.nextHostId = qMax(next.nextHostId, stored.id + 1);
    }
    next.hosts.insert(stored.id, stored);
    if (!commit(next, error)) {
        return std::nullopt;
    }
    return stored.id;
}

QList<AgentHost> LocalStore::hosts() const
{
    QMutexLocker locker(&m_mutex);
    QList<AgentHost> result = m_data.hosts.values();
    std::sort(result.begin(), result.end(), [](const AgentHost& left, const AgentHost& right) {
        return left.id < right.id;
    });
    return result;
}

bool LocalStore::setInventory(qint64 hostId,
                              const QList<Inbound>& inbounds,
                              const QList<UserConfig>& users,
                              PipelineError *error)
{
    QMutexLocker locker(&m_mutex);
    Data next = m_data;
    next.inbounds.insert(hostId, inbounds);
    next.users.insert(hostId, users);
    return commit(next, error);
}

AgentHostRepository& LocalStore::agentHosts()
{
    return *m_hostRepository;
}

ConfigTemplateRepository& LocalStore::configTemplates()
{
    return *m_templateRepository;
}

AgentCoreInstanceRepository& LocalStore::coreInstances()
{
    return *m_instanceRepository;
}

AgentCoreSwitchLogRepository& LocalStore::switchLogs()
{
    return *m_switchLogRepository;
}

NodeInventory& LocalStore::inventory()
{
    return *m_inventory;
}

bool LocalStore::commit(const Data& next, PipelineError *error)
{
    if (!m_path.isEmpty()) {
        const QFileInfo info(m_path);
        if (!QDir().mkpath(info.absolutePath())) {
            setError(error, ErrorCode::Storage, QStringLiteral("Failed to create store directory: %1").arg(info.absolutePath()));
            return false;
        }

        QSaveFile file(m_path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            setError(error, ErrorCode::Storage, QStringLiteral("Failed to open store file: %1").arg(m_path));
            return false;
        }

        file.write(QJsonDocument(toJson(next)).toJson(QJsonDocument::Indented));

        if (!file.commit()) {
            qCWarning(lcStore) << "Failed to write store file" << m_path << file.errorString();
            setError(error, ErrorCode::Storage, QStringLiteral("Failed to write store file to disk."));
            return false;
        }
    }

    m_data = next;
    return true;
}

QJsonObject LocalStore::toJson(const Data& data)
{
    QList<AgentHost> hosts = data.hosts.values();
    std::sort(hosts.begin(), hosts.end(), [](const AgentHost& left, const AgentHost& right) {
        return left.id < right.id;
    });
    QList<ConfigTemplate> templates = data.templates.values();
    std::sort(templates.begin(), templates.end(), [](const ConfigTemplate& left, const ConfigTemplate& right) {
        return left.id < right.id;
    });

    QJsonObject inventory;
    for (const AgentHost& host : std::as_const(hosts)) {
        if (!data.inbounds.contains(host.id) && !data.users.contains(host.id)) {
            continue;
        }
        inventory.insert(QString::number(host.id), QJsonObject {
            {QStringLiteral("inbounds"), toJsonArrayOf(data.inbounds.value(host.id))},
            {QStringLiteral("users"), toJsonArrayOf(data.users.value(host.id))}
        });
    }

    return QJsonObject {
        {QStringLiteral("version"), 1},
        {QStringLiteral("next_host_id"), data.nextHostId},
        {QStringLiteral("next_template_id"), data.nextTemplateId},
        {QStringLiteral("next_switch_log_id"), data.nextSwitchLogId},
        {QStringLiteral("hosts"), toJsonArrayOf(hosts)},
        {QStringLiteral("templates"), toJsonArrayOf(templates)},
        {QStringLiteral("instances"), toJsonArrayOf(data.instances)},
        {QStringLiteral("switch_logs"), toJsonArrayOf(data.switchLogs)},
        {QStringLiteral("inventory"), inventory}
    };
}

LocalStore::Data LocalStore::fromJson(const QJsonObject& json)
{
    Data data;
    for (const QJsonValue& value : json.value(QStringLiteral("hosts")).toArray()) {
        const AgentHost host = AgentHost::fromJson(value.toObject());
        data.hosts.insert(host.id, host);
        data.nextHostId = qMax(data.nextHostId, host.id + 1);
    }
    for (const QJsonValue& value : json.value(QStringLiteral("templates")).toArray()) {
        const ConfigTemplate tmpl = ConfigTemplate::fromJson(value.toObject());
        data.templates.insert(tmpl.id, tmpl);
        data.nextTemplateId = qMax(data.nextTemplateId, tmpl.id + 1);
    }
    for (const QJsonValue& value : json.value(QStringLiteral("instances")).toArray()) {
        data.instances.append(AgentCoreInstance::fromJson(value.toObject()));
    }
    for (const QJsonValue& value : json.value(QStringLiteral("switch_logs")).toArray()) {
        const AgentCoreSwitchLog log = AgentCoreSwitchLog::fromJson(value.toObject());
        data.switchLogs.append(log);
        data.nextSwitchLogId = qMax(data.nextSwitchLogId, log.id + 1);
    }

    const QJsonObject inventory = json.value(QStringLiteral("inventory")).toObject();
    for (auto it = inventory.constBegin(); it != inventory.constEnd(); ++it) {
        const qint64 hostId = it.key().toLongLong();
        const QJsonObject entry = it.value().toObject();
        QList<Inbound> inbounds;
        for (const QJsonValue& value : entry.value(QStringLiteral("inbounds")).toArray()) {
            const std::optional<Inbound> inbound = Inbound::fromJson(value.toObject());
            if (inbound.has_value()) {
                inbounds.append(inbound.value());
            }
        }
        QList<UserConfig> users;
        for (const QJsonValue& value : entry.value(QStringLiteral("users")).toArray()) {
            users.append(UserConfig::fromJson(value.toObject()));
        }
        data.inbounds.insert(hostId, inbounds);
        data.users.insert(hostId, users);
    }

    // Sequences never move backwards, even after rows were removed.
    data.nextHostId = qMax(data.nextHostId, json.value(QStringLiteral("next_host_id")).toInteger(1));
    data.nextTemplateId = qMax(data.nextTemplateId, json.value(QStringLiteral("next_template_id")).toInteger(1));
    data.nextSwitchLogId = qMax(data.nextSwitchLogId, json.value(QStringLiteral("next_switch_log_id")).toInteger(1));
    return data;
}
