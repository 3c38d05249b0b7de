module;
#include <QByteArray>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QUuid>

#include <memory>
#include <optional>
#include <utility>

module corebridge.backend.agentcoreservice;
import corebridge.backend.coreengine;
import corebridge.backend.jsonsupport;

namespace {
Q_LOGGING_CATEGORY(lcSwitch, "corebridge.switch")

constexpr QLatin1StringView CancelledPrefix {"switch cancelled: "};

//! Holds a busy key for the lifetime of one call.
class InstanceKeyScope
{
public:
    InstanceKeyScope(InstanceKeySet& keys, const QString& key)
        : m_keys(keys)
        , m_key(key)
        , m_acquired(keys.tryAcquire(key))
    {
    }

    ~InstanceKeyScope()
    {
        if (m_acquired) {
            m_keys.release(m_key);
        }
    }

    InstanceKeyScope(const InstanceKeyScope&) = delete;
    InstanceKeyScope& operator=(const InstanceKeyScope&) = delete;

    bool acquired() const { return m_acquired; }

private:
    InstanceKeySet& m_keys;
    QString m_key;
    bool m_acquired = false;
};

QJsonArray portsToJson(const QList<int>& ports)
{
    QJsonArray out;
    for (const int port : ports) {
        out.append(port);
    }
    return out;
}

bool checkListenPorts(const QList<int>& ports, PipelineError *error)
{
    for (const int port : ports) {
        if (port < 1 || port > 65535) {
            setError(error, ErrorCode::Validation, QStringLiteral("Invalid listen port %1").arg(port));
            return false;
        }
    }
    return true;
}

QString cancelledMessage(const QString& reason)
{
    return QString(CancelledPrefix) + reason;
}

QString firstNonEmpty(const QString& first, const QString& second)
{
    return first.isEmpty() ? second : first;
}
}

bool InstanceKeySet::tryAcquire(const QString& key)
{
    QMutexLocker locker(&m_mutex);
    if (m_keys.contains(key)) {
        return false;
    }
    m_keys.insert(key);
    return true;
}

void InstanceKeySet::release(const QString& key)
{
    QMutexLocker locker(&m_mutex);
    m_keys.remove(key);
}

AgentCoreService::AgentCoreService(const AgentHostRepository& hosts,
                                   const ConfigTemplateRepository& templates,
                                   AgentCoreInstanceRepository& instances,
                                   AgentCoreSwitchLogRepository& switchLogs,
                                   const NodeInventory& inventory,
                                   AgentClientFactory clientFactory,
                                   const AgentCoreServiceOptions& options)
    : m_hosts(hosts)
    , m_templates(templates)
    , m_instances(instances)
    , m_switchLogs(switchLogs)
    , m_generator(inventory)
    , m_clientFactory(std::move(clientFactory))
    , m_options(options)
    , m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
}

void AgentCoreService::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

const AgentCoreServiceOptions& AgentCoreService::options() const
{
    return m_options;
}

std::optional<QList<CoreInfo>> AgentCoreService::getCores(qint64 hostId, const CallContext& context, PipelineError *error)
{
    const std::optional<AgentHost> host = m_hosts.findById(hostId, error);
    if (!host.has_value()) {
        return std::nullopt;
    }
    if (!m_clientFactory) {
        setError(error, ErrorCode::Remote, QStringLiteral("No agent client configured"));
        return std::nullopt;
    }

    const std::unique_ptr<AgentClient> client = m_clientFactory(clientConfig(host.value()));
    std::optional<QList<CoreInfo>> cores = client->getCores(context, error);
    if (!cores.has_value()) {
        qCWarning(lcSwitch) << "get_cores failed for agent host" << hostId;
        return std::nullopt;
    }
    return cores;
}

std::optional<QList<AgentCoreInstance>> AgentCoreService::getInstances(qint64 hostId, PipelineError *error) const
{
    if (!m_hosts.findById(hostId, error).has_value()) {
        return std::nullopt;
    }
    return m_instances.listByHost(hostId);
}

std::optional<AgentCoreInstance> AgentCoreService::createInstance(const CreateInstanceRequest& request,
                                                                  const CallContext& context,
                                                                  PipelineError *error,
                                                                  SwitchResult *result)
{
    if (request.agentHostId <= 0) {
        setError(error, ErrorCode::Validation, QStringLiteral("agent_host_id is required"));
        return std::nullopt;
    }
    const QString instanceId = request.instanceId.trimmed();
    if (instanceId.isEmpty()) {
        setError(error, ErrorCode::Validation, QStringLiteral("instance_id is required"));
        return std::nullopt;
    }
    const std::optional<CoreEngine> engine = parseCoreEngine(request.coreType);
    if (!engine.has_value()) {
        setError(error, ErrorCode::Validation,
                 QStringLiteral("Unsupported core type '%1'").arg(request.coreType));
        return std::nullopt;
    }
    if (!checkListenPorts(request.listenPorts, error)) {
        return std::nullopt;
    }

    const std::optional<AgentHost> host = m_hosts.findById(request.agentHostId, error);
    if (!host.has_value()) {
        return std::nullopt;
    }

    const QString duplicateMessage = QStringLiteral("Instance '%1' already exists on agent host %2")
                                         .arg(instanceId)
                                         .arg(request.agentHostId);
    PipelineError lookupError;
    if (m_instances.findByHostAndInstance(request.agentHostId, instanceId, &lookupError).has_value()) {
        setError(error, ErrorCode::Conflict, duplicateMessage);
        return std::nullopt;
    }

    std::optional<ResolvedConfig> config =
        resolveConfig(host.value(), engine.value(), request.configJson, request.configTemplateId, error);
    if (!config.has_value()) {
        return std::nullopt;
    }

    PreparedCall call;
    call.host = host.value();
    call.isCreate = true;
    call.lockKey = lockKey(request.agentHostId, instanceId);
    call.switchId = QStringLiteral("create-%1-%2").arg(request.agentHostId).arg(instanceId);
    call.instanceId = instanceId;
    call.toCoreType = coreEngineName(engine.value());
    call.config = std::move(config.value());
    call.listenPorts = request.listenPorts;
    call.operatorId = request.operatorId;

    InstanceKeyScope scope(m_busyKeys, call.lockKey);
    if (!scope.acquired()) {
        setError(error, ErrorCode::Conflict,
                 QStringLiteral("Instance '%1' on agent host %2 is busy").arg(instanceId).arg(request.agentHostId));
        return std::nullopt;
    }
    // A create that finished while this one validated.
    if (m_instances.findByHostAndInstance(request.agentHostId, instanceId, &lookupError).has_value()) {
        setError(error, ErrorCode::Conflict, duplicateMessage);
        return std::nullopt;
    }

    const std::optional<SwitchResult> outcome = execute(call, context, error);
    if (!outcome.has_value()) {
        return std::nullopt;
    }
    if (result) {
        *result = outcome.value();
    }

    if (!outcome->success) {
        const ErrorCode code = outcome->error.startsWith(CancelledPrefix) ? ErrorCode::Cancelled : ErrorCode::Remote;
        setError(error, code, outcome->error);
        return std::nullopt;
    }

    AgentCoreInstance instance;
    instance.agentHostId = request.agentHostId;
    instance.instanceId = instanceId;
    instance.coreType = call.toCoreType;
    instance.status = InstanceStatus::Running;
    instance.configTemplateId = call.config.templateId;
    instance.configHash = call.config.hash;
    instance.listenPorts = request.listenPorts;
    instance.createdAt = outcome->completedAt.value_or(m_clock());
    instance.updatedAt = instance.createdAt;

    const std::optional<AgentCoreInstance> stored =
        m_instances.findByHostAndInstance(request.agentHostId, instanceId, &lookupError);
    return stored.has_value() ? stored : std::optional<AgentCoreInstance>(instance);
}

bool AgentCoreService::deleteInstance(qint64 hostId, const QString& instanceId, PipelineError *error)
{
    const QString trimmed = instanceId.trimmed();
    if (hostId <= 0 || trimmed.isEmpty()) {
        setError(error, ErrorCode::Validation, QStringLiteral("agent_host_id and instance_id are required"));
        return false;
    }

    InstanceKeyScope scope(m_busyKeys, lockKey(hostId, trimmed));
    if (!scope.acquired()) {
        setError(error, ErrorCode::Conflict,
                 QStringLiteral("Instance '%1' on agent host %2 is busy").arg(trimmed).arg(hostId));
        return false;
    }

    if (!m_instances.findByHostAndInstance(hostId, trimmed, error).has_value()) {
        return false;
    }
    if (!m_instances.remove(hostId, trimmed, error)) {
        return false;
    }
    qCInfo(lcSwitch).noquote() << "Deleted instance" << trimmed << "of agent host" << hostId;
    return true;
}

std::optional<SwitchResult> AgentCoreService::switchCore(const SwitchCoreRequest& request,
                                                         const CallContext& context,
                                                         PipelineError *error)
{
    if (request.agentHostId <= 0) {
        setError(error, ErrorCode::Validation, QStringLiteral("agent_host_id is required"));
        return std::nullopt;
    }
    const QString fromInstanceId = request.fromInstanceId.trimmed();
    if (fromInstanceId.isEmpty()) {
        setError(error, ErrorCode::Validation, QStringLiteral("from_instance_id is required"));
        return std::nullopt;
    }
    const std::optional<CoreEngine> engine = parseCoreEngine(request.toCoreType);
    if (!engine.has_value()) {
        setError(error, ErrorCode::Validation,
                 QStringLiteral("Unsupported core type '%1'").arg(request.toCoreType));
        return std::nullopt;
    }
    if (!checkListenPorts(request.listenPorts, error)) {
        return std::nullopt;
    }

    const std::optional<AgentHost> host = m_hosts.findById(request.agentHostId, error);
    if (!host.has_value()) {
        return std::nullopt;
    }

    std::optional<ResolvedConfig> config =
        resolveConfig(host.value(), engine.value(), request.configJson, request.configTemplateId, error);
    if (!config.has_value()) {
        return std::nullopt;
    }

    PreparedCall call;
    call.host = host.value();
    call.lockKey = lockKey(request.agentHostId, fromInstanceId);
    call.switchId = QStringLiteral("switch-%1-%2")
                        .arg(request.agentHostId)
                        .arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    call.fromInstanceId = fromInstanceId;
    call.toCoreType = coreEngineName(engine.value());
    call.config = std::move(config.value());
    call.listenPorts = request.listenPorts;
    call.zeroDowntime = request.zeroDowntime;
    call.operatorId = request.operatorId;

    PipelineError lookupError;
    const std::optional<AgentCoreInstance> from =
        m_instances.findByHostAndInstance(request.agentHostId, fromInstanceId, &lookupError);
    if (from.has_value()) {
        call.fromCoreType = from->coreType;
    }

    InstanceKeyScope scope(m_busyKeys, call.lockKey);
    if (!scope.acquired()) {
        setError(error, ErrorCode::Conflict,
                 QStringLiteral("Instance '%1' on agent host %2 is busy").arg(fromInstanceId).arg(request.agentHostId));
        return std::nullopt;
    }

    return execute(call, context, error);
}

std::optional<SwitchLogPage> AgentCoreService::getSwitchLogs(const SwitchLogFilter& filter, PipelineError *error) const
{
    if (!filter.agentHostId.has_value() || filter.agentHostId.value() <= 0) {
        setError(error, ErrorCode::Validation, QStringLiteral("agent_host_id is required"));
        return std::nullopt;
    }

    SwitchLogFilter normalized = filter;
    if (normalized.limit <= 0) {
        normalized.limit = m_options.listLimitDefault;
    }
    if (normalized.limit > m_options.listLimitMax) {
        normalized.limit = m_options.listLimitMax;
    }
    if (normalized.offset < 0) {
        normalized.offset = 0;
    }
    return m_switchLogs.list(normalized);
}

std::optional<ConversionResult> AgentCoreService::convertConfig(const QString& sourceCore,
                                                                const QString& targetCore,
                                                                const QByteArray& config,
                                                                PipelineError *error) const
{
    QString message;
    std::optional<ConversionResult> converted = ConverterRegistry::convertConfig(sourceCore, targetCore, config, &message);
    if (!converted.has_value()) {
        setError(error, ErrorCode::Validation, message);
        return std::nullopt;
    }
    return converted;
}

std::optional<AgentCoreService::ResolvedConfig> AgentCoreService::resolveConfig(const AgentHost& host,
                                                                                CoreEngine engine,
                                                                                const QByteArray& configJson,
                                                                                const std::optional<qint64>& templateId,
                                                                                PipelineError *error) const
{
    ResolvedConfig resolved;
    resolved.templateId = templateId;

    if (!configJson.trimmed().isEmpty()) {
        QJsonParseError parseError;
        QJsonDocument::fromJson(configJson, &parseError);
        if (parseError.error != QJsonParseError::NoError) {
            setError(error, ErrorCode::Validation,
                     QStringLiteral("config_json is not valid JSON at offset %1: %2")
                         .arg(parseError.offset)
                         .arg(parseError.errorString()));
            return std::nullopt;
        }
        resolved.payload = configJson;
        resolved.source = QStringLiteral("explicit");
    } else if (templateId.has_value()) {
        const std::optional<ConfigTemplate> tmpl = m_templates.findById(templateId.value(), error);
        if (!tmpl.has_value()) {
            return std::nullopt;
        }
        const std::optional<CoreEngine> templateEngine = parseCoreEngine(tmpl->type);
        if (templateEngine != engine) {
            setError(error, ErrorCode::Validation,
                     QStringLiteral("Template '%1' targets '%2', not %3")
                         .arg(tmpl->name, tmpl->type, coreEngineName(engine)));
            return std::nullopt;
        }

        // The reported version and features belong to the engine being replaced.
        AgentHost target = host;
        const std::optional<CoreEngine> hostEngine = parseCoreEngine(host.coreType);
        if (hostEngine.has_value() && hostEngine.value() != engine) {
            target.coreVersion.clear();
            target.capabilities.clear();
            target.buildTags.clear();
        }
        target.coreType = coreEngineName(engine);

        const std::optional<GeneratedConfig> generated = m_generator.generate(target, tmpl.value(), error);
        if (!generated.has_value()) {
            return std::nullopt;
        }
        resolved.payload = generated->config;
        resolved.source = QStringLiteral("template");
    } else {
        setError(error, ErrorCode::Validation, QStringLiteral("config_json or config_template_id is required"));
        return std::nullopt;
    }

    resolved.hash = sha256Hex(resolved.payload);
    return resolved;
}

std::optional<SwitchResult> AgentCoreService::execute(const PreparedCall& call,
                                                      const CallContext& context,
                                                      PipelineError *error)
{
    const qint64 hostId = call.host.id;

    QJsonObject detail {
        {QStringLiteral("agent_host_id"), hostId},
        {QStringLiteral("switch_id"), call.switchId},
        {QStringLiteral("to_core_type"), call.toCoreType},
        {QStringLiteral("listen_ports"), portsToJson(call.listenPorts)},
        {QStringLiteral("zero_downtime"), call.zeroDowntime},
        {QStringLiteral("config_hash"), call.config.hash},
        {QStringLiteral("config_source"), call.config.source}
    };
    if (call.isCreate) {
        detail.insert(QStringLiteral("instance_id"), call.instanceId);
    } else {
        detail.insert(QStringLiteral("from_instance_id"), call.fromInstanceId);
    }
    if (call.config.templateId.has_value()) {
        detail.insert(QStringLiteral("config_template_id"), call.config.templateId.value());
    }
    if (call.operatorId.has_value()) {
        detail.insert(QStringLiteral("operator_id"), call.operatorId.value());
    }

    AgentCoreSwitchLog log;
    log.switchId = call.switchId;
    log.agentHostId = hostId;
    log.fromInstanceId = call.fromInstanceId;
    log.fromCoreType = call.fromCoreType;
    log.toCoreType = call.toCoreType;
    log.status = SwitchStatus::Pending;
    log.message = call.isCreate ? QStringLiteral("create requested") : QStringLiteral("switch requested");
    log.detail = QString::fromUtf8(QJsonDocument(detail).toJson(QJsonDocument::Compact));
    log.operatorId = call.operatorId;
    log.createdAt = m_clock();

    const std::optional<qint64> logId = m_switchLogs.create(log, error);
    if (!logId.has_value()) {
        qCWarning(lcSwitch) << "Failed to write switch log for agent host" << hostId << "switch" << call.switchId;
        return std::nullopt;
    }

    SwitchResult result;
    result.switchLogId = logId.value();
    result.switchId = call.switchId;
    result.fromInstanceId = call.fromInstanceId;
    result.toCoreType = call.toCoreType;

    qCInfo(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId
                               << "pending" << call.switchId;

    SwitchLogUpdate progress;
    progress.status = SwitchStatus::InProgress;
    progress.message = QStringLiteral("calling agent");
    PipelineError progressError;
    if (!m_switchLogs.updateStatus(result.switchLogId, progress, &progressError)) {
        const QString warning = QStringLiteral("Failed to mark switch log %1 in_progress: %2")
                                    .arg(result.switchLogId)
                                    .arg(progressError.message);
        qCWarning(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId << warning;
        result.reconciliationWarnings.append(warning);
    }

    std::optional<AgentSwitchResponse> response;
    QString failure;
    if (context.isCancelled()) {
        failure = cancelledMessage(context.cancelReason());
    } else if (!m_clientFactory) {
        failure = QStringLiteral("No agent client configured");
    } else {
        AgentSwitchRequest agentRequest;
        agentRequest.fromInstanceId = call.fromInstanceId;
        agentRequest.toCoreType = call.toCoreType;
        agentRequest.configJson = call.config.payload;
        agentRequest.switchId = call.switchId;
        agentRequest.listenPorts = call.listenPorts;
        agentRequest.zeroDowntime = call.zeroDowntime;

        const std::unique_ptr<AgentClient> client = m_clientFactory(clientConfig(call.host));
        PipelineError callError;
        response = client->switchCore(context, agentRequest, &callError);
        if (!response.has_value()) {
            if (callError.code == ErrorCode::Cancelled) {
                failure = cancelledMessage(context.cancelReason());
            } else {
                failure = firstNonEmpty(callError.message.trimmed(), QStringLiteral("agent call failed"));
            }
        } else if (!response->ok) {
            failure = firstNonEmpty(response->error, response->message);
            if (failure.isEmpty()) {
                failure = QStringLiteral("agent rejected the request");
            }
        }
    }

    SwitchLogUpdate terminal;
    terminal.completedAt = m_clock();
    result.completedAt = terminal.completedAt;

    if (!failure.isEmpty()) {
        result.success = false;
        result.error = failure;
        if (response.has_value()) {
            result.message = response->message;
        }
        terminal.status = SwitchStatus::Failed;
        terminal.message = failure;
        finishLog(result.switchLogId, hostId, terminal, result);
        qCWarning(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId
                                      << "failed:" << failure;
        return result;
    }

    const QString newInstanceId = call.isCreate ? call.instanceId : response->newInstanceId.trimmed();
    result.success = true;
    result.newInstanceId = newInstanceId;
    result.message = response->message;

    terminal.status = SwitchStatus::Completed;
    terminal.message = firstNonEmpty(response->message, call.isCreate ? QStringLiteral("instance created")
                                                                      : QStringLiteral("switch completed"));
    terminal.toInstanceId = newInstanceId;
    finishLog(result.switchLogId, hostId, terminal, result);

    if (!call.isCreate) {
        PipelineError stopError;
        PipelineError lookupError;
        if (m_instances.findByHostAndInstance(hostId, call.fromInstanceId, &lookupError).has_value()) {
            if (!m_instances.updateStatus(hostId, call.fromInstanceId, InstanceStatus::Stopped, QString(), &stopError)) {
                const QString warning = QStringLiteral("Failed to mark instance '%1' stopped: %2")
                                            .arg(call.fromInstanceId, stopError.message);
                qCWarning(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId << warning;
                result.reconciliationWarnings.append(warning);
            }
        } else {
            qCDebug(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId
                                        << "from instance" << call.fromInstanceId << "is not tracked";
        }
    }

    if (newInstanceId.isEmpty()) {
        const QString warning = QStringLiteral("Agent did not report a new instance id");
        qCWarning(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId << warning;
        result.reconciliationWarnings.append(warning);
    } else {
        AgentCoreInstance instance;
        instance.agentHostId = hostId;
        instance.instanceId = newInstanceId;
        instance.coreType = call.toCoreType;
        instance.status = InstanceStatus::Running;
        instance.configTemplateId = call.config.templateId;
        instance.configHash = call.config.hash;
        instance.listenPorts = call.listenPorts;
        instance.createdAt = result.completedAt.value();
        instance.updatedAt = instance.createdAt;

        PipelineError createError;
        if (!m_instances.create(instance, &createError)) {
            const QString warning = QStringLiteral("Failed to record instance '%1': %2")
                                        .arg(newInstanceId, createError.message);
            qCWarning(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId << warning;
            result.reconciliationWarnings.append(warning);
        }
    }

    qCInfo(lcSwitch).noquote() << "agent host" << hostId << "switch log" << result.switchLogId
                               << "completed, new instance" << newInstanceId;
    return result;
}

void AgentCoreService::finishLog(qint64 logId, qint64 hostId, const SwitchLogUpdate& update, SwitchResult& result)
{
    PipelineError updateError;
    if (!m_switchLogs.updateStatus(logId, update, &updateError)) {
        const QString warning = QStringLiteral("Failed to mark switch log %1 %2: %3")
                                    .arg(logId)
                                    .arg(switchStatusName(update.status), updateError.message);
        qCWarning(lcSwitch).noquote() << "agent host" << hostId << "switch log" << logId << warning;
        result.reconciliationWarnings.append(warning);
    }
}

AgentClientConfig AgentCoreService::clientConfig(const AgentHost& host) const
{
    AgentClientConfig config;
    config.address = normalizeAgentAddress(host.host, m_options.defaultAgentPort);
    config.token = host.token;
    config.tls = m_options.tls;
    config.keepalive = m_options.keepalive;
    config.timeout = m_options.timeout;
    return config;
}

QString AgentCoreService::lockKey(qint64 hostId, const QString& instanceId)
{
    return QStringLiteral("%1/%2").arg(hostId).arg(instanceId);
}
