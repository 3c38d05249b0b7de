module;
#include <QDateTime>
#include <QMutexLocker>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <utility>

module corebridge.tests.support;

void CallRecorder::record(const QString& event)
{
    QMutexLocker locker(&m_mutex);
    m_events.append(event);
}

QStringList CallRecorder::events() const
{
    QMutexLocker locker(&m_mutex);
    return m_events;
}

qsizetype CallRecorder::indexOf(const QString& event) const
{
    QMutexLocker locker(&m_mutex);
    return m_events.indexOf(event);
}

void CallRecorder::clear()
{
    QMutexLocker locker(&m_mutex);
    m_events.clear();
}

ManualClock::ManualClock(const QDateTime& start, qint64 stepMs)
    : m_current(start)
    , m_stepMs(stepMs)
{
}

QDateTime ManualClock::now()
{
    QMutexLocker locker(&m_mutex);
    const QDateTime current = m_current;
    m_current = m_current.addMSecs(m_stepMs);
    return current;
}

QDateTime ManualClock::peek() const
{
    QMutexLocker locker(&m_mutex);
    return m_current;
}

void ManualClock::advance(qint64 msecs)
{
    QMutexLocker locker(&m_mutex);
    m_current = m_current.addMSecs(msecs);
}

Clock ManualClock::clock()
{
    return [this] { return now(); };
}

class FakeAgent::Client final : public AgentClient
{
public:
    Client(std::shared_ptr<State> state, const AgentClientConfig& config)
        : m_state(std::move(state))
        , m_config(config)
    {
    }

    std::optional<QList<CoreInfo>> getCores(const CallContext& context, PipelineError *error) override
    {
        if (context.isCancelled()) {
            setError(error, ErrorCode::Cancelled, context.cancelReason());
            return std::nullopt;
        }
        QMutexLocker locker(&m_state->mutex);
        ++m_state->getCoresCalls;
        if (m_state->recorder) {
            m_state->recorder->record(QStringLiteral("agent:get_cores"));
        }
        return m_state->cores;
    }

    std::optional<AgentSwitchResponse> switchCore(const CallContext& context,
                                                  const AgentSwitchRequest& request,
                                                  PipelineError *error) override
    {
        SwitchHandler handler;
        {
            QMutexLocker locker(&m_state->mutex);
            m_state->switchCalls.append(RecordedSwitch {m_config, request});
            if (m_state->recorder) {
                m_state->recorder->record(QStringLiteral("agent:switch_core"));
            }
            handler = m_state->handler;
        }
        if (!handler) {
            setError(error, ErrorCode::Remote, QStringLiteral("no scripted response"));
            return std::nullopt;
        }
        return handler(context, request, error);
    }

private:
    std::shared_ptr<State> m_state;
    AgentClientConfig m_config;
};

FakeAgent::FakeAgent(CallRecorder *recorder)
    : m_state(std::make_shared<State>())
{
    m_state->recorder = recorder;
}

void FakeAgent::respondOk(const QString& newInstanceId, const QString& message)
{
    setSwitchHandler([newInstanceId, message](const CallContext&, const AgentSwitchRequest&, PipelineError *) {
        AgentSwitchResponse response;
        response.ok = true;
        response.newInstanceId = newInstanceId;
        response.message = message;
        return std::optional<AgentSwitchResponse>(response);
    });
}

void FakeAgent::respondFailure(const QString& error, const QString& message)
{
    setSwitchHandler([error, message](const CallContext&, const AgentSwitchRequest&, PipelineError *) {
        AgentSwitchResponse response;
        response.ok = false;
        response.error = error;
        response.message = message;
        return std::optional<AgentSwitchResponse>(response);
    });
}

void FakeAgent::failTransport(ErrorCode code, const QString& message)
{
    setSwitchHandler([code, message](const CallContext&, const AgentSwitchRequest&, PipelineError *error) {
        setError(error, code, message);
        return std::optional<AgentSwitchResponse>();
    });
}

void FakeAgent::setSwitchHandler(SwitchHandler handler)
{
    QMutexLocker locker(&m_state->mutex);
    m_state->handler = std::move(handler);
}

void FakeAgent::setCores(const QList<CoreInfo>& cores)
{
    QMutexLocker locker(&m_state->mutex);
    m_state->cores = cores;
}

QList<RecordedSwitch> FakeAgent::switchCalls() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->switchCalls;
}

int FakeAgent::getCoresCalls() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->getCoresCalls;
}

AgentClientFactory FakeAgent::factory()
{
    std::shared_ptr<State> state = m_state;
    return [state](const AgentClientConfig& config) -> std::unique_ptr<AgentClient> {
        return std::make_unique<Client>(state, config);
    };
}

FailingSwitchLogRepository::FailingSwitchLogRepository(AgentCoreSwitchLogRepository& inner, CallRecorder *recorder)
    : m_inner(inner)
    , m_recorder(recorder)
{
}

void FailingSwitchLogRepository::setFailCreate(bool fail)
{
    m_failCreate = fail;
}

void FailingSwitchLogRepository::setFailStatus(SwitchStatus status, bool fail)
{
    if (fail) {
        m_failStatuses.insert(static_cast<int>(status));
    } else {
        m_failStatuses.remove(static_cast<int>(status));
    }
}

std::optional<qint64> FailingSwitchLogRepository::create(const AgentCoreSwitchLog& log, PipelineError *error)
{
    if (m_failCreate) {
        setError(error, ErrorCode::Storage, QStringLiteral("disk full"));
        return std::nullopt;
    }
    std::optional<qint64> id = m_inner.create(log, error);
    if (id.has_value() && m_recorder) {
        m_recorder->record(QStringLiteral("log:%1").arg(switchStatusName(log.status)));
    }
    return id;
}

bool FailingSwitchLogRepository::updateStatus(qint64 id, const SwitchLogUpdate& update, PipelineError *error)
{
    if (m_failStatuses.contains(static_cast<int>(update.status))) {
        setError(error, ErrorCode::Storage, QStringLiteral("disk full"));
        return false;
    }
    const bool updated = m_inner.updateStatus(id, update, error);
    if (updated && m_recorder) {
        m_recorder->record(QStringLiteral("log:%1").arg(switchStatusName(update.status)));
    }
    return updated;
}

std::optional<AgentCoreSwitchLog> FailingSwitchLogRepository::findById(qint64 id, PipelineError *error) const
{
    return m_inner.findById(id, error);
}

SwitchLogPage FailingSwitchLogRepository::list(const SwitchLogFilter& filter) const
{
    return m_inner.list(filter);
}

FailingInstanceRepository::FailingInstanceRepository(AgentCoreInstanceRepository& inner)
    : m_inner(inner)
{
}

void FailingInstanceRepository::setFailCreate(bool fail)
{
    m_failCreate = fail;
}

void FailingInstanceRepository::setFailUpdateStatus(bool fail)
{
    m_failUpdateStatus = fail;
}

bool FailingInstanceRepository::create(const AgentCoreInstance& instance, PipelineError *error)
{
    if (m_failCreate) {
        setError(error, ErrorCode::Storage, QStringLiteral("disk full"));
        return false;
    }
    return m_inner.create(instance, error);
}

std::optional<AgentCoreInstance> FailingInstanceRepository::findByHostAndInstance(qint64 hostId,
                                                                                  const QString& instanceId,
                                                                                  PipelineError *error) const
{
    return m_inner.findByHostAndInstance(hostId, instanceId, error);
}

QList<AgentCoreInstance> FailingInstanceRepository::listByHost(qint64 hostId) const
{
    return m_inner.listByHost(hostId);
}

bool FailingInstanceRepository::updateStatus(qint64 hostId,
                                             const QString& instanceId,
                                             InstanceStatus status,
                                             const QString& errorMessage,
                                             PipelineError *error)
{
    if (m_failUpdateStatus) {
        setError(error, ErrorCode::Storage, QStringLiteral("disk full"));
        return false;
    }
    return m_inner.updateStatus(hostId, instanceId, status, errorMessage, error);
}

bool FailingInstanceRepository::remove(qint64 hostId, const QString& instanceId, PipelineError *error)
{
    return m_inner.remove(hostId, instanceId, error);
}

AgentHost makeHost(const QString& coreType, const QString& coreVersion,
                   const QStringList& capabilities, const QStringList& buildTags)
{
    AgentHost host;
    host.name = QStringLiteral("edge-1");
    host.host = QStringLiteral("10.0.0.5");
    host.token = QStringLiteral("secret-token");
    host.coreType = coreType;
    host.coreVersion = coreVersion;
    host.capabilities = capabilities;
    host.buildTags = buildTags;
    return host;
}

Inbound makeRealityInbound(const QString& tag)
{
    Inbound inbound;
    inbound.type = QStringLiteral("vless");
    inbound.tag = tag;
    inbound.listen = QStringLiteral("::");
    inbound.listenPort = 443;
    inbound.users.append(InboundUser {
        QStringLiteral("11111111-1111-1111-1111-111111111111"),
        QStringLiteral("alice@example.com"),
        QString(),
        QStringLiteral("xtls-rprx-vision"),
        QString()
    });

    RealitySettings reality;
    reality.enabled = true;
    reality.serverNames = {QStringLiteral("www.microsoft.com")};
    reality.shortIds = {QStringLiteral("6ba85179e30d4fc2")};
    reality.privateKey = QStringLiteral("private-key");
    reality.handshake = RealityHandshake {QStringLiteral("www.microsoft.com"), 443};

    InboundTls tls;
    tls.enabled = true;
    tls.serverName = QStringLiteral("www.microsoft.com");
    tls.reality = reality;
    inbound.tls = tls;
    inbound.refreshRequiredCapabilities();
    return inbound;
}

Inbound makeVmessInbound(const QString& tag)
{
    Inbound inbound;
    inbound.type = QStringLiteral("vmess");
    inbound.tag = tag;
    inbound.listen = QStringLiteral("::");
    inbound.listenPort = 8080;
    inbound.users.append(InboundUser {
        QStringLiteral("22222222-2222-2222-2222-222222222222"),
        QStringLiteral("bob@example.com"),
        QString(),
        QString(),
        QString()
    });
    InboundTransport transport;
    transport.type = QStringLiteral("ws");
    transport.path = QStringLiteral("/ws");
    inbound.transport = transport;
    inbound.refreshRequiredCapabilities();
    return inbound;
}

UserConfig makeUser(qint64 id, const QString& email)
{
    UserConfig user;
    user.id = id;
    user.uuid = QStringLiteral("00000000-0000-0000-0000-%1").arg(id, 12, 10, QLatin1Char('0'));
    user.email = email;
    return user;
}

QString singBoxTemplate()
{
    return QStringLiteral(R"({
  "log": {"level": {{ quote .server.log_level }}},
  "inbounds": {{ singboxInbounds | json }},
  "outbounds": {{ singboxOutbounds | json }}
})");
}

QString xrayTemplate()
{
    return QStringLiteral(R"({
  "log": {"loglevel": {{ quote .server.log_level }}},
  "inbounds": {{ xrayInbounds | json }},
  "outbounds": {{ xrayOutbounds | json }}
})");
}
