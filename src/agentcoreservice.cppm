/*!
 * @file        agentcoreservice.cppm
 * @brief       Engine instance management and live configuration switches.
 *
 * @details
 * Orchestrates instance creation and engine switches on remote agents.
 * Every operation is validated without side effects, serialized per
 * (agent host, instance), recorded as a pending switch log before the
 * agent is called, and driven through in_progress to exactly one terminal
 * state. Bookkeeping after the agent answered is best effort; its failures
 * are returned as reconciliation warnings instead of masking the outcome.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <functional>
#include <optional>

export module corebridge.backend.agentcoreservice;
export import corebridge.backend.agentclient;
export import corebridge.backend.configgenerator;
export import corebridge.backend.converterregistry;

/**
 * @struct SwitchCoreRequest
 * @brief Replace a running instance with a new engine instance.
 */
export struct SwitchCoreRequest {
    qint64 agentHostId = 0;
    QString fromInstanceId;
    QString toCoreType;
    QByteArray configJson;                  //!< Explicit payload, wins over the template.
    std::optional<qint64> configTemplateId; //!< Rendered for the host when no payload is given.
    QList<int> listenPorts;
    bool zeroDowntime = false;
    std::optional<qint64> operatorId;
};

/**
 * @struct CreateInstanceRequest
 * @brief Start a new engine instance on an agent.
 */
export struct CreateInstanceRequest {
    qint64 agentHostId = 0;
    QString instanceId;
    QString coreType;
    QByteArray configJson;
    std::optional<qint64> configTemplateId;
    QList<int> listenPorts;
    std::optional<qint64> operatorId;
};

/**
 * @struct SwitchResult
 * @brief Outcome of one audited agent call.
 */
export struct SwitchResult {
    bool success = false;
    QString newInstanceId;
    QString message;
    QString error;          //!< Agent or transport error, verbatim.
    qint64 switchLogId = 0;
    QString switchId;
    std::optional<QDateTime> completedAt;
    QString fromInstanceId;
    QString toCoreType;
    QStringList reconciliationWarnings; //!< Bookkeeping writes that failed after the call.
};

/**
 * @struct AgentCoreServiceOptions
 * @brief Connection and paging settings.
 */
export struct AgentCoreServiceOptions {
    quint16 defaultAgentPort = 19090;
    AgentTlsConfig tls;
    AgentKeepaliveConfig keepalive;
    AgentTimeoutConfig timeout;
    int listLimitDefault = 50;
    int listLimitMax = 200;
};

export using Clock = std::function<QDateTime()>;

//! Busy (host, instance) keys.
class InstanceKeySet
{
public:
    bool tryAcquire(const QString& key);
    void release(const QString& key);

private:
    QMutex m_mutex;
    QSet<QString> m_keys;
};

/**
 * @class AgentCoreService
 * @brief Switch orchestrator.
 */
export class AgentCoreService
{
public:
    AgentCoreService(const AgentHostRepository& hosts,
                     const ConfigTemplateRepository& templates,
                     AgentCoreInstanceRepository& instances,
                     AgentCoreSwitchLogRepository& switchLogs,
                     const NodeInventory& inventory,
                     AgentClientFactory clientFactory,
                     const AgentCoreServiceOptions& options = AgentCoreServiceOptions());

    //! Replace the time source used for audit timestamps.
    void setClock(Clock clock);

    const AgentCoreServiceOptions& options() const;

    /**
     * @brief Ask the agent which engines it has installed.
     */
    std::optional<QList<CoreInfo>> getCores(qint64 hostId, const CallContext& context, PipelineError *error = nullptr);

    std::optional<QList<AgentCoreInstance>> getInstances(qint64 hostId, PipelineError *error = nullptr) const;

    /**
     * @brief Start a new instance through an audited agent call.
     * @param result Optional output with the audit details, filled whenever a log row was written.
     * @return The stored instance, or empty optional. Remote failures and
     *         cancellation are reported after the switch log is finalized.
     */
    std::optional<AgentCoreInstance> createInstance(const CreateInstanceRequest& request,
                                                    const CallContext& context,
                                                    PipelineError *error = nullptr,
                                                    SwitchResult *result = nullptr);

    bool deleteInstance(qint64 hostId, const QString& instanceId, PipelineError *error = nullptr);

    /**
     * @brief Switch an instance to a new engine or configuration.
     * @return Result for every call that reached the audit log, including
     *         remote failures. Empty optional only when the request was
     *         rejected before a log row existed.
     */
    std::optional<SwitchResult> switchCore(const SwitchCoreRequest& request,
                                           const CallContext& context,
                                           PipelineError *error = nullptr);

    /**
     * @brief Page through switch logs of one host, newest first.
     */
    std::optional<SwitchLogPage> getSwitchLogs(const SwitchLogFilter& filter, PipelineError *error = nullptr) const;

    std::optional<ConversionResult> convertConfig(const QString& sourceCore,
                                                  const QString& targetCore,
                                                  const QByteArray& config,
                                                  PipelineError *error = nullptr) const;

private:
    struct ResolvedConfig {
        QByteArray payload;
        QString hash;
        std::optional<qint64> templateId;
        QString source; //!< "explicit" or "template".
    };

    struct PreparedCall {
        AgentHost host;
        bool isCreate = false;
        QString lockKey;
        QString switchId;
        QString fromInstanceId;
        QString fromCoreType;
        QString instanceId; //!< Requested id for creates.
        QString toCoreType;
        ResolvedConfig config;
        QList<int> listenPorts;
        bool zeroDowntime = false;
        std::optional<qint64> operatorId;
    };

    std::optional<ResolvedConfig> resolveConfig(const AgentHost& host,
                                                CoreEngine engine,
                                                const QByteArray& configJson,
                                                const std::optional<qint64>& templateId,
                                                PipelineError *error) const;
    std::optional<SwitchResult> execute(const PreparedCall& call, const CallContext& context, PipelineError *error);
    void finishLog(qint64 logId, qint64 hostId, const SwitchLogUpdate& update, SwitchResult& result);
    AgentClientConfig clientConfig(const AgentHost& host) const;
    static QString lockKey(qint64 hostId, const QString& instanceId);

    const AgentHostRepository& m_hosts;
    const ConfigTemplateRepository& m_templates;
    AgentCoreInstanceRepository& m_instances;
    AgentCoreSwitchLogRepository& m_switchLogs;
    ConfigGenerator m_generator;
    AgentClientFactory m_clientFactory;
    AgentCoreServiceOptions m_options;
    Clock m_clock;
    InstanceKeySet m_busyKeys;
};
