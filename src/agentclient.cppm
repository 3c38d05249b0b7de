/*!
 * @file        agentclient.cppm
 * @brief       Remote agent call interface.
 *
 * @details
 * Defines the connection settings, call context and request/response types
 * used to talk to the agent running on a managed host. Implementations
 * report transport failures as Remote errors, caller cancellation as
 * Cancelled errors, and application-level failures in the response.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QDeadlineTimer>
#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

export module corebridge.backend.agentclient;
export import corebridge.backend.pipelineerror;

export struct AgentTlsConfig {
    bool enabled = false;
    QString caFile;
    QString certFile;
    QString keyFile;
    bool insecureSkipVerify = false;
};

export struct AgentKeepaliveConfig {
    bool enabled = true;
    int timeMs = 30000;
    int timeoutMs = 10000;
};

export struct AgentTimeoutConfig {
    int defaultMs = 10000; //!< Bound for each write and read wait.
    int connectMs = 5000;  //!< Bound for connecting and the TLS handshake.
};

/**
 * @struct AgentClientConfig
 * @brief Everything needed to reach one agent.
 */
export struct AgentClientConfig {
    QString address; //!< host:port
    QString token;   //!< Agent credential.
    AgentTlsConfig tls;
    AgentKeepaliveConfig keepalive;
    AgentTimeoutConfig timeout;
};

/**
 * @brief Append @p defaultPort to an agent address that has none.
 *
 * @details
 * Bracketed IPv6 literals keep their brackets; bare IPv6 literals are
 * bracketed before the port is added.
 */
export QString normalizeAgentAddress(const QString& address, quint16 defaultPort);

/**
 * @struct CoreInfo
 * @brief Engine installed on an agent.
 */
export struct CoreInfo {
    QString type;
    QString version;
    bool installed = false;
    QStringList capabilities;

    QJsonObject toJson() const;
    static CoreInfo fromJson(const QJsonObject& json);
};

/**
 * @struct AgentSwitchRequest
 * @brief Payload of a switch_core call.
 */
export struct AgentSwitchRequest {
    QString fromInstanceId; //!< Empty when creating a new instance.
    QString toCoreType;
    QByteArray configJson;
    QString switchId;       //!< Correlation id recorded in the switch log.
    QList<int> listenPorts;
    bool zeroDowntime = false;
};

/**
 * @struct AgentSwitchResponse
 * @brief Application-level result of a switch_core call.
 */
export struct AgentSwitchResponse {
    bool ok = false;
    QString newInstanceId;
    QString message;
    QString error; //!< Agent error text, kept verbatim.
};

/**
 * @class CallContext
 * @brief Deadline plus a cancellation flag shared by all copies.
 */
export class CallContext
{
public:
    //! Context without deadline.
    CallContext();
    explicit CallContext(const QDeadlineTimer& deadline);

    static CallContext withTimeout(qint64 msecs);

    QDeadlineTimer deadline() const;

    /**
     * @brief Wait budget for one step.
     * @param capMs Configured timeout of the step.
     * @return min(remaining deadline, capMs), never negative.
     */
    int remainingMs(int capMs) const;

    bool isCancelled() const;
    QString cancelReason() const;

    //! Cancel every copy of this context. The first reason wins.
    void cancel(const QString& reason = QString()) const;

private:
    struct State {
        std::atomic_bool cancelled {false};
        mutable QMutex mutex;
        QString reason;
    };

    QDeadlineTimer m_deadline;
    std::shared_ptr<State> m_state;
};

/**
 * @class AgentClient
 * @brief Synchronous agent API.
 */
export class AgentClient
{
public:
    virtual ~AgentClient() = default;

    /**
     * @brief List the engines installed on the agent.
     * @return Cores or empty optional with Remote or Cancelled error.
     */
    virtual std::optional<QList<CoreInfo>> getCores(const CallContext& context, PipelineError *error) = 0;

    /**
     * @brief Ask the agent to start an engine instance, optionally replacing one.
     * @return Agent response, including application failures, or empty optional
     *         with Remote or Cancelled error when no response was obtained.
     */
    virtual std::optional<AgentSwitchResponse> switchCore(const CallContext& context,
                                                          const AgentSwitchRequest& request,
                                                          PipelineError *error) = 0;
};

export using AgentClientFactory = std::function<std::unique_ptr<AgentClient>(const AgentClientConfig&)>;
