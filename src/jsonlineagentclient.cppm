/*!
 * @file        jsonlineagentclient.cppm
 * @brief       Agent client speaking newline-delimited JSON over TCP or TLS.
 *
 * @details
 * Each call opens a connection, writes one request line
 * `{token, action, request_id, ...}` and reads one response line
 * `{ok, message, ...}`. Every wait is bounded by the call deadline and the
 * configured timeouts, and the cancellation flag is polled between waits.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QAbstractSocket>
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include <optional>

export module corebridge.backend.jsonlineagentclient;
export import corebridge.backend.agentclient;

/**
 * @class JsonLineAgentClient
 * @brief Blocking JSON-line agent client.
 */
export class JsonLineAgentClient : public AgentClient
{
public:
    explicit JsonLineAgentClient(const AgentClientConfig& config);

    const AgentClientConfig& config() const;

    std::optional<QList<CoreInfo>> getCores(const CallContext& context, PipelineError *error) override;
    std::optional<AgentSwitchResponse> switchCore(const CallContext& context,
                                                  const AgentSwitchRequest& request,
                                                  PipelineError *error) override;

    /**
     * @brief Encode one request line, newline included.
     * @param fields Action-specific fields merged into the request.
     */
    static QByteArray encodeRequest(const QString& token,
                                    const QString& action,
                                    const QString& requestId,
                                    const QJsonObject& fields = QJsonObject());

    //! Action-specific fields of a switch_core request.
    static QJsonObject switchRequestFields(const AgentSwitchRequest& request);

    /**
     * @brief Decode one response line.
     * @return Response object or empty optional when the line is not a JSON object.
     */
    static std::optional<QJsonObject> decodeResponse(const QByteArray& line, QString *errorMessage = nullptr);

    /**
     * @brief Extract the core list from a get_cores response.
     * @return Cores, or empty optional with the agent message when `ok` is false.
     */
    static std::optional<QList<CoreInfo>> decodeCores(const QJsonObject& response, QString *errorMessage = nullptr);

    static AgentSwitchResponse decodeSwitchResponse(const QJsonObject& response);

    /**
     * @brief Enable TCP keepalive on a connected socket.
     *
     * @details
     * On Linux the first probe follows @c timeMs of idle time and the link is
     * dropped when a probe stays unanswered for @c timeoutMs. Other platforms
     * only switch keepalive on.
     * @return False when the timing could not be applied.
     */
    static bool applyKeepalive(QAbstractSocket& socket, const AgentKeepaliveConfig& keepalive);

    //! Factory producing clients of this type.
    static AgentClientFactory factory();

private:
    std::optional<QJsonObject> call(const CallContext& context,
                                    const QString& action,
                                    const QJsonObject& fields,
                                    PipelineError *error);

    AgentClientConfig m_config;
};
