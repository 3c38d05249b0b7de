module;
#include <QAbstractSocket>
#include <QByteArray>
#include <QDeadlineTimer>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QLoggingCategory>
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslKey>
#include <QSslSocket>
#include <QString>
#include <QTcpSocket>
#include <QUuid>
#include <QtGlobal>

#include <memory>
#include <optional>

#ifdef Q_OS_LINUX
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

module corebridge.backend.jsonlineagentclient;

namespace {
Q_LOGGING_CATEGORY(lcAgent, "corebridge.agent")

constexpr int kPollSliceMs = 100;
constexpr qsizetype kMaxResponseBytes = 16 * 1024 * 1024;

enum class WaitOutcome
{
    Ready,
    TimedOut,
    Cancelled,
    Failed
};

template <typename WaitFn>
WaitOutcome waitInSlices(const CallContext& context, QAbstractSocket& socket, int budgetMs, WaitFn wait)
{
    const QDeadlineTimer phase(budgetMs);
    while (true) {
        if (context.isCancelled()) {
            return WaitOutcome::Cancelled;
        }
        if (phase.hasExpired()) {
            return WaitOutcome::TimedOut;
        }
        const int slice = static_cast<int>(qBound<qint64>(1, phase.remainingTime(), kPollSliceMs));
        if (wait(slice)) {
            return WaitOutcome::Ready;
        }
        if (socket.error() != QAbstractSocket::SocketTimeoutError) {
            return WaitOutcome::Failed;
        }
    }
}

bool splitAddress(const QString& address, QString *host, quint16 *port)
{
    const qsizetype colon = address.lastIndexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return false;
    }
    bool ok = false;
    const int value = address.mid(colon + 1).toInt(&ok);
    if (!ok || value < 1 || value > 65535) {
        return false;
    }
    QString name = address.left(colon);
    if (name.startsWith(QLatin1Char('[')) && name.endsWith(QLatin1Char(']'))) {
        name = name.mid(1, name.size() - 2);
    }
    *host = name;
    *port = static_cast<quint16>(value);
    return !name.isEmpty();
}

std::optional<QSslKey> loadPrivateKey(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const QByteArray pem = file.readAll();
    for (const QSsl::KeyAlgorithm algorithm : {QSsl::Rsa, QSsl::Ec}) {
        const QSslKey key(pem, algorithm, QSsl::Pem, QSsl::PrivateKey);
        if (!key.isNull()) {
            return key;
        }
    }
    return std::nullopt;
}

bool configureTls(QSslSocket& socket, const AgentTlsConfig& tls, QString *errorMessage)
{
    QSslConfiguration configuration = socket.sslConfiguration();
    if (!tls.caFile.isEmpty()) {
        const QList<QSslCertificate> authorities = QSslCertificate::fromPath(tls.caFile);
        if (authorities.isEmpty()) {
            *errorMessage = QStringLiteral("Failed to load CA file: %1").arg(tls.caFile);
            return false;
        }
        configuration.addCaCertificates(authorities);
    }
    if (!tls.certFile.isEmpty()) {
        const QList<QSslCertificate> certificates = QSslCertificate::fromPath(tls.certFile);
        if (certificates.isEmpty()) {
            *errorMessage = QStringLiteral("Failed to load client certificate: %1").arg(tls.certFile);
            return false;
        }
        const std::optional<QSslKey> key = loadPrivateKey(tls.keyFile);
        if (!key.has_value()) {
            *errorMessage = QStringLiteral("Failed to load client key: %1").arg(tls.keyFile);
            return false;
        }
        configuration.setLocalCertificate(certificates.constFirst());
        configuration.setPrivateKey(key.value());
    }
    configuration.setPeerVerifyMode(tls.insecureSkipVerify ? QSslSocket::VerifyNone : QSslSocket::VerifyPeer);
    socket.setSslConfiguration(configuration);
    return true;
}

void setWaitError(PipelineError *error, WaitOutcome outcome, const CallContext& context,
                  const QAbstractSocket& socket, const QString& step)
{
    switch (outcome) {
    case WaitOutcome::Cancelled:
        setError(error, ErrorCode::Cancelled, context.cancelReason());
        break;
    case WaitOutcome::TimedOut:
        setError(error, ErrorCode::Remote, QStringLiteral("Timed out while %1").arg(step));
        break;
    case WaitOutcome::Failed:
        setError(error, ErrorCode::Remote, QStringLiteral("Failed while %1: %2").arg(step, socket.errorString()));
        break;
    case WaitOutcome::Ready:
        break;
    }
}
}

JsonLineAgentClient::JsonLineAgentClient(const AgentClientConfig& config)
    : m_config(config)
{
}

const AgentClientConfig& JsonLineAgentClient::config() const
{
    return m_config;
}

std::optional<QList<CoreInfo>> JsonLineAgentClient::getCores(const CallContext& context, PipelineError *error)
{
    const std::optional<QJsonObject> response = call(context, QStringLiteral("get_cores"), QJsonObject(), error);
    if (!response.has_value()) {
        return std::nullopt;
    }

    QString message;
    std::optional<QList<CoreInfo>> cores = decodeCores(response.value(), &message);
    if (!cores.has_value()) {
        setError(error, ErrorCode::Remote, message);
    }
    return cores;
}

std::optional<AgentSwitchResponse> JsonLineAgentClient::switchCore(const CallContext& context,
                                                                   const AgentSwitchRequest& request,
                                                                   PipelineError *error)
{
    const std::optional<QJsonObject> response =
        call(context, QStringLiteral("switch_core"), switchRequestFields(request), error);
    if (!response.has_value()) {
        return std::nullopt;
    }
    return decodeSwitchResponse(response.value());
}

QByteArray JsonLineAgentClient::encodeRequest(const QString& token,
                                              const QString& action,
                                              const QString& requestId,
                                              const QJsonObject& fields)
{
    QJsonObject request = fields;
    request.insert(QStringLiteral("token"), token);
    request.insert(QStringLiteral("action"), action);
    request.insert(QStringLiteral("request_id"), requestId);
    QByteArray line = QJsonDocument(request).toJson(QJsonDocument::Compact);
    line.append('\n');
    return line;
}

QJsonObject JsonLineAgentClient::switchRequestFields(const AgentSwitchRequest& request)
{
    QJsonArray ports;
    for (const int port : request.listenPorts) {
        ports.append(port);
    }
    return QJsonObject {
        {QStringLiteral("from_instance_id"), request.fromInstanceId},
        {QStringLiteral("to_core_type"), request.toCoreType},
        {QStringLiteral("config_json"), QString::fromUtf8(request.configJson)},
        {QStringLiteral("switch_id"), request.switchId},
        {QStringLiteral("listen_ports"), ports},
        {QStringLiteral("zero_downtime"), request.zeroDowntime}
    };
}

std::optional<QJsonObject> JsonLineAgentClient::decodeResponse(const QByteArray& line, QString *errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid agent response: %1").arg(parseError.errorString());
        }
        return std::nullopt;
    }
    return doc.object();
}

std::optional<QList<CoreInfo>> JsonLineAgentClient::decodeCores(const QJsonObject& response, QString *errorMessage)
{
    if (!response.value(QStringLiteral("ok")).toBool()) {
        if (errorMessage) {
            const QString message = response.value(QStringLiteral("message")).toString().trimmed();
            *errorMessage = message.isEmpty() ? QStringLiteral("Agent rejected get_cores.") : message;
        }
        return std::nullopt;
    }

    QList<CoreInfo> cores;
    for (const QJsonValue& value : response.value(QStringLiteral("cores")).toArray()) {
        if (value.isObject()) {
            cores.append(CoreInfo::fromJson(value.toObject()));
        }
    }
    return cores;
}

AgentSwitchResponse JsonLineAgentClient::decodeSwitchResponse(const QJsonObject& response)
{
    AgentSwitchResponse result;
    result.ok = response.value(QStringLiteral("ok")).toBool();
    result.newInstanceId = response.value(QStringLiteral("new_instance_id")).toString().trimmed();
    result.message = response.value(QStringLiteral("message")).toString();
    result.error = response.value(QStringLiteral("error")).toString();
    if (!result.ok && result.error.isEmpty()) {
        result.error = result.message.isEmpty() ? QStringLiteral("Agent rejected switch_core.") : result.message;
    }
    return result;
}

bool JsonLineAgentClient::applyKeepalive(QAbstractSocket& socket, const AgentKeepaliveConfig& keepalive)
{
    socket.setSocketOption(QAbstractSocket::KeepAliveOption, 1);
#ifdef Q_OS_LINUX
    const qintptr descriptor = socket.socketDescriptor();
    if (descriptor < 0) {
        return false;
    }
    // Idle time before the first probe, then one unanswered probe interval drops the link.
    const int idleSeconds = qMax(1, (keepalive.timeMs + 999) / 1000);
    const int intervalSeconds = qMax(1, (keepalive.timeoutMs + 999) / 1000);
    const int probes = 1;
    const int fd = static_cast<int>(descriptor);
    return ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idleSeconds, sizeof(idleSeconds)) == 0
        && ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intervalSeconds, sizeof(intervalSeconds)) == 0
        && ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &probes, sizeof(probes)) == 0;
#else
    Q_UNUSED(keepalive);
    return true;
#endif
}

AgentClientFactory JsonLineAgentClient::factory()
{
    return [](const AgentClientConfig& config) -> std::unique_ptr<AgentClient> {
        return std::make_unique<JsonLineAgentClient>(config);
    };
}

std::optional<QJsonObject> JsonLineAgentClient::call(const CallContext& context,
                                                     const QString& action,
                                                     const QJsonObject& fields,
                                                     PipelineError *error)
{
    if (context.isCancelled()) {
        setError(error, ErrorCode::Cancelled, context.cancelReason());
        return std::nullopt;
    }

    QString host;
    quint16 port = 0;
    if (!splitAddress(m_config.address, &host, &port)) {
        setError(error, ErrorCode::Remote, QStringLiteral("Invalid agent address '%1'").arg(m_config.address));
        return std::nullopt;
    }

    const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    qCDebug(lcAgent) << "Calling" << action << "on" << m_config.address << "request" << requestId;

    std::unique_ptr<QTcpSocket> socket;
    if (m_config.tls.enabled) {
        auto sslSocket = std::make_unique<QSslSocket>();
        QString tlsError;
        if (!configureTls(*sslSocket, m_config.tls, &tlsError)) {
            setError(error, ErrorCode::Remote, tlsError);
            return std::nullopt;
        }
        sslSocket->connectToHostEncrypted(host, port);
        QSslSocket *raw = sslSocket.get();
        const WaitOutcome connected = waitInSlices(context, *raw, context.remainingMs(m_config.timeout.connectMs),
                                                   [raw](int slice) { return raw->waitForEncrypted(slice); });
        if (connected != WaitOutcome::Ready) {
            setWaitError(error, connected, context, *raw, QStringLiteral("connecting to %1").arg(m_config.address));
            return std::nullopt;
        }
        socket = std::move(sslSocket);
    } else {
        socket = std::make_unique<QTcpSocket>();
        socket->connectToHost(host, port);
        QTcpSocket *raw = socket.get();
        const WaitOutcome connected = waitInSlices(context, *raw, context.remainingMs(m_config.timeout.connectMs),
                                                   [raw](int slice) { return raw->waitForConnected(slice); });
        if (connected != WaitOutcome::Ready) {
            setWaitError(error, connected, context, *raw, QStringLiteral("connecting to %1").arg(m_config.address));
            return std::nullopt;
        }
    }

    if (m_config.keepalive.enabled && !applyKeepalive(*socket, m_config.keepalive)) {
        qCWarning(lcAgent) << "Failed to apply keepalive timing on" << m_config.address;
    }

    QTcpSocket *raw = socket.get();
    const QByteArray payload = encodeRequest(m_config.token, action, requestId, fields);
    if (socket->write(payload) != payload.size()) {
        setError(error, ErrorCode::Remote, QStringLiteral("Failed to write %1 request: %2").arg(action, socket->errorString()));
        return std::nullopt;
    }
    while (socket->bytesToWrite() > 0) {
        const WaitOutcome written = waitInSlices(context, *raw, context.remainingMs(m_config.timeout.defaultMs),
                                                 [raw](int slice) { return raw->waitForBytesWritten(slice); });
        if (written != WaitOutcome::Ready) {
            setWaitError(error, written, context, *raw, QStringLiteral("sending %1").arg(action));
            return std::nullopt;
        }
    }

    QByteArray buffer;
    qsizetype newline = -1;
    while (newline < 0) {
        const WaitOutcome readable = waitInSlices(context, *raw, context.remainingMs(m_config.timeout.defaultMs),
                                                  [raw](int slice) { return raw->waitForReadyRead(slice); });
        if (readable != WaitOutcome::Ready) {
            setWaitError(error, readable, context, *raw, QStringLiteral("waiting for %1 response").arg(action));
            return std::nullopt;
        }
        buffer.append(socket->readAll());
        if (buffer.size() > kMaxResponseBytes) {
            setError(error, ErrorCode::Remote, QStringLiteral("Agent response exceeds %1 bytes").arg(kMaxResponseBytes));
            return std::nullopt;
        }
        newline = buffer.indexOf('\n');
    }
    socket->disconnectFromHost();

    QString decodeError;
    std::optional<QJsonObject> response = decodeResponse(buffer.left(newline), &decodeError);
    if (!response.has_value()) {
        setError(error, ErrorCode::Remote, decodeError);
        return std::nullopt;
    }

    qCDebug(lcAgent) << "Agent answered" << action << "request" << requestId
                     << "ok:" << response->value(QStringLiteral("ok")).toBool();
    return response;
}
