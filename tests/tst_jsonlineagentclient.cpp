#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutex>
#include <QMutexLocker>
#include <QSemaphore>
#include <QTcpServer>
#include <QTcpSocket>
#include <QThread>
#include <QtTest>

#include <utility>

#ifdef Q_OS_LINUX
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#endif

#ifndef Q_MOC_RUN
import corebridge.backend.jsonlineagentclient;
#endif

namespace {
//! Accepts one connection, records the request line and answers with a canned response.
class OneShotServer : public QThread
{
public:
    explicit OneShotServer(QByteArray response)
        : m_response(std::move(response))
    {
    }

    quint16 waitForPort()
    {
        m_ready.acquire();
        return m_port;
    }

    QByteArray request() const
    {
        QMutexLocker locker(&m_mutex);
        return m_request;
    }

protected:
    void run() override
    {
        QTcpServer server;
        if (server.listen(QHostAddress::LocalHost, 0)) {
            m_port = server.serverPort();
        }
        m_ready.release();
        if (!server.isListening() || !server.waitForNewConnection(5000)) {
            return;
        }

        QTcpSocket *socket = server.nextPendingConnection();
        QByteArray line;
        while (!line.contains('\n') && socket->waitForReadyRead(5000)) {
            line += socket->readAll();
        }
        {
            QMutexLocker locker(&m_mutex);
            m_request = line;
        }

        if (!m_response.isEmpty()) {
            socket->write(m_response);
            socket->waitForBytesWritten(5000);
        }
        if (socket->state() == QAbstractSocket::ConnectedState) {
            socket->waitForDisconnected(5000);
        }
    }

private:
    QByteArray m_response;
    QSemaphore m_ready;
    quint16 m_port = 0;
    mutable QMutex m_mutex;
    QByteArray m_request;
};

AgentClientConfig configFor(quint16 port)
{
    AgentClientConfig config;
    config.address = QStringLiteral("127.0.0.1:%1").arg(port);
    config.token = QStringLiteral("secret-token");
    config.timeout.defaultMs = 2000;
    config.timeout.connectMs = 2000;
    return config;
}

AgentSwitchRequest switchRequest()
{
    AgentSwitchRequest request;
    request.fromInstanceId = QStringLiteral("node-1");
    request.toCoreType = QStringLiteral("xray");
    request.configJson = R"({"inbounds": []})";
    request.switchId = QStringLiteral("switch-1-abc");
    request.listenPorts = {443, 8443};
    request.zeroDowntime = true;
    return request;
}
}

class TestJsonLineAgentClient : public QObject
{
    Q_OBJECT

private slots:
    void normalizesAddresses_data();
    void normalizesAddresses();
    void encodesRequestLine();
    void decodesResponses();
    void decodesSwitchFailures();
    void switchRoundTrip();
    void getCoresRoundTrip();
    void cancelledBeforeConnect();
    void rejectsInvalidAddress();
    void reportsRefusedConnection();
    void timesOutWaitingForResponse();
    void appliesKeepaliveTiming();
};

void TestJsonLineAgentClient::normalizesAddresses_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("bare host") << QStringLiteral("10.0.0.5") << QStringLiteral("10.0.0.5:19090");
    QTest::newRow("host and port") << QStringLiteral(" agent.local:7000 ") << QStringLiteral("agent.local:7000");
    QTest::newRow("bare ipv6") << QStringLiteral("fd00::1") << QStringLiteral("[fd00::1]:19090");
    QTest::newRow("bracketed ipv6") << QStringLiteral("[fd00::1]") << QStringLiteral("[fd00::1]:19090");
    QTest::newRow("bracketed with port") << QStringLiteral("[fd00::1]:7000") << QStringLiteral("[fd00::1]:7000");
}

void TestJsonLineAgentClient::normalizesAddresses()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(normalizeAgentAddress(input, 19090), expected);
}

void TestJsonLineAgentClient::encodesRequestLine()
{
    const QByteArray line = JsonLineAgentClient::encodeRequest(QStringLiteral("t0k"), QStringLiteral("switch_core"),
                                                               QStringLiteral("req-1"),
                                                               JsonLineAgentClient::switchRequestFields(switchRequest()));
    QVERIFY(line.endsWith('\n'));
    QCOMPARE(line.count('\n'), 1);

    const QJsonObject object = QJsonDocument::fromJson(line).object();
    QCOMPARE(object.value(QStringLiteral("token")).toString(), QStringLiteral("t0k"));
    QCOMPARE(object.value(QStringLiteral("action")).toString(), QStringLiteral("switch_core"));
    QCOMPARE(object.value(QStringLiteral("request_id")).toString(), QStringLiteral("req-1"));
    QCOMPARE(object.value(QStringLiteral("config_json")).toString(), QStringLiteral(R"({"inbounds": []})"));
    QCOMPARE(object.value(QStringLiteral("listen_ports")).toArray(), (QJsonArray {443, 8443}));
    QVERIFY(object.value(QStringLiteral("zero_downtime")).toBool());
}

void TestJsonLineAgentClient::decodesResponses()
{
    QString message;
    QVERIFY(!JsonLineAgentClient::decodeResponse("not json", &message).has_value());
    QVERIFY(message.startsWith(QStringLiteral("Invalid agent response")));
    QVERIFY(!JsonLineAgentClient::decodeResponse("[1]").has_value());

    const QJsonObject rejected {{QStringLiteral("ok"), false}, {QStringLiteral("message"), QStringLiteral("unauthorized")}};
    QVERIFY(!JsonLineAgentClient::decodeCores(rejected, &message).has_value());
    QCOMPARE(message, QStringLiteral("unauthorized"));

    const std::optional<QJsonObject> ok = JsonLineAgentClient::decodeResponse(
        R"({"ok": true, "cores": [{"type": "xray", "version": "1.8.4", "installed": true, "capabilities": ["reality"]}, 5]})");
    QVERIFY(ok.has_value());
    const std::optional<QList<CoreInfo>> cores = JsonLineAgentClient::decodeCores(ok.value());
    QVERIFY(cores.has_value());
    QCOMPARE(cores->size(), 1);
    QCOMPARE(cores->constFirst().version, QStringLiteral("1.8.4"));
    QVERIFY(cores->constFirst().installed);
    QCOMPARE(cores->constFirst().capabilities, QStringList {QStringLiteral("reality")});
}

void TestJsonLineAgentClient::decodesSwitchFailures()
{
    AgentSwitchResponse response = JsonLineAgentClient::decodeSwitchResponse(
        QJsonObject {{QStringLiteral("ok"), false}, {QStringLiteral("message"), QStringLiteral("config rejected")}});
    QVERIFY(!response.ok);
    QCOMPARE(response.error, QStringLiteral("config rejected"));

    response = JsonLineAgentClient::decodeSwitchResponse(QJsonObject {{QStringLiteral("ok"), false}});
    QCOMPARE(response.error, QStringLiteral("Agent rejected switch_core."));

    response = JsonLineAgentClient::decodeSwitchResponse(
        QJsonObject {{QStringLiteral("ok"), true}, {QStringLiteral("new_instance_id"), QStringLiteral(" node-2 ")}});
    QVERIFY(response.ok);
    QCOMPARE(response.newInstanceId, QStringLiteral("node-2"));
    QVERIFY(response.error.isEmpty());
}

void TestJsonLineAgentClient::switchRoundTrip()
{
    OneShotServer server(R"({"ok": true, "new_instance_id": "node-2", "message": "started"})" "\n");
    server.start();
    const quint16 port = server.waitForPort();
    QVERIFY(port != 0);

    JsonLineAgentClient client(configFor(port));
    PipelineError error;
    const std::optional<AgentSwitchResponse> response = client.switchCore(CallContext::withTimeout(5000), switchRequest(), &error);
    QVERIFY(server.wait(10000));
    QVERIFY2(response.has_value(), qPrintable(error.toString()));
    QVERIFY(response->ok);
    QCOMPARE(response->newInstanceId, QStringLiteral("node-2"));
    QCOMPARE(response->message, QStringLiteral("started"));

    const QJsonObject sent = QJsonDocument::fromJson(server.request().trimmed()).object();
    QCOMPARE(sent.value(QStringLiteral("token")).toString(), QStringLiteral("secret-token"));
    QCOMPARE(sent.value(QStringLiteral("action")).toString(), QStringLiteral("switch_core"));
    QCOMPARE(sent.value(QStringLiteral("switch_id")).toString(), QStringLiteral("switch-1-abc"));
    QVERIFY(!sent.value(QStringLiteral("request_id")).toString().isEmpty());
}

void TestJsonLineAgentClient::getCoresRoundTrip()
{
    OneShotServer server(R"({"ok": true, "cores": [{"type": "sing-box", "version": "1.10.1", "installed": true}]})" "\n");
    server.start();
    const quint16 port = server.waitForPort();
    QVERIFY(port != 0);

    JsonLineAgentClient client(configFor(port));
    PipelineError error;
    const std::optional<QList<CoreInfo>> cores = client.getCores(CallContext(), &error);
    QVERIFY(server.wait(10000));
    QVERIFY2(cores.has_value(), qPrintable(error.toString()));
    QCOMPARE(cores->size(), 1);
    QCOMPARE(cores->constFirst().type, QStringLiteral("sing-box"));
    QCOMPARE(QJsonDocument::fromJson(server.request().trimmed()).object().value(QStringLiteral("action")).toString(),
             QStringLiteral("get_cores"));
}

void TestJsonLineAgentClient::cancelledBeforeConnect()
{
    JsonLineAgentClient client(configFor(1));
    const CallContext context;
    context.cancel(QStringLiteral("shutting down"));

    PipelineError error;
    QVERIFY(!client.switchCore(context, switchRequest(), &error).has_value());
    QCOMPARE(error.code, ErrorCode::Cancelled);
    QCOMPARE(error.message, QStringLiteral("shutting down"));
}

void TestJsonLineAgentClient::rejectsInvalidAddress()
{
    AgentClientConfig config = configFor(1);
    config.address = QStringLiteral("no-port");
    JsonLineAgentClient client(config);

    PipelineError error;
    QVERIFY(!client.getCores(CallContext(), &error).has_value());
    QCOMPARE(error.code, ErrorCode::Remote);
    QVERIFY(error.message.contains(QStringLiteral("no-port")));
}

void TestJsonLineAgentClient::reportsRefusedConnection()
{
    JsonLineAgentClient client(configFor(1));
    PipelineError error;
    QVERIFY(!client.switchCore(CallContext::withTimeout(3000), switchRequest(), &error).has_value());
    QCOMPARE(error.code, ErrorCode::Remote);
    QVERIFY(error.message.contains(QStringLiteral("connecting to 127.0.0.1:1")));
}

void TestJsonLineAgentClient::timesOutWaitingForResponse()
{
    OneShotServer server {QByteArray()};
    server.start();
    const quint16 port = server.waitForPort();
    QVERIFY(port != 0);

    AgentClientConfig config = configFor(port);
    config.timeout.defaultMs = 300;
    JsonLineAgentClient client(config);

    PipelineError error;
    QVERIFY(!client.switchCore(CallContext(), switchRequest(), &error).has_value());
    QCOMPARE(error.code, ErrorCode::Remote);
    QCOMPARE(error.message, QStringLiteral("Timed out while waiting for switch_core response"));
    QVERIFY(server.wait(10000));
}

void TestJsonLineAgentClient::appliesKeepaliveTiming()
{
    OneShotServer server {QByteArray()};
    server.start();
    const quint16 port = server.waitForPort();
    QVERIFY(port != 0);

    AgentKeepaliveConfig keepalive;
    keepalive.timeMs = 45000;
    keepalive.timeoutMs = 2500;

    QTcpSocket socket;
#ifdef Q_OS_LINUX
    QVERIFY(!JsonLineAgentClient::applyKeepalive(socket, keepalive));
#endif
    socket.connectToHost(QHostAddress::LocalHost, port);
    QVERIFY(socket.waitForConnected(5000));
    QVERIFY(JsonLineAgentClient::applyKeepalive(socket, keepalive));
    QCOMPARE(socket.socketOption(QAbstractSocket::KeepAliveOption).toInt(), 1);

#ifdef Q_OS_LINUX
    const int fd = static_cast<int>(socket.socketDescriptor());
    int value = 0;
    socklen_t length = sizeof(value);
    QCOMPARE(::getsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &value, &length), 0);
    QCOMPARE(value, 45);
    length = sizeof(value);
    QCOMPARE(::getsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &value, &length), 0);
    QCOMPARE(value, 3);
    length = sizeof(value);
    QCOMPARE(::getsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &value, &length), 0);
    QCOMPARE(value, 1);
#endif

    socket.write("\n");
    socket.waitForBytesWritten(5000);
    socket.disconnectFromHost();
    QVERIFY(server.wait(10000));
}

QTEST_GUILESS_MAIN(TestJsonLineAgentClient)
#include "tst_jsonlineagentclient.moc"
