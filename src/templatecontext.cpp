module;
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

module corebridge.backend.templatecontext;
import corebridge.backend.jsonsupport;

QJsonObject OutboundConfig::toJson() const
{
    QJsonObject json = settings;
    json.insert(QStringLiteral("type"), type);
    json.insert(QStringLiteral("tag"), tag);
    return json;
}

QJsonObject UserConfig::toJson() const
{
    return QJsonObject {
        {QStringLiteral("id"), id},
        {QStringLiteral("uuid"), uuid},
        {QStringLiteral("email"), email},
        {QStringLiteral("password"), password.isEmpty() ? uuid : password},
        {QStringLiteral("flow"), flow}
    };
}

UserConfig UserConfig::fromJson(const QJsonObject& json)
{
    UserConfig user;
    user.id = json.value(QStringLiteral("id")).toInteger();
    user.uuid = json.value(QStringLiteral("uuid")).toString().trimmed();
    user.email = json.value(QStringLiteral("email")).toString().trimmed();
    user.password = json.value(QStringLiteral("password")).toString();
    user.flow = json.value(QStringLiteral("flow")).toString().trimmed();
    return user;
}

QJsonObject AgentInfo::toJson() const
{
    return QJsonObject {
        {QStringLiteral("id"), id},
        {QStringLiteral("name"), name},
        {QStringLiteral("host"), host},
        {QStringLiteral("core_type"), coreType},
        {QStringLiteral("core_version"), coreVersion},
        {QStringLiteral("capabilities"), toJsonArray(capabilities)},
        {QStringLiteral("build_tags"), toJsonArray(buildTags)}
    };
}

QJsonObject ServerInfo::toJson() const
{
    return QJsonObject {
        {QStringLiteral("log_level"), logLevel},
        {QStringLiteral("listen_addr"), listenAddr},
        {QStringLiteral("dns_server"), dnsServer},
        {QStringLiteral("stats_enabled"), statsEnabled},
        {QStringLiteral("api_port"), static_cast<int>(apiPort)}
    };
}

QJsonObject TemplateContext::toJson() const
{
    QJsonArray inboundArray;
    for (const Inbound& inbound : inbounds) {
        inboundArray.append(inbound.toJson());
    }
    QJsonArray outboundArray;
    for (const OutboundConfig& outbound : outbounds) {
        outboundArray.append(outbound.toJson());
    }
    QJsonArray userArray;
    for (const UserConfig& user : users) {
        userArray.append(user.toJson());
    }

    return QJsonObject {
        {QStringLiteral("inbounds"), inboundArray},
        {QStringLiteral("outbounds"), outboundArray},
        {QStringLiteral("users"), userArray},
        {QStringLiteral("agent"), agent.toJson()},
        {QStringLiteral("server"), server.toJson()},
        {QStringLiteral("dns"), dns},
        {QStringLiteral("route"), route},
        {QStringLiteral("experimental"), experimental}
    };
}

TemplateContext TemplateContext::sample()
{
    TemplateContext ctx;

    Inbound vless;
    vless.type = QStringLiteral("vless");
    vless.tag = QStringLiteral("vless-in");
    vless.listen = QStringLiteral("::");
    vless.listenPort = 443;
    vless.users.append(InboundUser {
        QStringLiteral("00000000-0000-0000-0000-000000000001"),
        QStringLiteral("user@example.com"),
        QString(),
        QStringLiteral("xtls-rprx-vision"),
        QString()
    });
    RealitySettings reality;
    reality.enabled = true;
    reality.serverNames = {QStringLiteral("www.google.com")};
    reality.shortIds = {QStringLiteral("0123456789abcdef")};
    reality.privateKey = QStringLiteral("sample-private-key");
    reality.handshake = RealityHandshake {QStringLiteral("www.google.com"), 443};
    InboundTls tls;
    tls.enabled = true;
    tls.serverName = QStringLiteral("www.google.com");
    tls.reality = reality;
    vless.tls = tls;
    vless.refreshRequiredCapabilities();
    ctx.inbounds.append(vless);

    Inbound shadowsocks;
    shadowsocks.type = QStringLiteral("shadowsocks");
    shadowsocks.tag = QStringLiteral("ss-in");
    shadowsocks.listen = QStringLiteral("::");
    shadowsocks.listenPort = 8388;
    shadowsocks.options.insert(QStringLiteral("method"), QStringLiteral("2022-blake3-aes-128-gcm"));
    shadowsocks.users.append(InboundUser {
        QString(),
        QStringLiteral("user@example.com"),
        QStringLiteral("password123"),
        QString(),
        QStringLiteral("2022-blake3-aes-128-gcm")
    });
    shadowsocks.refreshRequiredCapabilities();
    ctx.inbounds.append(shadowsocks);

    ctx.outbounds = {
        OutboundConfig {QStringLiteral("direct"), QStringLiteral("direct"), {}},
        OutboundConfig {QStringLiteral("block"), QStringLiteral("block"), {}}
    };

    ctx.users = {
        UserConfig {1, QStringLiteral("00000000-0000-0000-0000-000000000001"), QStringLiteral("user@example.com"), QString(), QStringLiteral("xtls-rprx-vision")},
        UserConfig {2, QStringLiteral("00000000-0000-0000-0000-000000000002"), QStringLiteral("user2@example.com"), QString(), QString()}
    };

    ctx.agent.id = 1;
    ctx.agent.name = QStringLiteral("sample-agent");
    ctx.agent.host = QStringLiteral("127.0.0.1");
    ctx.agent.coreType = QStringLiteral("sing-box");
    ctx.agent.coreVersion = QStringLiteral("1.10.0");
    ctx.agent.capabilities = {QStringLiteral("reality"), QStringLiteral("multiplex"), QStringLiteral("v2ray_api")};
    ctx.agent.buildTags = {QStringLiteral("with_v2ray_api"), QStringLiteral("with_quic")};

    ctx.server.logLevel = QStringLiteral("info");
    ctx.server.listenAddr = QStringLiteral("::");
    ctx.server.dnsServer = QStringLiteral("8.8.8.8");
    ctx.server.statsEnabled = true;

    return ctx;
}
