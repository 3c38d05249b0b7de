module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QLoggingCategory>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVariant>

#include <optional>

module corebridge.backend.xraycodec;
import corebridge.backend.jsonsupport;

namespace {
Q_LOGGING_CATEGORY(lcCodec, "corebridge.codec")

const QString kDefaultShadowsocksMethod = QStringLiteral("aes-256-gcm");
const QString kDefaultVlessFlow = QStringLiteral("xtls-rprx-vision");

const QSet<QString>& supportedProtocols()
{
    static const QSet<QString> protocols {
        QStringLiteral("vless"),
        QStringLiteral("vmess"),
        QStringLiteral("trojan"),
        QStringLiteral("shadowsocks"),
        QStringLiteral("socks"),
        QStringLiteral("http"),
        QStringLiteral("dokodemo-door")
    };
    return protocols;
}

// Options each protocol can express in Xray settings.
QSet<QString> carriedOptions(const QString& protocol)
{
    if (protocol == QStringLiteral("shadowsocks")) {
        return {QStringLiteral("method"), QStringLiteral("password"), QStringLiteral("network")};
    }
    if (protocol == QStringLiteral("dokodemo-door")) {
        return {QStringLiteral("network"), QStringLiteral("address"), QStringLiteral("port")};
    }
    return {};
}

void appendWarning(QStringList *warnings, const QString& warning)
{
    if (warnings) {
        warnings->append(warning);
    }
}

// Reads an optional sub-object; present but non-object values are reported and read as empty.
QJsonObject subObject(const QJsonObject& json, const QString& key, const QString& label, QStringList *warnings)
{
    const QJsonValue value = json.value(key);
    if (value.isUndefined() || value.isNull()) {
        return QJsonObject();
    }
    if (!value.isObject()) {
        appendWarning(warnings, QStringLiteral("inbound '%1': %2 is not an object; skipped").arg(label, key));
        return QJsonObject();
    }
    return value.toObject();
}

QString droppedWarning(const Inbound& inbound, const QString& what)
{
    return QStringLiteral("inbound '%1': %2 has no xray equivalent and was dropped")
        .arg(inbound.displayTag(), what);
}

QString elementLabel(const QJsonObject& json, int index)
{
    const QString tag = json.value(QStringLiteral("tag")).toString().trimmed();
    return tag.isEmpty() ? QStringLiteral("inbounds[%1]").arg(index) : QStringLiteral("inbound '%1'").arg(tag);
}

QString normalizeNetwork(const QString& network)
{
    const QString lowered = network.trimmed().toLower();
    if (lowered.isEmpty() || lowered == QStringLiteral("raw")) {
        return QStringLiteral("tcp");
    }
    if (lowered == QStringLiteral("h2")) {
        return QStringLiteral("http");
    }
    if (lowered == QStringLiteral("splithttp")) {
        return QStringLiteral("xhttp");
    }
    return lowered;
}

std::optional<RealityHandshake> parseDestination(const QJsonValue& value)
{
    if (value.isDouble()) {
        return RealityHandshake {QString(), static_cast<quint16>(value.toInt())};
    }

    const QString dest = value.toString().trimmed();
    if (dest.isEmpty()) {
        return std::nullopt;
    }

    const qsizetype colon = dest.lastIndexOf(QLatin1Char(':'));
    if (colon < 0) {
        bool numeric = false;
        const int port = dest.toInt(&numeric);
        if (numeric) {
            return RealityHandshake {QString(), static_cast<quint16>(port)};
        }
        return RealityHandshake {dest, 443};
    }

    QString host = dest.left(colon);
    if (host.startsWith(QLatin1Char('[')) && host.endsWith(QLatin1Char(']'))) {
        host = host.mid(1, host.size() - 2);
    }
    return RealityHandshake {host, static_cast<quint16>(dest.mid(colon + 1).toInt())};
}

QString formatDestination(const RealityHandshake& handshake)
{
    QString host = handshake.server;
    if (host.contains(QLatin1Char(':'))) {
        host = QStringLiteral("[%1]").arg(host);
    }
    const quint16 port = handshake.serverPort == 0 ? 443 : handshake.serverPort;
    return QStringLiteral("%1:%2").arg(host, QString::number(port));
}

void parseUsers(const QJsonObject& settings,
                const QString& key,
                const QString& label,
                Inbound& inbound,
                QStringList *warnings)
{
    const QJsonValue list = settings.value(key);
    if (list.isUndefined() || list.isNull()) {
        return;
    }
    if (!list.isArray()) {
        appendWarning(warnings, QStringLiteral("%1: settings.%2 must be an array; users skipped").arg(label, key));
        return;
    }

    int index = 0;
    for (const QJsonValue& value : list.toArray()) {
        if (!value.isObject()) {
            appendWarning(warnings, QStringLiteral("%1: settings.%2[%3] is not an object; skipped")
                              .arg(label, key).arg(index));
            ++index;
            continue;
        }

        const QJsonObject client = value.toObject();
        InboundUser user;
        user.uuid = client.value(QStringLiteral("id")).toString().trimmed();
        user.name = client.value(QStringLiteral("email")).toString().trimmed();
        user.password = client.value(QStringLiteral("password")).toString();
        user.flow = client.value(QStringLiteral("flow")).toString().trimmed();
        user.method = client.value(QStringLiteral("method")).toString().trimmed();
        if (key == QStringLiteral("accounts")) {
            user.name = client.value(QStringLiteral("user")).toString().trimmed();
            user.password = client.value(QStringLiteral("pass")).toString();
        }
        inbound.users.append(user);
        ++index;
    }
}

void parseSettings(const QJsonObject& settings, const QString& label, Inbound& inbound, QStringList *warnings)
{
    const QString& protocol = inbound.type;
    if (protocol == QStringLiteral("socks") || protocol == QStringLiteral("http")) {
        parseUsers(settings, QStringLiteral("accounts"), label, inbound, warnings);
        return;
    }

    parseUsers(settings, QStringLiteral("clients"), label, inbound, warnings);

    for (const QString& key : carriedOptions(protocol)) {
        if (key == QStringLiteral("password")) {
            continue;
        }
        const QJsonValue value = settings.value(key);
        if (value.isString() && !value.toString().trimmed().isEmpty()) {
            inbound.options.insert(key, value.toString().trimmed());
        } else if (value.isDouble()) {
            inbound.options.insert(key, value.toInt());
        }
    }

    if (protocol == QStringLiteral("shadowsocks")) {
        const QString password = settings.value(QStringLiteral("password")).toString();
        if (!password.isEmpty() && !inbound.users.isEmpty()) {
            // Multi-user 2022 ciphers keep a server key beside the clients.
            inbound.options.insert(QStringLiteral("password"), password);
        } else if (!password.isEmpty()) {
            InboundUser user;
            user.password = password;
            user.name = settings.value(QStringLiteral("email")).toString().trimmed();
            user.method = settings.value(QStringLiteral("method")).toString().trimmed();
            inbound.users.append(user);
        }
    }
}

QJsonArray buildClients(const Inbound& inbound, QStringList *warnings)
{
    QJsonArray clients;
    const QString& protocol = inbound.type;
    bool droppedFlow = false;

    for (const InboundUser& user : inbound.users) {
        QJsonObject client;
        if (protocol == QStringLiteral("vless") || protocol == QStringLiteral("vmess")) {
            client.insert(QStringLiteral("id"), user.uuid);
        }
        if (protocol == QStringLiteral("trojan") || protocol == QStringLiteral("shadowsocks")) {
            client.insert(QStringLiteral("password"), user.password.isEmpty() ? user.uuid : user.password);
        }
        if (!user.name.isEmpty()) {
            client.insert(QStringLiteral("email"), user.name);
        }

        if (protocol == QStringLiteral("vless")) {
            if (inbound.hasReality()) {
                client.insert(QStringLiteral("flow"), user.flow.isEmpty() ? kDefaultVlessFlow : user.flow);
            } else if (!user.flow.isEmpty()) {
                droppedFlow = true;
            }
        }
        if (protocol == QStringLiteral("vmess")) {
            client.insert(QStringLiteral("alterId"), 0);
        }
        if (protocol == QStringLiteral("shadowsocks") && !user.method.isEmpty()) {
            client.insert(QStringLiteral("method"), user.method);
        }
        clients.append(client);
    }

    if (droppedFlow) {
        appendWarning(warnings, QStringLiteral("inbound '%1': vless flow requires reality and was dropped")
                          .arg(inbound.displayTag()));
    }
    return clients;
}
}

bool XrayCodec::canParse(const QByteArray& raw)
{
    const std::optional<QJsonDocument> doc = parseJsonDocument(raw);
    if (!doc.has_value()) {
        return false;
    }

    const QJsonArray inbounds = doc->isArray()
        ? doc->array()
        : doc->object().value(QStringLiteral("inbounds")).toArray();
    for (const QJsonValue& value : inbounds) {
        const QJsonObject inbound = value.toObject();
        if (inbound.contains(QStringLiteral("protocol")) || inbound.contains(QStringLiteral("streamSettings"))) {
            return true;
        }
    }
    return false;
}

std::optional<CodecParseResult> XrayCodec::parse(const QString& fileName,
                                                 const QByteArray& raw,
                                                 QString *errorMessage)
{
    QString parseError;
    const std::optional<QJsonDocument> doc = parseJsonDocument(raw, &parseError);
    if (!doc.has_value()) {
        setError(errorMessage, QStringLiteral("%1: %2").arg(fileName, parseError));
        return std::nullopt;
    }

    QJsonArray inbounds;
    if (doc->isArray()) {
        inbounds = doc->array();
    } else {
        const QJsonValue value = doc->object().value(QStringLiteral("inbounds"));
        if (!value.isUndefined() && !value.isArray()) {
            setError(errorMessage, QStringLiteral("%1: \"inbounds\" must be an array.").arg(fileName));
            return std::nullopt;
        }
        inbounds = value.toArray();
    }

    CodecParseResult result;
    int index = 0;
    for (const QJsonValue& value : inbounds) {
        if (!value.isObject()) {
            result.warnings.append(QStringLiteral("%1: inbounds[%2] is not an object; skipped").arg(fileName).arg(index));
            ++index;
            continue;
        }

        std::optional<Inbound> inbound = parseInbound(value.toObject(), index, &result.warnings);
        if (inbound.has_value()) {
            result.inbounds.append(inbound.value());
        }
        ++index;
    }

    qCDebug(lcCodec) << "Parsed" << result.inbounds.size() << "xray inbound(s) from" << fileName
                     << "with" << result.warnings.size() << "warning(s)";
    return result;
}

std::optional<Inbound> XrayCodec::parseInbound(const QJsonObject& json, int index, QStringList *warnings)
{
    const QString label = elementLabel(json, index);

    Inbound inbound;
    inbound.type = json.value(QStringLiteral("protocol")).toString().trimmed().toLower();
    if (inbound.type.isEmpty()) {
        appendWarning(warnings, QStringLiteral("%1: missing protocol; skipped").arg(label));
        return std::nullopt;
    }

    inbound.tag = json.value(QStringLiteral("tag")).toString().trimmed();
    inbound.listen = json.value(QStringLiteral("listen")).toString().trimmed();

    bool portOk = true;
    inbound.listenPort = static_cast<quint16>(jsonPort(json.value(QStringLiteral("port")), &portOk));
    if (!portOk) {
        appendWarning(warnings, QStringLiteral("%1: port '%2' is not a single port; recorded as 0")
                          .arg(label, json.value(QStringLiteral("port")).toVariant().toString()));
    }

    const QJsonValue settings = json.value(QStringLiteral("settings"));
    if (settings.isObject()) {
        parseSettings(settings.toObject(), label, inbound, warnings);
    } else if (!settings.isUndefined() && !settings.isNull()) {
        appendWarning(warnings, QStringLiteral("%1: settings is not an object; protocol settings skipped").arg(label));
    }

    const QJsonValue stream = json.value(QStringLiteral("streamSettings"));
    if (stream.isObject()) {
        parseStreamSettings(stream.toObject(), inbound, warnings);
    } else if (!stream.isUndefined() && !stream.isNull()) {
        appendWarning(warnings, QStringLiteral("%1: streamSettings is not an object; transport skipped").arg(label));
    }

    inbound.refreshRequiredCapabilities();
    return inbound;
}

void XrayCodec::parseStreamSettings(const QJsonObject& stream, Inbound& inbound, QStringList *warnings)
{
    const QString label = inbound.tag.isEmpty() ? inbound.displayTag() : inbound.tag;

    InboundTransport transport;
    transport.type = normalizeNetwork(stream.value(QStringLiteral("network")).toString());

    if (transport.type == QStringLiteral("ws")) {
        const QJsonObject ws = subObject(stream, QStringLiteral("wsSettings"), label, warnings);
        transport.path = ws.value(QStringLiteral("path")).toString().trimmed();
        transport.host = ws.value(QStringLiteral("host")).toString().trimmed();
        if (transport.host.isEmpty()) {
            transport.host = ws.value(QStringLiteral("headers")).toObject().value(QStringLiteral("Host")).toString().trimmed();
        }
    } else if (transport.type == QStringLiteral("grpc")) {
        transport.serviceName = subObject(stream, QStringLiteral("grpcSettings"), label, warnings)
                                    .value(QStringLiteral("serviceName")).toString().trimmed();
    } else if (transport.type == QStringLiteral("http")) {
        const QJsonObject http = subObject(stream, QStringLiteral("httpSettings"), label, warnings);
        transport.path = http.value(QStringLiteral("path")).toString().trimmed();
        const QStringList hosts = jsonStringList(http.value(QStringLiteral("host")));
        transport.host = hosts.isEmpty() ? QString() : hosts.constFirst();
    } else if (transport.type == QStringLiteral("httpupgrade")) {
        const QJsonObject upgrade = subObject(stream, QStringLiteral("httpupgradeSettings"), label, warnings);
        transport.path = upgrade.value(QStringLiteral("path")).toString().trimmed();
        transport.host = upgrade.value(QStringLiteral("host")).toString().trimmed();
    } else if (transport.type == QStringLiteral("xhttp")) {
        const QString key = stream.contains(QStringLiteral("xhttpSettings")) ? QStringLiteral("xhttpSettings")
                                                                              : QStringLiteral("splithttpSettings");
        const QJsonObject xhttp = subObject(stream, key, label, warnings);
        transport.path = xhttp.value(QStringLiteral("path")).toString().trimmed();
        transport.host = xhttp.value(QStringLiteral("host")).toString().trimmed();
    }
    inbound.transport = transport;

    const QString security = stream.value(QStringLiteral("security")).toString().trimmed().toLower();
    if (security.isEmpty() || security == QStringLiteral("none")) {
        return;
    }

    if (security == QStringLiteral("tls")) {
        const QJsonObject tlsSettings = subObject(stream, QStringLiteral("tlsSettings"), label, warnings);
        InboundTls tls;
        tls.enabled = true;
        tls.serverName = tlsSettings.value(QStringLiteral("serverName")).toString().trimmed();
        tls.alpn = jsonStringList(tlsSettings.value(QStringLiteral("alpn")));
        const QJsonArray certificates = tlsSettings.value(QStringLiteral("certificates")).toArray();
        if (!certificates.isEmpty() && !certificates.first().isObject()) {
            appendWarning(warnings, QStringLiteral("inbound '%1': tlsSettings.certificates[0] is not an object; skipped")
                              .arg(label));
        } else if (!certificates.isEmpty()) {
            const QJsonObject certificate = certificates.first().toObject();
            tls.certificatePath = certificate.value(QStringLiteral("certificateFile")).toString().trimmed();
            tls.keyPath = certificate.value(QStringLiteral("keyFile")).toString().trimmed();
        }
        inbound.tls = tls;
        return;
    }

    if (security == QStringLiteral("reality")) {
        const QJsonValue settingsValue = stream.value(QStringLiteral("realitySettings"));
        if (!settingsValue.isObject()) {
            appendWarning(warnings, QStringLiteral("inbound '%1': security is reality but realitySettings is missing or malformed")
                              .arg(label));
            return;
        }

        const QJsonObject settings = settingsValue.toObject();
        RealitySettings reality;
        reality.enabled = true;
        reality.serverNames = jsonStringList(settings.value(QStringLiteral("serverNames")));
        reality.shortIds = jsonStringList(settings.value(QStringLiteral("shortIds")));
        reality.privateKey = settings.value(QStringLiteral("privateKey")).toString().trimmed();
        reality.publicKey = settings.value(QStringLiteral("publicKey")).toString().trimmed();
        reality.fingerprint = settings.value(QStringLiteral("fingerprint")).toString().trimmed();
        QJsonValue dest = settings.value(QStringLiteral("target"));
        if (dest.isUndefined()) {
            dest = settings.value(QStringLiteral("dest"));
        }
        reality.handshake = parseDestination(dest);

        InboundTls tls;
        tls.enabled = true;
        tls.serverName = reality.serverName();
        tls.reality = reality;
        inbound.tls = tls;
        return;
    }

    appendWarning(warnings, QStringLiteral("inbound '%1': unsupported security '%2' ignored").arg(label, security));
}

CodecSerializeResult XrayCodec::serialize(const QList<Inbound>& inbounds)
{
    CodecSerializeResult result;
    QJsonArray array;
    for (const Inbound& inbound : inbounds) {
        const std::optional<QJsonObject> json = buildInbound(inbound, &result.warnings);
        if (json.has_value()) {
            array.append(json.value());
        }
    }
    result.config.insert(QStringLiteral("inbounds"), array);
    return result;
}

std::optional<QJsonObject> XrayCodec::buildInbound(const Inbound& inbound, QStringList *warnings)
{
    if (!supportedProtocols().contains(inbound.type)) {
        appendWarning(warnings, droppedWarning(inbound, QStringLiteral("protocol %1").arg(inbound.type)));
        return std::nullopt;
    }

    QJsonObject json {
        {QStringLiteral("tag"), inbound.tag},
        {QStringLiteral("port"), static_cast<int>(inbound.listenPort)},
        {QStringLiteral("protocol"), inbound.type},
        {QStringLiteral("settings"), buildSettings(inbound, warnings)}
    };
    if (!inbound.listen.isEmpty()) {
        json.insert(QStringLiteral("listen"), inbound.listen);
    }

    if (inbound.transport.has_value() || (inbound.tls.has_value() && inbound.tls->enabled)) {
        json.insert(QStringLiteral("streamSettings"), buildStreamSettings(inbound, warnings));
    }

    if (inbound.multiplex.has_value()) {
        appendWarning(warnings, droppedWarning(inbound, QStringLiteral("multiplex")));
        if (inbound.multiplex->brutal.has_value()) {
            appendWarning(warnings, droppedWarning(inbound, QStringLiteral("brutal")));
        }
    }

    const QSet<QString> carried = carriedOptions(inbound.type);
    for (auto it = inbound.options.constBegin(); it != inbound.options.constEnd(); ++it) {
        if (!carried.contains(it.key())) {
            appendWarning(warnings, droppedWarning(inbound, QStringLiteral("option '%1'").arg(it.key())));
        }
    }

    return json;
}

QJsonObject XrayCodec::buildSettings(const Inbound& inbound, QStringList *warnings)
{
    const QString& protocol = inbound.type;
    QJsonObject settings;

    if (protocol == QStringLiteral("vless")) {
        settings.insert(QStringLiteral("decryption"), QStringLiteral("none"));
        settings.insert(QStringLiteral("clients"), buildClients(inbound, warnings));
    } else if (protocol == QStringLiteral("vmess") || protocol == QStringLiteral("trojan")) {
        settings.insert(QStringLiteral("clients"), buildClients(inbound, warnings));
    } else if (protocol == QStringLiteral("shadowsocks")) {
        QString method = inbound.options.value(QStringLiteral("method")).toString();
        if (method.isEmpty() && !inbound.users.isEmpty()) {
            method = inbound.users.constFirst().method;
        }
        settings.insert(QStringLiteral("method"), method.isEmpty() ? kDefaultShadowsocksMethod : method);
        settings.insert(QStringLiteral("network"),
                        inbound.options.value(QStringLiteral("network")).toString(QStringLiteral("tcp,udp")));
        const QString password = inbound.options.value(QStringLiteral("password")).toString();
        if (!password.isEmpty()) {
            settings.insert(QStringLiteral("password"), password);
        }
        if (inbound.users.size() == 1 && password.isEmpty()) {
            const InboundUser& user = inbound.users.constFirst();
            settings.insert(QStringLiteral("password"), user.password.isEmpty() ? user.uuid : user.password);
            if (!user.name.isEmpty()) {
                settings.insert(QStringLiteral("email"), user.name);
            }
        } else if (!inbound.users.isEmpty()) {
            settings.insert(QStringLiteral("clients"), buildClients(inbound, warnings));
        }
    } else if (protocol == QStringLiteral("socks") || protocol == QStringLiteral("http")) {
        QJsonArray accounts;
        for (const InboundUser& user : inbound.users) {
            accounts.append(QJsonObject {
                {QStringLiteral("user"), user.name},
                {QStringLiteral("pass"), user.password}
            });
        }
        if (protocol == QStringLiteral("socks")) {
            settings.insert(QStringLiteral("auth"), accounts.isEmpty() ? QStringLiteral("noauth") : QStringLiteral("password"));
            settings.insert(QStringLiteral("udp"), true);
        }
        if (!accounts.isEmpty()) {
            settings.insert(QStringLiteral("accounts"), accounts);
        }
    } else if (protocol == QStringLiteral("dokodemo-door")) {
        settings.insert(QStringLiteral("network"),
                        inbound.options.value(QStringLiteral("network")).toString(QStringLiteral("tcp,udp")));
        const QString address = inbound.options.value(QStringLiteral("address")).toString();
        if (!address.isEmpty()) {
            settings.insert(QStringLiteral("address"), address);
        }
        if (inbound.options.contains(QStringLiteral("port"))) {
            settings.insert(QStringLiteral("port"), inbound.options.value(QStringLiteral("port")).toInt());
        }
    }

    return settings;
}

QJsonObject XrayCodec::buildStreamSettings(const Inbound& inbound, QStringList *warnings)
{
    QString network = inbound.transport.has_value() ? inbound.transport->type : QString();
    if (network.isEmpty()) {
        network = QStringLiteral("tcp");
    }

    QJsonObject stream;
    if (network == QStringLiteral("ws")) {
        QJsonObject wsSettings;
        wsSettings[QStringLiteral("path")] = inbound.transport->path.isEmpty() ? QStringLiteral("/") : inbound.transport->path;
        if (!inbound.transport->host.isEmpty()) {
            wsSettings[QStringLiteral("headers")] = QJsonObject {
                {QStringLiteral("Host"), inbound.transport->host}
            };
        }
        stream[QStringLiteral("wsSettings")] = wsSettings;
    } else if (network == QStringLiteral("grpc")) {
        stream[QStringLiteral("grpcSettings")] = QJsonObject {
            {QStringLiteral("serviceName"), inbound.transport->serviceName}
        };
    } else if (network == QStringLiteral("http")) {
        QJsonObject httpSettings {
            {QStringLiteral("path"), inbound.transport->path.isEmpty() ? QStringLiteral("/") : inbound.transport->path}
        };
        if (!inbound.transport->host.isEmpty()) {
            httpSettings[QStringLiteral("host")] = QJsonArray {inbound.transport->host};
        }
        stream[QStringLiteral("httpSettings")] = httpSettings;
    } else if (network == QStringLiteral("httpupgrade") || network == QStringLiteral("xhttp")) {
        QJsonObject upgradeSettings {
            {QStringLiteral("path"), inbound.transport->path.isEmpty() ? QStringLiteral("/") : inbound.transport->path}
        };
        if (!inbound.transport->host.isEmpty()) {
            upgradeSettings[QStringLiteral("host")] = inbound.transport->host;
        }
        stream[network == QStringLiteral("xhttp") ? QStringLiteral("xhttpSettings") : QStringLiteral("httpupgradeSettings")] =
            upgradeSettings;
    } else if (network == QStringLiteral("tcp")) {
        stream[QStringLiteral("tcpSettings")] = QJsonObject {
            {QStringLiteral("header"), QJsonObject {
                {QStringLiteral("type"), QStringLiteral("none")}
            }}
        };
    } else if (network != QStringLiteral("kcp") && network != QStringLiteral("quic")) {
        appendWarning(warnings, droppedWarning(inbound, QStringLiteral("transport %1").arg(network)));
        network = QStringLiteral("tcp");
    }
    stream[QStringLiteral("network")] = network;

    const bool tlsEnabled = inbound.tls.has_value() && inbound.tls->enabled;
    const QString security = !tlsEnabled
        ? QStringLiteral("none")
        : (inbound.hasReality() ? QStringLiteral("reality") : QStringLiteral("tls"));
    stream[QStringLiteral("security")] = security;

    if (security == QStringLiteral("tls")) {
        QJsonObject tlsSettings;
        if (!inbound.tls->serverName.isEmpty()) {
            tlsSettings[QStringLiteral("serverName")] = inbound.tls->serverName;
        }
        if (!inbound.tls->alpn.isEmpty()) {
            tlsSettings[QStringLiteral("alpn")] = toJsonArray(inbound.tls->alpn);
        }
        if (!inbound.tls->certificatePath.isEmpty() || !inbound.tls->keyPath.isEmpty()) {
            tlsSettings[QStringLiteral("certificates")] = QJsonArray {
                QJsonObject {
                    {QStringLiteral("certificateFile"), inbound.tls->certificatePath},
                    {QStringLiteral("keyFile"), inbound.tls->keyPath}
                }
            };
        }
        stream[QStringLiteral("tlsSettings")] = tlsSettings;
    }

    if (security == QStringLiteral("reality")) {
        const RealitySettings& reality = inbound.tls->reality.value();
        QJsonObject realitySettings {
            {QStringLiteral("show"), false}
        };

        if (reality.handshake.has_value()) {
            realitySettings[QStringLiteral("dest")] = formatDestination(reality.handshake.value());
        }
        QStringList serverNames = reality.serverNames;
        if (serverNames.isEmpty() && !inbound.tls->serverName.isEmpty()) {
            serverNames.append(inbound.tls->serverName);
        }
        if (!serverNames.isEmpty()) {
            realitySettings[QStringLiteral("serverNames")] = toJsonArray(serverNames);
        }
        if (!reality.privateKey.isEmpty()) {
            realitySettings[QStringLiteral("privateKey")] = reality.privateKey;
        }
        if (!reality.publicKey.isEmpty()) {
            realitySettings[QStringLiteral("publicKey")] = reality.publicKey;
        }
        if (!reality.fingerprint.isEmpty()) {
            realitySettings[QStringLiteral("fingerprint")] = reality.fingerprint;
        }
        realitySettings[QStringLiteral("shortIds")] = toJsonArray(reality.shortIds);

        stream[QStringLiteral("realitySettings")] = realitySettings;
    }

    return stream;
}

void XrayCodec::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
