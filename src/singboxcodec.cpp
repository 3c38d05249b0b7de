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

#include <optional>

module corebridge.backend.singboxcodec;
import corebridge.backend.jsonsupport;

namespace {
Q_LOGGING_CATEGORY(lcCodec, "corebridge.codec")

const QString kDefaultShadowsocksMethod = QStringLiteral("aes-256-gcm");
const QString kDefaultVlessFlow = QStringLiteral("xtls-rprx-vision");
const QString kDefaultListen = QStringLiteral("::");

const QSet<QString>& supportedProtocols()
{
    static const QSet<QString> protocols {
        QStringLiteral("vless"),
        QStringLiteral("vmess"),
        QStringLiteral("trojan"),
        QStringLiteral("shadowsocks"),
        QStringLiteral("socks"),
        QStringLiteral("http"),
        QStringLiteral("mixed"),
        QStringLiteral("naive"),
        QStringLiteral("hysteria"),
        QStringLiteral("hysteria2"),
        QStringLiteral("tuic"),
        QStringLiteral("shadowtls"),
        QStringLiteral("anytls"),
        QStringLiteral("direct")
    };
    return protocols;
}

// Scalar inbound fields carried verbatim through Inbound::options.
const QStringList& scalarOptions()
{
    static const QStringList keys {
        QStringLiteral("method"),
        QStringLiteral("network"),
        QStringLiteral("version"),
        QStringLiteral("detour"),
        QStringLiteral("congestion_control"),
        QStringLiteral("zero_rtt_handshake"),
        QStringLiteral("ignore_client_bandwidth")
    };
    return keys;
}

void appendWarning(QStringList *warnings, const QString& warning)
{
    if (warnings) {
        warnings->append(warning);
    }
}

QString droppedWarning(const Inbound& inbound, const QString& what)
{
    return QStringLiteral("inbound '%1': %2 has no sing-box equivalent and was dropped")
        .arg(inbound.displayTag(), what);
}

QString elementLabel(const QJsonObject& json, int index)
{
    const QString tag = json.value(QStringLiteral("tag")).toString().trimmed();
    return tag.isEmpty() ? QStringLiteral("inbounds[%1]").arg(index) : QStringLiteral("inbound '%1'").arg(tag);
}

bool isUserless(const QString& protocol)
{
    return protocol == QStringLiteral("direct");
}

// Reads an optional sub-object; present but non-object values are reported.
std::optional<QJsonObject> subObject(const QJsonObject& json,
                                     const QString& key,
                                     const QString& label,
                                     QStringList *warnings)
{
    const QJsonValue value = json.value(key);
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    if (!value.isObject()) {
        appendWarning(warnings, QStringLiteral("%1: %2 is not an object; skipped").arg(label, key));
        return std::nullopt;
    }
    return value.toObject();
}
}

bool SingBoxCodec::canParse(const QByteArray& raw)
{
    const std::optional<QJsonDocument> doc = parseJsonDocument(raw);
    if (!doc.has_value() || !doc->isObject()) {
        return false;
    }

    const QJsonValue value = doc->object().value(QStringLiteral("inbounds"));
    if (!value.isArray()) {
        return false;
    }

    for (const QJsonValue& entry : value.toArray()) {
        const QJsonObject inbound = entry.toObject();
        if (inbound.contains(QStringLiteral("protocol")) || inbound.contains(QStringLiteral("streamSettings"))) {
            return false;
        }
    }
    return true;
}

std::optional<CodecParseResult> SingBoxCodec::parse(const QString& fileName,
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

    qCDebug(lcCodec) << "Parsed" << result.inbounds.size() << "sing-box inbound(s) from" << fileName
                     << "with" << result.warnings.size() << "warning(s)";
    return result;
}

std::optional<Inbound> SingBoxCodec::parseInbound(const QJsonObject& json, int index, QStringList *warnings)
{
    const QString label = elementLabel(json, index);

    Inbound inbound;
    inbound.type = json.value(QStringLiteral("type")).toString().trimmed().toLower();
    if (inbound.type.isEmpty()) {
        appendWarning(warnings, QStringLiteral("%1: missing type; skipped").arg(label));
        return std::nullopt;
    }
    inbound.tag = json.value(QStringLiteral("tag")).toString().trimmed();
    inbound.listen = json.value(QStringLiteral("listen")).toString().trimmed();

    bool portOk = true;
    inbound.listenPort = static_cast<quint16>(jsonPort(json.value(QStringLiteral("listen_port")), &portOk));
    if (!portOk) {
        appendWarning(warnings, QStringLiteral("%1: listen_port is not a valid port; recorded as 0").arg(label));
    }

    const QJsonValue users = json.value(QStringLiteral("users"));
    if (users.isArray()) {
        int userIndex = 0;
        for (const QJsonValue& value : users.toArray()) {
            if (!value.isObject()) {
                appendWarning(warnings, QStringLiteral("%1: users[%2] is not an object; skipped").arg(label).arg(userIndex));
                ++userIndex;
                continue;
            }
            const QJsonObject entry = value.toObject();
            InboundUser user;
            user.uuid = entry.value(QStringLiteral("uuid")).toString().trimmed();
            user.name = entry.value(QStringLiteral("name")).toString().trimmed();
            if (user.name.isEmpty()) {
                user.name = entry.value(QStringLiteral("username")).toString().trimmed();
            }
            user.password = entry.value(QStringLiteral("password")).toString();
            if (user.password.isEmpty()) {
                user.password = entry.value(QStringLiteral("auth_str")).toString();
            }
            user.flow = entry.value(QStringLiteral("flow")).toString().trimmed();
            inbound.users.append(user);
            ++userIndex;
        }
    } else if (!users.isUndefined() && !users.isNull()) {
        appendWarning(warnings, QStringLiteral("%1: users must be an array; users skipped").arg(label));
    }

    for (const QString& key : scalarOptions()) {
        const QJsonValue value = json.value(key);
        if (value.isString() && !value.toString().trimmed().isEmpty()) {
            inbound.options.insert(key, value.toString().trimmed());
        } else if (value.isBool() || value.isDouble()) {
            inbound.options.insert(key, value);
        }
    }

    if (inbound.type == QStringLiteral("shadowsocks")) {
        const QString password = json.value(QStringLiteral("password")).toString();
        if (!password.isEmpty() && !inbound.users.isEmpty()) {
            inbound.options.insert(QStringLiteral("password"), password);
        } else if (!password.isEmpty()) {
            InboundUser user;
            user.password = password;
            user.method = inbound.options.value(QStringLiteral("method")).toString();
            inbound.users.append(user);
        }
    }

    if (const std::optional<QJsonObject> handshake = subObject(json, QStringLiteral("handshake"), label, warnings)) {
        inbound.options.insert(QStringLiteral("handshake_server"),
                               handshake->value(QStringLiteral("server")).toString().trimmed());
        inbound.options.insert(QStringLiteral("handshake_server_port"),
                               jsonPort(handshake->value(QStringLiteral("server_port"))));
    }

    if (const std::optional<QJsonObject> tls = subObject(json, QStringLiteral("tls"), label, warnings)) {
        InboundTls value;
        value.enabled = tls->value(QStringLiteral("enabled")).toBool(false);
        value.serverName = tls->value(QStringLiteral("server_name")).toString().trimmed();
        value.alpn = jsonStringList(tls->value(QStringLiteral("alpn")));
        value.certificatePath = tls->value(QStringLiteral("certificate_path")).toString().trimmed();
        value.keyPath = tls->value(QStringLiteral("key_path")).toString().trimmed();

        if (const std::optional<QJsonObject> reality = subObject(tls.value(), QStringLiteral("reality"), label, warnings)) {
            RealitySettings settings;
            settings.enabled = reality->value(QStringLiteral("enabled")).toBool(false);
            settings.privateKey = reality->value(QStringLiteral("private_key")).toString().trimmed();
            settings.publicKey = reality->value(QStringLiteral("public_key")).toString().trimmed();
            settings.shortIds = jsonStringList(reality->value(QStringLiteral("short_id")));
            if (const std::optional<QJsonObject> handshake =
                    subObject(reality.value(), QStringLiteral("handshake"), label, warnings);
                handshake.has_value() && !handshake->isEmpty()) {
                settings.handshake = RealityHandshake {
                    handshake->value(QStringLiteral("server")).toString().trimmed(),
                    static_cast<quint16>(jsonPort(handshake->value(QStringLiteral("server_port"))))
                };
            }
            if (!value.serverName.isEmpty()) {
                settings.serverNames.append(value.serverName);
            } else if (settings.handshake.has_value() && !settings.handshake->server.isEmpty()) {
                settings.serverNames.append(settings.handshake->server);
            }
            value.reality = settings;
        }
        inbound.tls = value;
    }

    if (const std::optional<QJsonObject> transport = subObject(json, QStringLiteral("transport"), label, warnings)) {
        InboundTransport value;
        value.type = transport->value(QStringLiteral("type")).toString().trimmed().toLower();
        value.path = transport->value(QStringLiteral("path")).toString().trimmed();
        const QStringList hosts = jsonStringList(transport->value(QStringLiteral("host")));
        value.host = hosts.isEmpty()
            ? transport->value(QStringLiteral("headers")).toObject().value(QStringLiteral("Host")).toString().trimmed()
            : hosts.constFirst();
        value.serviceName = transport->value(QStringLiteral("service_name")).toString().trimmed();
        if (!value.type.isEmpty()) {
            inbound.transport = value;
        } else {
            appendWarning(warnings, QStringLiteral("%1: transport has no type; skipped").arg(label));
        }
    }

    if (const std::optional<QJsonObject> mux = subObject(json, QStringLiteral("multiplex"), label, warnings)) {
        MultiplexSettings value;
        value.enabled = mux->value(QStringLiteral("enabled")).toBool(false);
        value.padding = mux->value(QStringLiteral("padding")).toBool(false);
        if (const std::optional<QJsonObject> brutal = subObject(mux.value(), QStringLiteral("brutal"), label, warnings)) {
            value.brutal = BrutalSettings {
                brutal->value(QStringLiteral("enabled")).toBool(false),
                brutal->value(QStringLiteral("up_mbps")).toInt(),
                brutal->value(QStringLiteral("down_mbps")).toInt()
            };
        }
        inbound.multiplex = value;
    }

    inbound.refreshRequiredCapabilities();
    return inbound;
}

CodecSerializeResult SingBoxCodec::serialize(const QList<Inbound>& inbounds)
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

std::optional<QJsonObject> SingBoxCodec::buildInbound(const Inbound& inbound, QStringList *warnings)
{
    if (!supportedProtocols().contains(inbound.type)) {
        appendWarning(warnings, droppedWarning(inbound, QStringLiteral("protocol %1").arg(inbound.type)));
        return std::nullopt;
    }

    QJsonObject json {
        {QStringLiteral("type"), inbound.type},
        {QStringLiteral("tag"), inbound.tag},
        {QStringLiteral("listen"), inbound.listen.isEmpty() ? kDefaultListen : inbound.listen},
        {QStringLiteral("listen_port"), static_cast<int>(inbound.listenPort)}
    };

    if (inbound.type == QStringLiteral("shadowsocks")) {
        QString method = inbound.options.value(QStringLiteral("method")).toString();
        if (method.isEmpty() && !inbound.users.isEmpty()) {
            method = inbound.users.constFirst().method;
        }
        if (method.isEmpty()) {
            method = kDefaultShadowsocksMethod;
        }
        json.insert(QStringLiteral("method"), method);

        for (const InboundUser& user : inbound.users) {
            if (!user.method.isEmpty() && user.method != method) {
                appendWarning(warnings, droppedWarning(inbound, QStringLiteral("per-user method '%1'").arg(user.method)));
            }
        }

        const QString serverKey = inbound.options.value(QStringLiteral("password")).toString();
        if (!serverKey.isEmpty()) {
            json.insert(QStringLiteral("password"), serverKey);
            json.insert(QStringLiteral("users"), buildUsers(inbound, warnings));
        } else if (inbound.users.size() == 1) {
            const InboundUser& user = inbound.users.constFirst();
            json.insert(QStringLiteral("password"), user.password.isEmpty() ? user.uuid : user.password);
        } else if (!inbound.users.isEmpty()) {
            json.insert(QStringLiteral("users"), buildUsers(inbound, warnings));
        }
    } else if (!isUserless(inbound.type)) {
        json.insert(QStringLiteral("users"), buildUsers(inbound, warnings));
    }

    for (auto it = inbound.options.constBegin(); it != inbound.options.constEnd(); ++it) {
        const QString& key = it.key();
        if (key == QStringLiteral("method") || key == QStringLiteral("password")
            || key == QStringLiteral("handshake_server") || key == QStringLiteral("handshake_server_port")) {
            continue;
        }
        if (scalarOptions().contains(key)) {
            json.insert(key, it.value());
        } else {
            appendWarning(warnings, droppedWarning(inbound, QStringLiteral("option '%1'").arg(key)));
        }
    }

    const QString handshakeServer = inbound.options.value(QStringLiteral("handshake_server")).toString();
    if (!handshakeServer.isEmpty()) {
        json.insert(QStringLiteral("handshake"), QJsonObject {
            {QStringLiteral("server"), handshakeServer},
            {QStringLiteral("server_port"), inbound.options.value(QStringLiteral("handshake_server_port")).toInt(443)}
        });
    }

    if (inbound.tls.has_value()) {
        json.insert(QStringLiteral("tls"), buildTls(inbound, warnings));
    }

    if (const std::optional<QJsonObject> transport = buildTransport(inbound, warnings)) {
        json.insert(QStringLiteral("transport"), transport.value());
    }

    if (inbound.multiplex.has_value()) {
        QJsonObject mux {
            {QStringLiteral("enabled"), inbound.multiplex->enabled}
        };
        if (inbound.multiplex->padding) {
            mux.insert(QStringLiteral("padding"), true);
        }
        if (inbound.multiplex->brutal.has_value()) {
            mux.insert(QStringLiteral("brutal"), QJsonObject {
                {QStringLiteral("enabled"), inbound.multiplex->brutal->enabled},
                {QStringLiteral("up_mbps"), inbound.multiplex->brutal->upMbps},
                {QStringLiteral("down_mbps"), inbound.multiplex->brutal->downMbps}
            });
        }
        json.insert(QStringLiteral("multiplex"), mux);
    }

    return json;
}

QJsonArray SingBoxCodec::buildUsers(const Inbound& inbound, QStringList *warnings)
{
    const QString& protocol = inbound.type;
    QJsonArray users;
    bool droppedFlow = false;

    for (const InboundUser& user : inbound.users) {
        const QString password = user.password.isEmpty() ? user.uuid : user.password;
        QJsonObject entry;

        if (protocol == QStringLiteral("socks") || protocol == QStringLiteral("http")
            || protocol == QStringLiteral("mixed") || protocol == QStringLiteral("naive")) {
            entry.insert(QStringLiteral("username"), user.name);
            entry.insert(QStringLiteral("password"), user.password);
            users.append(entry);
            continue;
        }

        if (!user.name.isEmpty()) {
            entry.insert(QStringLiteral("name"), user.name);
        }

        if (protocol == QStringLiteral("vless")) {
            entry.insert(QStringLiteral("uuid"), user.uuid);
            if (inbound.hasReality()) {
                entry.insert(QStringLiteral("flow"), user.flow.isEmpty() ? kDefaultVlessFlow : user.flow);
            } else if (!user.flow.isEmpty()) {
                droppedFlow = true;
            }
        } else if (protocol == QStringLiteral("vmess")) {
            entry.insert(QStringLiteral("uuid"), user.uuid);
            entry.insert(QStringLiteral("alterId"), 0);
        } else if (protocol == QStringLiteral("tuic")) {
            entry.insert(QStringLiteral("uuid"), user.uuid);
            entry.insert(QStringLiteral("password"), user.password);
        } else if (protocol == QStringLiteral("hysteria")) {
            entry.insert(QStringLiteral("auth_str"), password);
        } else {
            entry.insert(QStringLiteral("password"), password);
        }
        users.append(entry);
    }

    if (droppedFlow) {
        appendWarning(warnings, QStringLiteral("inbound '%1': vless flow requires reality and was dropped")
                          .arg(inbound.displayTag()));
    }
    return users;
}

QJsonObject SingBoxCodec::buildTls(const Inbound& inbound, QStringList *warnings)
{
    const InboundTls& tls = inbound.tls.value();
    QJsonObject json {
        {QStringLiteral("enabled"), tls.enabled}
    };

    QString serverName = tls.serverName;
    if (serverName.isEmpty() && tls.reality.has_value()) {
        serverName = tls.reality->serverName();
    }
    if (!serverName.isEmpty()) {
        json.insert(QStringLiteral("server_name"), serverName);
    }
    if (!tls.alpn.isEmpty()) {
        json.insert(QStringLiteral("alpn"), toJsonArray(tls.alpn));
    }
    if (!tls.certificatePath.isEmpty()) {
        json.insert(QStringLiteral("certificate_path"), tls.certificatePath);
    }
    if (!tls.keyPath.isEmpty()) {
        json.insert(QStringLiteral("key_path"), tls.keyPath);
    }

    if (tls.reality.has_value()) {
        const RealitySettings& reality = tls.reality.value();
        QJsonObject realityJson {
            {QStringLiteral("enabled"), reality.enabled}
        };
        if (reality.handshake.has_value()) {
            realityJson.insert(QStringLiteral("handshake"), QJsonObject {
                {QStringLiteral("server"), reality.handshake->server},
                {QStringLiteral("server_port"), reality.handshake->serverPort == 0 ? 443 : static_cast<int>(reality.handshake->serverPort)}
            });
        }
        if (!reality.privateKey.isEmpty()) {
            realityJson.insert(QStringLiteral("private_key"), reality.privateKey);
        }
        realityJson.insert(QStringLiteral("short_id"), toJsonArray(reality.shortIds));

        if (reality.serverNames.size() > 1) {
            appendWarning(warnings, droppedWarning(inbound, QStringLiteral("reality server names %1")
                                                              .arg(reality.serverNames.mid(1).join(QStringLiteral(", ")))));
        }
        if (!reality.fingerprint.isEmpty()) {
            appendWarning(warnings, droppedWarning(inbound, QStringLiteral("reality fingerprint")));
        }
        if (!reality.publicKey.isEmpty()) {
            appendWarning(warnings, droppedWarning(inbound, QStringLiteral("reality public key")));
        }
        json.insert(QStringLiteral("reality"), realityJson);
    }

    return json;
}

std::optional<QJsonObject> SingBoxCodec::buildTransport(const Inbound& inbound, QStringList *warnings)
{
    if (!inbound.transport.has_value()) {
        return std::nullopt;
    }

    const InboundTransport& transport = inbound.transport.value();
    if (transport.type.isEmpty() || transport.type == QStringLiteral("tcp")) {
        return std::nullopt;
    }

    QJsonObject json {
        {QStringLiteral("type"), transport.type}
    };
    if (transport.type == QStringLiteral("ws")) {
        json.insert(QStringLiteral("path"), transport.path.isEmpty() ? QStringLiteral("/") : transport.path);
        if (!transport.host.isEmpty()) {
            json.insert(QStringLiteral("headers"), QJsonObject {
                {QStringLiteral("Host"), transport.host}
            });
        }
    } else if (transport.type == QStringLiteral("http")) {
        json.insert(QStringLiteral("path"), transport.path.isEmpty() ? QStringLiteral("/") : transport.path);
        if (!transport.host.isEmpty()) {
            json.insert(QStringLiteral("host"), QJsonArray {transport.host});
        }
    } else if (transport.type == QStringLiteral("httpupgrade")) {
        json.insert(QStringLiteral("path"), transport.path.isEmpty() ? QStringLiteral("/") : transport.path);
        if (!transport.host.isEmpty()) {
            json.insert(QStringLiteral("host"), transport.host);
        }
    } else if (transport.type == QStringLiteral("grpc")) {
        json.insert(QStringLiteral("service_name"), transport.serviceName);
    } else if (transport.type != QStringLiteral("quic")) {
        appendWarning(warnings, droppedWarning(inbound, QStringLiteral("transport %1").arg(transport.type)));
        return std::nullopt;
    }

    return json;
}

void SingBoxCodec::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
