module;
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

module corebridge.backend.inbound;
import corebridge.backend.capability;
import corebridge.backend.jsonsupport;

namespace {
void insertIfNotEmpty(QJsonObject& json, const QString& key, const QString& value)
{
    if (!value.isEmpty()) {
        json.insert(key, value);
    }
}

QJsonObject realityToJson(const RealitySettings& reality)
{
    QJsonObject json {
        {QStringLiteral("enabled"), reality.enabled}
    };
    if (!reality.shortIds.isEmpty()) {
        json.insert(QStringLiteral("short_ids"), toJsonArray(reality.shortIds));
    }
    if (!reality.serverNames.isEmpty()) {
        json.insert(QStringLiteral("server_name"), reality.serverName());
        json.insert(QStringLiteral("server_names"), toJsonArray(reality.serverNames));
    }
    insertIfNotEmpty(json, QStringLiteral("fingerprint"), reality.fingerprint);
    insertIfNotEmpty(json, QStringLiteral("public_key"), reality.publicKey);
    insertIfNotEmpty(json, QStringLiteral("private_key"), reality.privateKey);
    if (reality.handshake.has_value()) {
        json.insert(QStringLiteral("handshake"), QJsonObject {
            {QStringLiteral("server"), reality.handshake->server},
            {QStringLiteral("server_port"), static_cast<int>(reality.handshake->serverPort)}
        });
    }
    return json;
}

RealitySettings realityFromJson(const QJsonObject& json)
{
    RealitySettings reality;
    reality.enabled = json.value(QStringLiteral("enabled")).toBool(false);
    reality.shortIds = jsonStringList(json.value(QStringLiteral("short_ids")));
    reality.serverNames = jsonStringList(json.value(QStringLiteral("server_names")));
    const QString primary = json.value(QStringLiteral("server_name")).toString().trimmed();
    if (!primary.isEmpty() && !reality.serverNames.contains(primary)) {
        reality.serverNames.prepend(primary);
    }
    reality.fingerprint = json.value(QStringLiteral("fingerprint")).toString().trimmed();
    reality.publicKey = json.value(QStringLiteral("public_key")).toString().trimmed();
    reality.privateKey = json.value(QStringLiteral("private_key")).toString().trimmed();

    const QJsonObject handshake = json.value(QStringLiteral("handshake")).toObject();
    if (!handshake.isEmpty()) {
        reality.handshake = RealityHandshake {
            handshake.value(QStringLiteral("server")).toString().trimmed(),
            static_cast<quint16>(jsonPort(handshake.value(QStringLiteral("server_port"))))
        };
    }
    return reality;
}
}

QJsonObject InboundUser::toJson() const
{
    QJsonObject json;
    insertIfNotEmpty(json, QStringLiteral("uuid"), uuid);
    insertIfNotEmpty(json, QStringLiteral("name"), name);
    insertIfNotEmpty(json, QStringLiteral("password"), password);
    insertIfNotEmpty(json, QStringLiteral("flow"), flow);
    insertIfNotEmpty(json, QStringLiteral("method"), method);
    return json;
}

InboundUser InboundUser::fromJson(const QJsonObject& json)
{
    InboundUser user;
    user.uuid = json.value(QStringLiteral("uuid")).toString().trimmed();
    user.name = json.value(QStringLiteral("name")).toString().trimmed();
    user.password = json.value(QStringLiteral("password")).toString();
    user.flow = json.value(QStringLiteral("flow")).toString().trimmed();
    user.method = json.value(QStringLiteral("method")).toString().trimmed();
    return user;
}

QJsonObject InboundTransport::toJson() const
{
    QJsonObject json {
        {QStringLiteral("type"), type}
    };
    insertIfNotEmpty(json, QStringLiteral("path"), path);
    insertIfNotEmpty(json, QStringLiteral("host"), host);
    insertIfNotEmpty(json, QStringLiteral("service_name"), serviceName);
    return json;
}

InboundTransport InboundTransport::fromJson(const QJsonObject& json)
{
    InboundTransport transport;
    transport.type = json.value(QStringLiteral("type")).toString().trimmed().toLower();
    transport.path = json.value(QStringLiteral("path")).toString().trimmed();
    transport.host = json.value(QStringLiteral("host")).toString().trimmed();
    transport.serviceName = json.value(QStringLiteral("service_name")).toString().trimmed();
    return transport;
}

QString RealitySettings::serverName() const
{
    return serverNames.isEmpty() ? QString() : serverNames.constFirst();
}

bool Inbound::hasReality() const
{
    return tls.has_value() && tls->reality.has_value() && tls->reality->enabled;
}

bool Inbound::hasMultiplex() const
{
    return multiplex.has_value() && multiplex->enabled;
}

bool Inbound::hasBrutal() const
{
    return hasMultiplex() && multiplex->brutal.has_value() && multiplex->brutal->enabled;
}

QStringList Inbound::deriveRequiredCapabilities() const
{
    QStringList tokens;
    if (hasBrutal()) {
        tokens.append(QString(Capability::Brutal));
    }
    if (hasMultiplex()) {
        tokens.append(QString(Capability::Multiplex));
    }
    if (hasReality()) {
        tokens.append(QString(Capability::Reality));
    }
    return tokens;
}

void Inbound::refreshRequiredCapabilities()
{
    requiredCapabilities = deriveRequiredCapabilities();
}

QString Inbound::displayTag() const
{
    if (!tag.isEmpty()) {
        return tag;
    }
    return QStringLiteral("%1:%2").arg(type, QString::number(listenPort));
}

QJsonObject Inbound::toJson() const
{
    QJsonObject json {
        {QStringLiteral("type"), type},
        {QStringLiteral("tag"), tag},
        {QStringLiteral("listen"), listen},
        {QStringLiteral("listen_port"), static_cast<int>(listenPort)}
    };

    if (transport.has_value()) {
        json.insert(QStringLiteral("transport"), transport->toJson());
    }

    if (tls.has_value()) {
        QJsonObject tlsJson {
            {QStringLiteral("enabled"), tls->enabled}
        };
        insertIfNotEmpty(tlsJson, QStringLiteral("server_name"), tls->serverName);
        if (!tls->alpn.isEmpty()) {
            tlsJson.insert(QStringLiteral("alpn"), toJsonArray(tls->alpn));
        }
        insertIfNotEmpty(tlsJson, QStringLiteral("certificate_path"), tls->certificatePath);
        insertIfNotEmpty(tlsJson, QStringLiteral("key_path"), tls->keyPath);
        if (tls->reality.has_value()) {
            tlsJson.insert(QStringLiteral("reality"), realityToJson(tls->reality.value()));
        }
        json.insert(QStringLiteral("tls"), tlsJson);
    }

    if (multiplex.has_value()) {
        QJsonObject mux {
            {QStringLiteral("enabled"), multiplex->enabled},
            {QStringLiteral("padding"), multiplex->padding}
        };
        if (multiplex->brutal.has_value()) {
            mux.insert(QStringLiteral("brutal"), QJsonObject {
                {QStringLiteral("enabled"), multiplex->brutal->enabled},
                {QStringLiteral("up_mbps"), multiplex->brutal->upMbps},
                {QStringLiteral("down_mbps"), multiplex->brutal->downMbps}
            });
        }
        json.insert(QStringLiteral("multiplex"), mux);
    }

    QJsonArray userArray;
    for (const InboundUser& user : users) {
        userArray.append(user.toJson());
    }
    json.insert(QStringLiteral("users"), userArray);
    json.insert(QStringLiteral("required_capabilities"), toJsonArray(requiredCapabilities));
    if (!options.isEmpty()) {
        json.insert(QStringLiteral("options"), options);
    }

    return json;
}

std::optional<Inbound> Inbound::fromJson(const QJsonObject& json)
{
    Inbound inbound;
    inbound.type = json.value(QStringLiteral("type")).toString().trimmed().toLower();
    if (inbound.type.isEmpty()) {
        return std::nullopt;
    }
    inbound.tag = json.value(QStringLiteral("tag")).toString().trimmed();
    inbound.listen = json.value(QStringLiteral("listen")).toString().trimmed();
    inbound.listenPort = static_cast<quint16>(jsonPort(json.value(QStringLiteral("listen_port"))));

    const QJsonObject transport = json.value(QStringLiteral("transport")).toObject();
    if (!transport.isEmpty()) {
        inbound.transport = InboundTransport::fromJson(transport);
    }

    const QJsonObject tls = json.value(QStringLiteral("tls")).toObject();
    if (!tls.isEmpty()) {
        InboundTls value;
        value.enabled = tls.value(QStringLiteral("enabled")).toBool(false);
        value.serverName = tls.value(QStringLiteral("server_name")).toString().trimmed();
        value.alpn = jsonStringList(tls.value(QStringLiteral("alpn")));
        value.certificatePath = tls.value(QStringLiteral("certificate_path")).toString().trimmed();
        value.keyPath = tls.value(QStringLiteral("key_path")).toString().trimmed();
        const QJsonObject reality = tls.value(QStringLiteral("reality")).toObject();
        if (!reality.isEmpty()) {
            value.reality = realityFromJson(reality);
        }
        inbound.tls = value;
    }

    const QJsonObject mux = json.value(QStringLiteral("multiplex")).toObject();
    if (!mux.isEmpty()) {
        MultiplexSettings value;
        value.enabled = mux.value(QStringLiteral("enabled")).toBool(false);
        value.padding = mux.value(QStringLiteral("padding")).toBool(false);
        const QJsonObject brutal = mux.value(QStringLiteral("brutal")).toObject();
        if (!brutal.isEmpty()) {
            value.brutal = BrutalSettings {
                brutal.value(QStringLiteral("enabled")).toBool(false),
                brutal.value(QStringLiteral("up_mbps")).toInt(),
                brutal.value(QStringLiteral("down_mbps")).toInt()
            };
        }
        inbound.multiplex = value;
    }

    for (const QJsonValue& value : json.value(QStringLiteral("users")).toArray()) {
        if (value.isObject()) {
            inbound.users.append(InboundUser::fromJson(value.toObject()));
        }
    }
    inbound.options = json.value(QStringLiteral("options")).toObject();
    inbound.refreshRequiredCapabilities();

    return inbound;
}
