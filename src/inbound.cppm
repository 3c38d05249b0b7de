/*!
 * @file        inbound.cppm
 * @brief       Canonical inbound listener model for CoreBridge.
 *
 * @details
 * Defines the engine-neutral `Inbound` value type used between the format
 * codecs, the capability filter and the template engine. An inbound carries
 * protocol, transport, TLS/Reality, multiplex and user data, plus the set of
 * capability tokens its populated sub-structures exercise.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

export module corebridge.backend.inbound;

/**
 * @struct InboundUser
 * @brief One credential accepted by an inbound.
 */
export struct InboundUser {
    QString uuid;     //!< UUID for vless/vmess/tuic style protocols.
    QString name;     //!< Display name or email.
    QString password; //!< Password for trojan/shadowsocks/hysteria style protocols.
    QString flow;     //!< Vless flow control.
    QString method;   //!< Per-user shadowsocks cipher.

    QJsonObject toJson() const;
    static InboundUser fromJson(const QJsonObject& json);
};

/**
 * @struct InboundTransport
 * @brief Stream transport of an inbound. Unused fields stay empty.
 */
export struct InboundTransport {
    QString type;        //!< tcp, ws, grpc, http, httpupgrade, quic, kcp, xhttp.
    QString path;        //!< HTTP/WS path.
    QString host;        //!< Host header or virtual host.
    QString serviceName; //!< gRPC service name.

    QJsonObject toJson() const;
    static InboundTransport fromJson(const QJsonObject& json);
};

/**
 * @struct RealityHandshake
 * @brief Upstream server used for the Reality TLS handshake.
 */
export struct RealityHandshake {
    QString server;      //!< Handshake host.
    quint16 serverPort = 0; //!< Handshake port.
};

/**
 * @struct RealitySettings
 * @brief Reality camouflage parameters.
 */
export struct RealitySettings {
    bool enabled = false;     //!< Reality block active.
    QStringList shortIds;     //!< Accepted short ids.
    QStringList serverNames;  //!< Accepted server names, primary first.
    QString fingerprint;      //!< uTLS fingerprint hint.
    QString publicKey;        //!< X25519 public key.
    QString privateKey;       //!< X25519 private key.
    std::optional<RealityHandshake> handshake; //!< Handshake target.

    //! Primary server name or empty string.
    QString serverName() const;
};

/**
 * @struct InboundTls
 * @brief TLS layer of an inbound.
 */
export struct InboundTls {
    bool enabled = false;      //!< TLS active.
    QString serverName;        //!< Certificate server name.
    QStringList alpn;          //!< ALPN protocols.
    QString certificatePath;   //!< PEM certificate path.
    QString keyPath;           //!< PEM key path.
    std::optional<RealitySettings> reality; //!< Reality settings when used instead of plain TLS.
};

/**
 * @struct BrutalSettings
 * @brief Brutal congestion control settings for multiplexed streams.
 */
export struct BrutalSettings {
    bool enabled = false; //!< Brutal active.
    int upMbps = 0;       //!< Upload bandwidth in Mbps.
    int downMbps = 0;     //!< Download bandwidth in Mbps.
};

/**
 * @struct MultiplexSettings
 * @brief Connection multiplexing settings.
 */
export struct MultiplexSettings {
    bool enabled = false;  //!< Multiplex active.
    bool padding = false;  //!< Padding enabled.
    std::optional<BrutalSettings> brutal; //!< Brutal congestion control.
};

/**
 * @struct Inbound
 * @brief Engine-neutral proxy listener.
 *
 * @details
 * `requiredCapabilities` mirrors the populated Reality, Multiplex and Brutal
 * blocks. Call `refreshRequiredCapabilities()` after editing them.
 */
export struct Inbound {
    QString type;     //!< Protocol (vless, vmess, trojan, shadowsocks, ...).
    QString tag;      //!< Unique tag.
    QString listen;   //!< Listen address.
    quint16 listenPort = 0; //!< Listen port.

    std::optional<InboundTransport> transport; //!< Transport, absent means plain TCP.
    std::optional<InboundTls> tls;             //!< TLS/Reality layer.
    std::optional<MultiplexSettings> multiplex; //!< Multiplex layer.

    QList<InboundUser> users;         //!< Accepted users.
    QStringList requiredCapabilities; //!< Capability tokens exercised by this inbound.
    QJsonObject options;              //!< Protocol-specific scalar options.

    bool hasReality() const;
    bool hasMultiplex() const;
    bool hasBrutal() const;

    /**
     * @brief Compute capability tokens from the populated sub-structures.
     * @return Sorted, deduplicated tokens.
     */
    QStringList deriveRequiredCapabilities() const;

    //! Recompute `requiredCapabilities` from the current sub-structures.
    void refreshRequiredCapabilities();

    /**
     * @brief Label used in warnings: the tag, or `type:port` when untagged.
     */
    QString displayTag() const;

    /**
     * @brief Serialize to the canonical snake_case JSON shape.
     */
    QJsonObject toJson() const;

    /**
     * @brief Deserialize from the canonical JSON shape.
     * @param json Source object.
     * @return Inbound or empty optional when the protocol type is missing.
     */
    static std::optional<Inbound> fromJson(const QJsonObject& json);
};
