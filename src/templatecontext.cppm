/*!
 * @file        templatecontext.cppm
 * @brief       Structured input for configuration templates.
 *
 * @details
 * A template renders against a `TemplateContext`: the inbounds a host
 * serves, its outbounds, entitled users, agent information and server-wide
 * settings. The context is exposed to templates as snake_case JSON. A fixed
 * sample context backs admin previews so they never depend on live data.
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

export module corebridge.backend.templatecontext;
export import corebridge.backend.inbound;

/**
 * @struct OutboundConfig
 * @brief Outbound entry made available to templates.
 */
export struct OutboundConfig {
    QString type;         //!< Outbound type (direct, block, ...).
    QString tag;          //!< Outbound tag.
    QJsonObject settings; //!< Extra engine-specific settings merged into the outbound.

    QJsonObject toJson() const;
};

/**
 * @struct UserConfig
 * @brief User entitled to the host's inbounds.
 */
export struct UserConfig {
    qint64 id = 0;    //!< User identifier.
    QString uuid;     //!< User UUID.
    QString email;    //!< Email, used as the stats name.
    QString password; //!< Password for password-based protocols, UUID when empty.
    QString flow;     //!< Preferred vless flow.

    QJsonObject toJson() const;
    static UserConfig fromJson(const QJsonObject& json);
};

/**
 * @struct AgentInfo
 * @brief Agent host description.
 */
export struct AgentInfo {
    qint64 id = 0;            //!< Agent host identifier.
    QString name;             //!< Agent host name.
    QString host;             //!< Agent address.
    QString coreType;         //!< Engine type.
    QString coreVersion;      //!< Engine version.
    QStringList capabilities; //!< Effective capability tokens.
    QStringList buildTags;    //!< Engine build tags.

    QJsonObject toJson() const;
};

/**
 * @struct ServerInfo
 * @brief Server-wide settings.
 */
export struct ServerInfo {
    QString logLevel = QStringLiteral("info");    //!< Engine log level.
    QString listenAddr = QStringLiteral("::");    //!< Default listen address.
    QString dnsServer = QStringLiteral("8.8.8.8"); //!< Upstream DNS server.
    bool statsEnabled = false;                    //!< Traffic statistics API enabled.
    quint16 apiPort = 10085;                      //!< Local stats API port.

    QJsonObject toJson() const;
};

/**
 * @struct TemplateContext
 * @brief Complete render input for one agent host.
 */
export struct TemplateContext {
    QList<Inbound> inbounds;         //!< Inbounds served by the host.
    QList<OutboundConfig> outbounds; //!< Outbounds.
    QList<UserConfig> users;         //!< Entitled users.
    AgentInfo agent;                 //!< Agent information.
    ServerInfo server;               //!< Server settings.
    QJsonObject dns;                 //!< Optional DNS block override.
    QJsonObject route;               //!< Optional route block override.
    QJsonObject experimental;        //!< Optional experimental block override.

    /**
     * @brief Context as seen by templates.
     * @return Object with inbounds, outbounds, users, agent, server, dns, route, experimental.
     */
    QJsonObject toJson() const;

    /**
     * @brief Fixed sample context used for previews and template validation.
     */
    static TemplateContext sample();
};
