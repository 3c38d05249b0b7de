/*!
 * @file        entities.cppm
 * @brief       Persisted pipeline records.
 *
 * @details
 * Agent hosts, configuration templates, core instances and switch logs as
 * stored by the repositories. Each record converts to and from the JSON
 * shape used by the local store.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

export module corebridge.backend.entities;
export import corebridge.backend.capability;

/**
 * @enum InstanceStatus
 * @brief Lifecycle of a core instance on an agent.
 */
export enum class InstanceStatus
{
    Running,
    Stopped
};

export QString instanceStatusName(InstanceStatus status);
export std::optional<InstanceStatus> parseInstanceStatus(const QString& value);

/**
 * @enum SwitchStatus
 * @brief Switch log state machine: Pending -> InProgress -> Completed | Failed.
 */
export enum class SwitchStatus
{
    Pending,
    InProgress,
    Completed,
    Failed
};

export QString switchStatusName(SwitchStatus status);
export std::optional<SwitchStatus> parseSwitchStatus(const QString& value);

//! True for Completed and Failed.
export bool isTerminalStatus(SwitchStatus status);

/**
 * @struct AgentHost
 * @brief Remote host running an agent.
 */
export struct AgentHost {
    qint64 id = 0;            //!< Host identifier.
    QString name;             //!< Display name.
    QString host;             //!< Agent address, optionally with port.
    QString token;            //!< Agent credential.
    QString coreType;         //!< Reported engine type.
    QString coreVersion;      //!< Reported engine version, empty when unknown.
    QStringList capabilities; //!< Reported capability tokens.
    QStringList buildTags;    //!< Reported build tags.
    std::optional<qint64> configTemplateId; //!< Assigned template.

    //! Effective capabilities, derived from the version when none are reported.
    AgentCapabilities agentCapabilities() const;

    QJsonObject toJson() const;
    static AgentHost fromJson(const QJsonObject& json);
};

/**
 * @struct ConfigTemplate
 * @brief Admin-authored configuration template.
 */
export struct ConfigTemplate {
    qint64 id = 0;
    QString name;
    QString description;
    QString type;             //!< Engine name.
    QString content;          //!< Template text.
    QString minVersion;       //!< Minimum engine version, empty for none.
    QStringList capabilities; //!< Capability tokens the template uses.
    int schemaVersion = 1;
    bool isValid = false;     //!< Result of the last validation.
    QString validationError;  //!< Errors of the last validation.
    QDateTime createdAt;
    QDateTime updatedAt;

    QJsonObject toJson() const;
    static ConfigTemplate fromJson(const QJsonObject& json);
};

/**
 * @struct AgentCoreInstance
 * @brief Engine instance running on an agent host.
 */
export struct AgentCoreInstance {
    qint64 agentHostId = 0;
    QString instanceId;       //!< Unique per host.
    QString coreType;
    InstanceStatus status = InstanceStatus::Running;
    std::optional<qint64> configTemplateId;
    QString configHash;       //!< SHA-256 hex of the payload sent to the agent.
    QList<int> listenPorts;
    std::optional<QDateTime> lastHeartbeatAt;
    QString errorMessage;
    QDateTime createdAt;
    QDateTime updatedAt;

    QJsonObject toJson() const;
    static AgentCoreInstance fromJson(const QJsonObject& json);
};

/**
 * @struct AgentCoreSwitchLog
 * @brief Audit record of one create or switch operation.
 *
 * @details
 * Empty instance ids and core types mean "not applicable".
 */
export struct AgentCoreSwitchLog {
    qint64 id = 0;
    QString switchId;       //!< Correlation id sent to the agent.
    qint64 agentHostId = 0;
    QString fromInstanceId;
    QString toInstanceId;
    QString fromCoreType;
    QString toCoreType;
    SwitchStatus status = SwitchStatus::Pending;
    QString message;
    QString detail;         //!< Request shape as compact JSON.
    std::optional<qint64> operatorId;
    QDateTime createdAt;
    std::optional<QDateTime> completedAt; //!< Set once, on the terminal transition.

    QJsonObject toJson() const;
    static AgentCoreSwitchLog fromJson(const QJsonObject& json);
};
