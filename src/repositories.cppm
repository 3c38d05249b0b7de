/*!
 * @file        repositories.cppm
 * @brief       Persistence interfaces consumed by the pipeline services.
 *
 * @details
 * The services never touch storage directly. Every read and write goes
 * through these interfaces so that stores can be swapped and decorated in
 * tests. Failures are reported through `PipelineError` with NotFound for
 * missing records, Conflict for uniqueness and state violations, and
 * Storage for I/O problems.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QDateTime>
#include <QList>
#include <QString>
#include <QtTypes>

#include <optional>

export module corebridge.backend.repositories;
export import corebridge.backend.entities;
export import corebridge.backend.pipelineerror;
export import corebridge.backend.templatecontext;

/**
 * @struct SwitchLogFilter
 * @brief Selection and paging of switch logs.
 */
export struct SwitchLogFilter {
    std::optional<qint64> agentHostId;
    std::optional<SwitchStatus> status;
    std::optional<QDateTime> start; //!< Inclusive lower bound on creation time.
    std::optional<QDateTime> end;   //!< Inclusive upper bound on creation time.
    int limit = 50;
    int offset = 0;
};

/**
 * @struct SwitchLogPage
 * @brief One page of switch logs, newest first.
 */
export struct SwitchLogPage {
    QList<AgentCoreSwitchLog> rows;
    qint64 total = 0; //!< Matching rows before paging.
};

/**
 * @struct SwitchLogUpdate
 * @brief State transition applied to a switch log.
 */
export struct SwitchLogUpdate {
    SwitchStatus status = SwitchStatus::InProgress;
    QString message;
    QString toInstanceId;                 //!< Recorded when not empty.
    std::optional<QDateTime> completedAt; //!< Required for terminal states.
};

export class AgentHostRepository
{
public:
    virtual ~AgentHostRepository() = default;

    virtual std::optional<AgentHost> findById(qint64 id, PipelineError *error) const = 0;

    /**
     * @brief Assign or clear a host's template.
     * @param templateId Template to assign, empty optional clears it.
     */
    virtual bool setConfigTemplate(qint64 hostId, std::optional<qint64> templateId, PipelineError *error) = 0;
};

export class ConfigTemplateRepository
{
public:
    virtual ~ConfigTemplateRepository() = default;

    /**
     * @brief Store a new template.
     * @return Stored copy with its id and timestamps assigned.
     */
    virtual std::optional<ConfigTemplate> create(const ConfigTemplate& tmpl, PipelineError *error) = 0;
    virtual bool update(const ConfigTemplate& tmpl, PipelineError *error) = 0;
    virtual bool remove(qint64 id, PipelineError *error) = 0;
    virtual std::optional<ConfigTemplate> findById(qint64 id, PipelineError *error) const = 0;
    virtual QList<ConfigTemplate> list() const = 0;
};

export class AgentCoreInstanceRepository
{
public:
    virtual ~AgentCoreInstanceRepository() = default;

    //! Fails with Conflict when (host, instance) already exists.
    virtual bool create(const AgentCoreInstance& instance, PipelineError *error) = 0;
    virtual std::optional<AgentCoreInstance> findByHostAndInstance(qint64 hostId,
                                                                   const QString& instanceId,
                                                                   PipelineError *error) const = 0;
    virtual QList<AgentCoreInstance> listByHost(qint64 hostId) const = 0;
    virtual bool updateStatus(qint64 hostId,
                              const QString& instanceId,
                              InstanceStatus status,
                              const QString& errorMessage,
                              PipelineError *error) = 0;
    virtual bool remove(qint64 hostId, const QString& instanceId, PipelineError *error) = 0;
};

export class AgentCoreSwitchLogRepository
{
public:
    virtual ~AgentCoreSwitchLogRepository() = default;

    /**
     * @brief Insert a new log row.
     * @return Assigned log id.
     */
    virtual std::optional<qint64> create(const AgentCoreSwitchLog& log, PipelineError *error) = 0;

    /**
     * @brief Apply a state transition.
     *
     * @details
     * Rows in a terminal state are never modified again; such updates fail
     * with Conflict.
     */
    virtual bool updateStatus(qint64 id, const SwitchLogUpdate& update, PipelineError *error) = 0;
    virtual std::optional<AgentCoreSwitchLog> findById(qint64 id, PipelineError *error) const = 0;
    virtual SwitchLogPage list(const SwitchLogFilter& filter) const = 0;
};

/**
 * @class NodeInventory
 * @brief Read-only view of what a host serves and to whom.
 */
export class NodeInventory
{
public:
    virtual ~NodeInventory() = default;

    virtual QList<Inbound> inboundsForHost(qint64 hostId) const = 0;
    virtual QList<UserConfig> usersForHost(qint64 hostId) const = 0;
};
