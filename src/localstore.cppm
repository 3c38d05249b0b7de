/*!
 * @file        localstore.cppm
 * @brief       JSON document store implementing the pipeline repositories.
 *
 * @details
 * Keeps hosts, templates, instances, switch logs and the per-host node
 * inventory in one JSON document. Every mutation is written atomically with
 * QSaveFile before it becomes visible. A store constructed without a path
 * lives in memory only. All methods are thread-safe.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <QString>
#include <QtTypes>

#include <memory>
#include <optional>

export module corebridge.backend.localstore;
export import corebridge.backend.repositories;

/**
 * @class LocalStore
 * @brief File-backed reference store exposing one object per repository interface.
 */
export class LocalStore
{
public:
    /**
     * @brief Create a store.
     * @param path Document path, empty for an in-memory store.
     */
    explicit LocalStore(const QString& path = QString());
    ~LocalStore();

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    //! Default document file name inside the data directory.
    static QString defaultFileName();

    QString path() const;

    /**
     * @brief Load the document from disk.
     * @return True when the file was read or does not exist yet.
     */
    bool load(PipelineError *error = nullptr);

    /**
     * @brief Insert or replace a host.
     * @return Host id, assigned when @p host has none.
     */
    std::optional<qint64> saveHost(const AgentHost& host, PipelineError *error = nullptr);
    QList<AgentHost> hosts() const;

    //! Replace the inbounds and users served by a host.
    bool setInventory(qint64 hostId,
                      const QList<Inbound>& inbounds,
                      const QList<UserConfig>& users,
                      PipelineError *error = nullptr);

    AgentHostRepository& agentHosts();
    ConfigTemplateRepository& configTemplates();
    AgentCoreInstanceRepository& coreInstances();
    AgentCoreSwitchLogRepository& switchLogs();
    NodeInventory& inventory();

private:
    class HostRepository;
    class TemplateRepository;
    class InstanceRepository;
    class SwitchLogRepository;
    class Inventory;

    struct Data {
        QHash<qint64, AgentHost> hosts;
        QHash<qint64, ConfigTemplate> templates;
        QList<AgentCoreInstance> instances;
        QList<AgentCoreSwitchLog> switchLogs;
        QHash<qint64, QList<Inbound>> inbounds;
        QHash<qint64, QList<UserConfig>> users;
        qint64 nextHostId = 1;
        qint64 nextTemplateId = 1;
        qint64 nextSwitchLogId = 1;
    };

    //! Persist @p next and make it current. The current state is kept on failure.
    bool commit(const Data& next, PipelineError *error);
    static QJsonObject toJson(const Data& data);
    static Data fromJson(const QJsonObject& json);

    mutable QMutex m_mutex;
    QString m_path;
    Data m_data;

    std::unique_ptr<HostRepository> m_hostRepository;
    std::unique_ptr<TemplateRepository> m_templateRepository;
    std::unique_ptr<InstanceRepository> m_instanceRepository;
    std::unique_ptr<SwitchLogRepository> m_switchLogRepository;
    std::unique_ptr<Inventory> m_inventory;
};
