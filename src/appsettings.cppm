/*!
 * @file        appsettings.cppm
 * @brief       Persistent application settings and logging setup.
 *
 * @details
 * Settings live in QSettings, either the default organization scope or an
 * INI file given on the command line. They provide the store location and
 * the agent connection options of the switch orchestrator.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module corebridge.backend.appsettings;
export import corebridge.backend.agentcoreservice;

/**
 * @brief Install the message pattern and category filter for a log level.
 * @param level One of debug, info, warning, critical. Unknown values mean info.
 * @return False when the level was not recognized.
 */
export bool configureLogging(const QString& level);

/**
 * @class AppSettings
 * @brief Settings of the corebridge tool.
 */
export class AppSettings
{
public:
    AppSettings();

    /**
     * @brief Load settings.
     * @param iniFile INI file, or empty for the default scope.
     */
    void load(const QString& iniFile = QString());

    //! Write every key back to where it was loaded from.
    void save() const;

    QString dataDirectory() const;
    void setDataDirectory(const QString& directory);

    //! Full path of the store file inside the data directory.
    QString storePath() const;

    QString logLevel() const;
    void setLogLevel(const QString& level);

    const AgentCoreServiceOptions& serviceOptions() const;
    void setServiceOptions(const AgentCoreServiceOptions& options);

private:
    QString m_iniFile;
    QString m_dataDirectory;
    QString m_logLevel;
    AgentCoreServiceOptions m_options;
};
