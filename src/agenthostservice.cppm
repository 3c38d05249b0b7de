/*!
 * @file        agenthostservice.cppm
 * @brief       Template assignment and configuration generation for agent hosts.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QStringList>
#include <QtTypes>

#include <optional>

export module corebridge.backend.agenthostservice;
export import corebridge.backend.configgenerator;

/**
 * @class AgentHostService
 * @brief Connects agent hosts with configuration templates.
 */
export class AgentHostService
{
public:
    AgentHostService(AgentHostRepository& hosts,
                     const ConfigTemplateRepository& templates,
                     const NodeInventory& inventory);

    /**
     * @brief Assign a template to a host.
     *
     * @details
     * A @p templateId of 0 clears the assignment. Compatibility problems are
     * logged and returned in @p warnings but never block the assignment.
     */
    bool assignTemplate(qint64 hostId, qint64 templateId, QStringList *warnings = nullptr, PipelineError *error = nullptr);

    /**
     * @brief Check a template against a host.
     *
     * @details
     * An invalid template or a version below the minimum makes the result
     * incompatible. A host that has not reported its version only yields a
     * warning here.
     */
    std::optional<CompatibilityResult> checkTemplateCompatibility(qint64 hostId,
                                                                  qint64 templateId,
                                                                  PipelineError *error = nullptr) const;

    /**
     * @brief Generate the configuration of a host from its assigned template.
     * @param config Receives the configuration, or an empty optional when no
     *               template is assigned and the agent keeps its local config.
     * @return False on error.
     */
    bool generateConfig(qint64 hostId, std::optional<GeneratedConfig> *config, PipelineError *error = nullptr) const;

private:
    AgentHostRepository& m_hosts;
    const ConfigTemplateRepository& m_templates;
    ConfigGenerator m_generator;
};
