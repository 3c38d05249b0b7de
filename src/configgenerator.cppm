/*!
 * @file        configgenerator.cppm
 * @brief       Render pipeline from an agent host and template to a final configuration.
 *
 * @details
 * Builds the template context from the node inventory, filters it for the
 * agent's capabilities, enforces the template's version requirement,
 * renders, and validates the result. Shared by config generation and by
 * template-based instance switches.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

export module corebridge.backend.configgenerator;
export import corebridge.backend.repositories;
export import corebridge.backend.capabilityfilter;

/**
 * @struct GeneratedConfig
 * @brief Rendered configuration ready to be sent to an agent.
 */
export struct GeneratedConfig {
    QByteArray config;    //!< Indented JSON.
    QString configHash;   //!< SHA-256 hex of @ref config.
    QStringList warnings; //!< Filter, compatibility, render and validation warnings.
};

/**
 * @class ConfigGenerator
 * @brief Stateless render pipeline over a node inventory.
 */
export class ConfigGenerator
{
public:
    explicit ConfigGenerator(const NodeInventory& inventory);

    /**
     * @brief Context a template sees for @p host, before capability filtering.
     * @param coreType Engine the template targets.
     */
    TemplateContext buildContext(const AgentHost& host, const QString& coreType) const;

    /**
     * @brief Render @p tmpl for @p host.
     * @return Configuration, or empty optional with a Compatibility or
     *         Validation error.
     */
    std::optional<GeneratedConfig> generate(const AgentHost& host,
                                            const ConfigTemplate& tmpl,
                                            PipelineError *error) const;

private:
    const NodeInventory& m_inventory;
};
