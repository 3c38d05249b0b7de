/*!
 * @file        capabilityfilter.cppm
 * @brief       Agent-aware filtering of template contexts.
 *
 * @details
 * Prevents emitting configuration a remote engine cannot execute. Features
 * an agent lacks are switched off in a filtered copy of the context, with a
 * warning per change, and template requirements are checked against the
 * agent's version and capability set.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>
#include <QStringList>

export module corebridge.backend.capabilityfilter;
export import corebridge.backend.capability;
export import corebridge.backend.templatecontext;

/**
 * @struct FilterResult
 * @brief Filtered context plus one warning per disabled feature.
 */
export struct FilterResult {
    TemplateContext context; //!< Filtered copy.
    QStringList warnings;    //!< Features disabled for this agent.
};

/**
 * @struct CompatibilityResult
 * @brief Outcome of checking template requirements against an agent.
 */
export struct CompatibilityResult {
    bool compatible = true;      //!< False on a version mismatch or unknown version.
    bool versionUnknown = false; //!< Agent has not reported a version but one is required.
    QStringList warnings;        //!< Missing capabilities and unknown-version notes.
    QStringList errors;          //!< Hard incompatibilities.
};

/**
 * @class CapabilityFilter
 * @brief Applies one agent's capability set to template inputs.
 */
export class CapabilityFilter
{
public:
    /**
     * @brief Create a filter for an agent.
     * @param capabilities Effective capabilities, see `AgentCapabilities::resolve`.
     */
    explicit CapabilityFilter(const AgentCapabilities& capabilities);

    const AgentCapabilities& capabilities() const;

    /**
     * @brief Disable unsupported features in a copy of @p context.
     *
     * @details
     * Inbounds are kept; only their Reality, Multiplex or Brutal blocks are
     * disabled. Required capabilities are recomputed afterwards and never grow.
     * The stats flag and an experimental v2ray_api block are cleared when the
     * agent cannot serve the stats API.
     */
    FilterResult filterContext(const TemplateContext& context) const;

    /**
     * @brief Filter one inbound.
     * @param inbound Source inbound.
     * @param warnings Receives one entry per disabled block.
     * @return Filtered copy.
     */
    Inbound filterInbound(const Inbound& inbound, QStringList *warnings) const;

    /**
     * @brief Check template requirements against the agent.
     * @param minVersion Minimum engine version, empty for none.
     * @param requiredCapabilities Capabilities the template uses.
     * @return Version mismatches are errors, missing capabilities are warnings.
     */
    CompatibilityResult checkTemplateCompatibility(const QString& minVersion,
                                                   const QStringList& requiredCapabilities) const;

private:
    bool supportsStatsApi() const;

    AgentCapabilities m_capabilities; //!< Agent capability set.
};
