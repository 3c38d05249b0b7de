/*!
 * @file        capability.cppm
 * @brief       Capability tokens and version derivation tables.
 *
 * @details
 * Describes what a running agent's proxy engine supports. Agents may report
 * their capability set directly; when they only report a version the set is
 * derived from the immutable per-engine requirement tables defined here.
 * Unparsable versions derive nothing so compatibility checks fail closed.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVersionNumber>

#include <optional>

export module corebridge.backend.capability;
import corebridge.backend.coreengine;

/**
 * @namespace Capability
 * @brief Known capability tokens in their normalized spelling.
 */
export namespace Capability {
inline constexpr QLatin1StringView Reality {"reality"};
inline constexpr QLatin1StringView Multiplex {"multiplex"};
inline constexpr QLatin1StringView Brutal {"brutal"};
inline constexpr QLatin1StringView Ech {"ech"};
inline constexpr QLatin1StringView Utls {"utls"};
inline constexpr QLatin1StringView Quic {"quic"};
inline constexpr QLatin1StringView V2RayApi {"v2ray_api"};
inline constexpr QLatin1StringView Wireguard {"wireguard"};
inline constexpr QLatin1StringView Tun {"tun"};
inline constexpr QLatin1StringView Http3 {"http3"};
inline constexpr QLatin1StringView Dhcp {"dhcp"};
inline constexpr QLatin1StringView GeoIp {"geoip"};
inline constexpr QLatin1StringView GeoSite {"geosite"};
inline constexpr QLatin1StringView Xtls {"xtls"};
inline constexpr QLatin1StringView SplitHttp {"splithttp"};
inline constexpr QLatin1StringView Meek {"meek"};
inline constexpr QLatin1StringView Mkcp {"mkcp"};
inline constexpr QLatin1StringView DomainSocket {"domainsock"};
inline constexpr QLatin1StringView Stats {"stats"};
} // namespace Capability

/**
 * @struct CapabilityRequirement
 * @brief One row of a per-engine version table.
 */
export struct CapabilityRequirement {
    QString token;      //!< Capability token granted.
    QString minVersion; //!< Minimum engine version that ships the feature.
    QString buildTag;   //!< Build tag additionally required, empty when none.
};

/**
 * @struct BuildTagCapability
 * @brief Capability unlocked by a build tag regardless of version.
 */
export struct BuildTagCapability {
    QString buildTag; //!< Build tag reported by the agent.
    QString token;    //!< Capability token granted.
};

/**
 * @brief Normalize a capability token (trimmed, lowercase, `-` as `_`).
 */
export QString normalizeCapability(const QString& token);

/**
 * @brief Version requirement table for an engine.
 * @param engine Engine.
 * @return Immutable table, built once on first use.
 */
export const QList<CapabilityRequirement>& capabilityRequirements(CoreEngine engine);

/**
 * @brief Build-tag capability table for an engine.
 */
export const QList<BuildTagCapability>& buildTagCapabilities(CoreEngine engine);

/**
 * @brief Find the requirement row for a token.
 * @return Row or empty optional when the engine never supports the token.
 */
export std::optional<CapabilityRequirement> findCapabilityRequirement(CoreEngine engine, const QString& token);

/**
 * @brief Parse an engine version string.
 *
 * @details
 * Accepts an optional `v`/`V` prefix and ignores a pre-release or build
 * suffix introduced by `-` or `+`. Any other trailing text is rejected.
 *
 * @param version Version string such as `v1.8.0-beta.1`.
 * @return Normalized version or empty optional when unparsable.
 */
export std::optional<QVersionNumber> parseCoreVersion(const QString& version);

/**
 * @brief Derive capabilities for an engine from version and build tags.
 * @param coreType Engine name as reported by the agent.
 * @param coreVersion Engine version as reported by the agent.
 * @param buildTags Build tags reported by the agent.
 * @return Sorted tokens, empty for unknown engines or unparsable versions.
 */
export QStringList deriveCapabilities(const QString& coreType,
                                      const QString& coreVersion,
                                      const QStringList& buildTags);

/**
 * @struct AgentCapabilities
 * @brief Effective feature set of one agent's running engine.
 */
export struct AgentCapabilities {
    QString coreType;          //!< Engine name as reported.
    QString coreVersion;       //!< Engine version, empty when unknown.
    QSet<QString> capabilities; //!< Normalized capability tokens.
    QStringList buildTags;     //!< Build tags as reported.

    /**
     * @brief Build the effective set for an agent.
     *
     * @details
     * Reported capabilities are authoritative. When none were reported but a
     * version is known the set is derived from the version tables.
     */
    static AgentCapabilities resolve(const QString& coreType,
                                     const QString& coreVersion,
                                     const QStringList& reportedCapabilities,
                                     const QStringList& buildTags);

    std::optional<CoreEngine> engine() const;
    bool supportsCapability(const QString& token) const;
    bool hasBuildTag(const QString& tag) const;
    bool hasVersion() const;

    /**
     * @brief Check the agent version against a minimum.
     * @param minVersion Required minimum, empty means no requirement.
     * @return False when the agent has no version or either side is unparsable.
     */
    bool supportsVersion(const QString& minVersion) const;

    //! Sorted capability tokens.
    QStringList sortedCapabilities() const;

    /**
     * @brief Human-readable requirement for a token, e.g. `sing-box >= 1.3.0`.
     */
    QString requirementText(const QString& token) const;
};
