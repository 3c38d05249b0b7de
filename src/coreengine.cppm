/*!
 * @file        coreengine.cppm
 * @brief       Core engine identifiers for CoreBridge.
 *
 * @details
 * Provides the closed set of proxy engines the pipeline understands. Codec,
 * serializer and capability dispatch switch over this enum so adding an
 * engine is caught at compile time in every dispatch site.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QList>
#include <QString>

#include <optional>

export module corebridge.backend.coreengine;

/**
 * @enum CoreEngine
 * @brief Proxy engine whose native configuration schema is supported.
 */
export enum class CoreEngine
{
    SingBox, //!< sing-box (engine A).
    Xray     //!< Xray-core (engine B).
};

/**
 * @brief Canonical engine name used in configs, logs and the agent protocol.
 * @param engine Engine value.
 * @return Lowercase engine name ("sing-box" or "xray").
 */
export QString coreEngineName(CoreEngine engine);

/**
 * @brief Resolve an engine from a user-supplied name.
 * @param name Engine name, matched case-insensitively.
 * @return Engine or empty optional when the name is unknown.
 */
export std::optional<CoreEngine> parseCoreEngine(const QString& name);

/**
 * @brief All supported engines, in detection order.
 */
export QList<CoreEngine> supportedCoreEngines();
