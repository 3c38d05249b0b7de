module;
#include <QJsonObject>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

module corebridge.backend.capabilityfilter;
import corebridge.backend.coreengine;

namespace {
Q_LOGGING_CATEGORY(lcCapability, "corebridge.capability")

QString disabledWarning(const QString& feature, const Inbound& inbound, const QString& requirement)
{
    return QStringLiteral("Disabling %1 on inbound '%2': not supported by agent (requires %3)")
        .arg(feature, inbound.displayTag(), requirement);
}
}

CapabilityFilter::CapabilityFilter(const AgentCapabilities& capabilities)
    : m_capabilities(capabilities)
{
}

const AgentCapabilities& CapabilityFilter::capabilities() const
{
    return m_capabilities;
}

FilterResult CapabilityFilter::filterContext(const TemplateContext& context) const
{
    FilterResult result;
    result.context = context;
    result.context.agent.capabilities = m_capabilities.sortedCapabilities();

    result.context.inbounds.clear();
    for (const Inbound& inbound : context.inbounds) {
        result.context.inbounds.append(filterInbound(inbound, &result.warnings));
    }

    if (!supportsStatsApi()) {
        if (result.context.server.statsEnabled) {
            result.context.server.statsEnabled = false;
            result.warnings.append(QStringLiteral("Disabling traffic statistics: stats API not supported by agent (requires %1)")
                                       .arg(m_capabilities.requirementText(QString(Capability::V2RayApi))));
        }
        if (result.context.experimental.contains(QStringLiteral("v2ray_api"))) {
            result.context.experimental.remove(QStringLiteral("v2ray_api"));
            result.warnings.append(QStringLiteral("Removing experimental v2ray_api block: not supported by agent"));
        }
    }

    for (const QString& warning : std::as_const(result.warnings)) {
        qCInfo(lcCapability).noquote() << "agent" << context.agent.id << warning;
    }
    return result;
}

Inbound CapabilityFilter::filterInbound(const Inbound& inbound, QStringList *warnings) const
{
    Inbound filtered = inbound;

    auto warn = [warnings](const QString& warning) {
        if (warnings) {
            warnings->append(warning);
        }
    };

    if (filtered.hasReality() && !m_capabilities.supportsCapability(QString(Capability::Reality))) {
        filtered.tls->reality->enabled = false;
        warn(disabledWarning(QStringLiteral("Reality"), filtered,
                             m_capabilities.requirementText(QString(Capability::Reality))));
    }

    if (filtered.hasMultiplex() && !m_capabilities.supportsCapability(QString(Capability::Multiplex))) {
        filtered.multiplex->enabled = false;
        warn(disabledWarning(QStringLiteral("Multiplex"), filtered,
                             m_capabilities.requirementText(QString(Capability::Multiplex))));
    }

    // Checked after Multiplex: a disabled multiplex block already carries brutal away.
    if (filtered.hasBrutal() && !m_capabilities.supportsCapability(QString(Capability::Brutal))) {
        filtered.multiplex->brutal->enabled = false;
        warn(disabledWarning(QStringLiteral("Brutal"), filtered,
                             m_capabilities.requirementText(QString(Capability::Brutal))));
    }

    filtered.refreshRequiredCapabilities();
    return filtered;
}

CompatibilityResult CapabilityFilter::checkTemplateCompatibility(const QString& minVersion,
                                                                 const QStringList& requiredCapabilities) const
{
    CompatibilityResult result;
    const QString required = minVersion.trimmed();

    if (!required.isEmpty()) {
        if (!m_capabilities.hasVersion()) {
            result.compatible = false;
            result.versionUnknown = true;
            result.warnings.append(QStringLiteral("Agent has not reported a core version; template requires >= %1")
                                       .arg(required));
        } else if (!parseCoreVersion(required).has_value()) {
            result.compatible = false;
            result.errors.append(QStringLiteral("Template minimum version '%1' is not a valid version").arg(required));
        } else if (!m_capabilities.supportsVersion(required)) {
            result.compatible = false;
            result.errors.append(QStringLiteral("Core version %1 is below the required minimum %2")
                                     .arg(m_capabilities.coreVersion, required));
        }
    }

    for (const QString& capability : requiredCapabilities) {
        const QString token = normalizeCapability(capability);
        if (token.isEmpty() || m_capabilities.supportsCapability(token)) {
            continue;
        }
        result.warnings.append(QStringLiteral("Capability '%1' not supported by agent (requires %2)")
                                   .arg(token, m_capabilities.requirementText(token)));
    }

    return result;
}

bool CapabilityFilter::supportsStatsApi() const
{
    const std::optional<CoreEngine> engine = m_capabilities.engine();
    if (!engine.has_value()) {
        return false;
    }

    switch (engine.value()) {
    case CoreEngine::SingBox:
        return m_capabilities.supportsCapability(QString(Capability::V2RayApi))
            && m_capabilities.hasBuildTag(QStringLiteral("with_v2ray_api"));
    case CoreEngine::Xray:
        return m_capabilities.supportsCapability(QString(Capability::Stats))
            || m_capabilities.supportsCapability(QString(Capability::V2RayApi));
    }
    return false;
}
