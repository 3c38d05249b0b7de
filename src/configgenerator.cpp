module;
#include <QByteArray>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

module corebridge.backend.configgenerator;
import corebridge.backend.coreengine;
import corebridge.backend.jsonsupport;
import corebridge.backend.templateengine;
import corebridge.backend.templatevalidator;

namespace {
Q_LOGGING_CATEGORY(lcHost, "corebridge.host")
}

ConfigGenerator::ConfigGenerator(const NodeInventory& inventory)
    : m_inventory(inventory)
{
}

TemplateContext ConfigGenerator::buildContext(const AgentHost& host, const QString& coreType) const
{
    TemplateContext context;
    context.inbounds = m_inventory.inboundsForHost(host.id);
    context.users = m_inventory.usersForHost(host.id);
    context.outbounds = {
        OutboundConfig {QStringLiteral("direct"), QStringLiteral("direct"), {}},
        OutboundConfig {QStringLiteral("block"), QStringLiteral("block"), {}}
    };

    context.agent.id = host.id;
    context.agent.name = host.name;
    context.agent.host = host.host;
    context.agent.coreType = coreType;
    context.agent.coreVersion = host.coreVersion;
    context.agent.capabilities = host.capabilities;
    context.agent.buildTags = host.buildTags;

    context.server.statsEnabled = true;
    return context;
}

std::optional<GeneratedConfig> ConfigGenerator::generate(const AgentHost& host,
                                                         const ConfigTemplate& tmpl,
                                                         PipelineError *error) const
{
    const std::optional<CoreEngine> templateEngine = parseCoreEngine(tmpl.type);
    if (!templateEngine.has_value()) {
        setError(error, ErrorCode::Validation,
                 QStringLiteral("Template '%1' has unknown core type '%2'").arg(tmpl.name, tmpl.type));
        return std::nullopt;
    }

    const std::optional<CoreEngine> hostEngine = parseCoreEngine(host.coreType);
    if (hostEngine.has_value() && hostEngine.value() != templateEngine.value()) {
        setError(error, ErrorCode::Compatibility,
                 QStringLiteral("Template '%1' targets %2 but agent host %3 runs %4")
                     .arg(tmpl.name, coreEngineName(templateEngine.value()))
                     .arg(host.id)
                     .arg(coreEngineName(hostEngine.value())));
        return std::nullopt;
    }

    // The template decides the engine when the host has not reported one.
    AgentHost effectiveHost = host;
    effectiveHost.coreType = coreEngineName(templateEngine.value());
    const CapabilityFilter filter(effectiveHost.agentCapabilities());

    GeneratedConfig generated;
    if (!tmpl.minVersion.trimmed().isEmpty()) {
        const CompatibilityResult compatibility = filter.checkTemplateCompatibility(tmpl.minVersion, tmpl.capabilities);
        if (!compatibility.compatible) {
            QStringList reasons = compatibility.errors;
            if (reasons.isEmpty()) {
                reasons = compatibility.warnings;
            }
            setError(error, ErrorCode::Compatibility,
                     QStringLiteral("Template '%1' is incompatible with agent host %2: %3")
                         .arg(tmpl.name)
                         .arg(host.id)
                         .arg(reasons.join(QStringLiteral("; "))));
            return std::nullopt;
        }
        generated.warnings.append(compatibility.warnings);
    }

    const FilterResult filtered = filter.filterContext(buildContext(host, effectiveHost.coreType));
    generated.warnings.append(filtered.warnings);

    TemplateError renderError;
    const std::optional<QByteArray> rendered =
        TemplateEngine::render(tmpl.content, filtered.context, &renderError, &generated.warnings);
    if (!rendered.has_value()) {
        setError(error, ErrorCode::Validation,
                 QStringLiteral("Failed to render template '%1': %2").arg(tmpl.name, renderError.toString()));
        return std::nullopt;
    }

    const ValidationResult validation = TemplateValidator::validateFinalConfig(rendered.value(), tmpl.type);
    if (!validation.valid) {
        setError(error, ErrorCode::Validation,
                 QStringLiteral("Generated config validation failed: %1").arg(validation.errorText()));
        return std::nullopt;
    }
    generated.warnings.append(validation.warnings);

    generated.config = rendered.value();
    generated.configHash = sha256Hex(generated.config);

    for (const QString& warning : std::as_const(generated.warnings)) {
        qCWarning(lcHost).noquote() << "agent host" << host.id << "template" << tmpl.id << warning;
    }
    qCInfo(lcHost) << "Generated config for agent host" << host.id << "from template" << tmpl.id
                   << "hash" << generated.configHash;
    return generated;
}
