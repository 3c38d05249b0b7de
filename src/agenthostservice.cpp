module;
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <optional>
#include <utility>

module corebridge.backend.agenthostservice;
import corebridge.backend.coreengine;

namespace {
Q_LOGGING_CATEGORY(lcHost, "corebridge.host")
}

AgentHostService::AgentHostService(AgentHostRepository& hosts,
                                   const ConfigTemplateRepository& templates,
                                   const NodeInventory& inventory)
    : m_hosts(hosts)
    , m_templates(templates)
    , m_generator(inventory)
{
}

bool AgentHostService::assignTemplate(qint64 hostId, qint64 templateId, QStringList *warnings, PipelineError *error)
{
    if (!m_hosts.findById(hostId, error).has_value()) {
        return false;
    }

    if (templateId == 0) {
        if (!m_hosts.setConfigTemplate(hostId, std::nullopt, error)) {
            return false;
        }
        qCInfo(lcHost) << "Cleared template assignment of agent host" << hostId;
        return true;
    }

    if (!m_templates.findById(templateId, error).has_value()) {
        return false;
    }

    PipelineError checkError;
    const std::optional<CompatibilityResult> compatibility = checkTemplateCompatibility(hostId, templateId, &checkError);
    QStringList notes;
    if (!compatibility.has_value()) {
        notes.append(QStringLiteral("Failed to check template compatibility: %1").arg(checkError.message));
    } else {
        notes.append(compatibility->errors);
        notes.append(compatibility->warnings);
    }
    for (const QString& note : std::as_const(notes)) {
        qCWarning(lcHost).noquote() << "agent host" << hostId << "template" << templateId << note;
    }
    if (warnings) {
        warnings->append(notes);
    }

    if (!m_hosts.setConfigTemplate(hostId, templateId, error)) {
        return false;
    }
    qCInfo(lcHost) << "Assigned template" << templateId << "to agent host" << hostId;
    return true;
}

std::optional<CompatibilityResult> AgentHostService::checkTemplateCompatibility(qint64 hostId,
                                                                                qint64 templateId,
                                                                                PipelineError *error) const
{
    const std::optional<AgentHost> host = m_hosts.findById(hostId, error);
    if (!host.has_value()) {
        return std::nullopt;
    }
    const std::optional<ConfigTemplate> tmpl = m_templates.findById(templateId, error);
    if (!tmpl.has_value()) {
        return std::nullopt;
    }

    CompatibilityResult result;
    if (!tmpl->isValid) {
        result.compatible = false;
        result.errors.append(QStringLiteral("Template has validation errors: %1").arg(tmpl->validationError));
        return result;
    }

    const std::optional<CoreEngine> templateEngine = parseCoreEngine(tmpl->type);
    const std::optional<CoreEngine> hostEngine = parseCoreEngine(host->coreType);
    if (templateEngine.has_value() && hostEngine.has_value() && templateEngine.value() != hostEngine.value()) {
        result.compatible = false;
        result.errors.append(QStringLiteral("Template targets %1 but agent runs %2")
                                 .arg(coreEngineName(templateEngine.value()), coreEngineName(hostEngine.value())));
        return result;
    }

    AgentHost effectiveHost = host.value();
    if (!hostEngine.has_value() && templateEngine.has_value()) {
        effectiveHost.coreType = coreEngineName(templateEngine.value());
    }

    const CapabilityFilter filter(effectiveHost.agentCapabilities());
    result = filter.checkTemplateCompatibility(tmpl->minVersion, tmpl->capabilities);

    // An unreported version is advisory until a config is actually generated.
    if (result.versionUnknown && result.errors.isEmpty()) {
        result.compatible = true;
    }
    return result;
}

bool AgentHostService::generateConfig(qint64 hostId, std::optional<GeneratedConfig> *config, PipelineError *error) const
{
    if (config) {
        config->reset();
    }

    const std::optional<AgentHost> host = m_hosts.findById(hostId, error);
    if (!host.has_value()) {
        return false;
    }
    if (!host->configTemplateId.has_value()) {
        qCDebug(lcHost) << "Agent host" << hostId << "has no template, keeping local config";
        return true;
    }

    const std::optional<ConfigTemplate> tmpl = m_templates.findById(host->configTemplateId.value(), error);
    if (!tmpl.has_value()) {
        return false;
    }

    std::optional<GeneratedConfig> generated = m_generator.generate(host.value(), tmpl.value(), error);
    if (!generated.has_value()) {
        return false;
    }
    if (config) {
        *config = std::move(generated);
    }
    return true;
}
