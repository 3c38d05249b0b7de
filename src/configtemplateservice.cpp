module;
#include <QByteArray>
#include <QList>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <optional>

module corebridge.backend.configtemplateservice;
import corebridge.backend.capability;
import corebridge.backend.coreengine;
import corebridge.backend.templateengine;

namespace {
Q_LOGGING_CATEGORY(lcTemplate, "corebridge.template")
}

ConfigTemplateService::ConfigTemplateService(ConfigTemplateRepository& templates)
    : m_templates(templates)
{
}

std::optional<ConfigTemplate> ConfigTemplateService::create(const CreateTemplateRequest& request, PipelineError *error)
{
    if (!checkFields(request.name, request.type, request.minVersion, error)) {
        return std::nullopt;
    }

    ConfigTemplate tmpl;
    tmpl.name = request.name.trimmed();
    tmpl.description = request.description;
    tmpl.type = coreEngineName(parseCoreEngine(request.type).value());
    tmpl.content = request.content;
    tmpl.minVersion = request.minVersion.trimmed();
    tmpl.capabilities = normalizeCapabilities(request.capabilities);
    tmpl.schemaVersion = 1;
    applyValidation(tmpl);

    std::optional<ConfigTemplate> stored = m_templates.create(tmpl, error);
    if (stored.has_value()) {
        qCInfo(lcTemplate) << "Created template" << stored->id << stored->name << "valid:" << stored->isValid;
    }
    return stored;
}

std::optional<ConfigTemplate> ConfigTemplateService::update(qint64 id, const UpdateTemplateRequest& request, PipelineError *error)
{
    std::optional<ConfigTemplate> current = m_templates.findById(id, error);
    if (!current.has_value()) {
        return std::nullopt;
    }

    ConfigTemplate tmpl = current.value();
    if (request.name.has_value()) {
        tmpl.name = request.name->trimmed();
    }
    if (request.description.has_value()) {
        tmpl.description = request.description.value();
    }
    if (request.type.has_value()) {
        tmpl.type = request.type->trimmed();
    }
    if (request.content.has_value()) {
        tmpl.content = request.content.value();
    }
    if (request.minVersion.has_value()) {
        tmpl.minVersion = request.minVersion->trimmed();
    }
    if (request.capabilities.has_value()) {
        tmpl.capabilities = normalizeCapabilities(request.capabilities.value());
    }

    if (!checkFields(tmpl.name, tmpl.type, tmpl.minVersion, error)) {
        return std::nullopt;
    }
    tmpl.type = coreEngineName(parseCoreEngine(tmpl.type).value());

    if (request.content.has_value() || request.type.has_value()) {
        applyValidation(tmpl);
    }

    if (!m_templates.update(tmpl, error)) {
        return std::nullopt;
    }
    return m_templates.findById(id, error);
}

bool ConfigTemplateService::remove(qint64 id, PipelineError *error)
{
    return m_templates.remove(id, error);
}

std::optional<ConfigTemplate> ConfigTemplateService::find(qint64 id, PipelineError *error) const
{
    return m_templates.findById(id, error);
}

QList<ConfigTemplate> ConfigTemplateService::list() const
{
    return m_templates.list();
}

ValidationResult ConfigTemplateService::validate(const QString& content, const QString& type) const
{
    return TemplateValidator::validateTemplate(content, type);
}

std::optional<QByteArray> ConfigTemplateService::preview(qint64 id, QStringList *warnings, PipelineError *error) const
{
    const std::optional<ConfigTemplate> tmpl = m_templates.findById(id, error);
    if (!tmpl.has_value()) {
        return std::nullopt;
    }

    TemplateError renderError;
    std::optional<QByteArray> rendered = TemplateEngine::previewRender(tmpl->content, &renderError, warnings);
    if (!rendered.has_value()) {
        setError(error, ErrorCode::Validation,
                 QStringLiteral("Preview of template %1 failed: %2").arg(id).arg(renderError.toString()));
    }
    return rendered;
}

bool ConfigTemplateService::checkFields(const QString& name, const QString& type, const QString& minVersion, PipelineError *error)
{
    if (name.trimmed().isEmpty()) {
        setError(error, ErrorCode::Validation, QStringLiteral("Template name is required."));
        return false;
    }
    if (!parseCoreEngine(type).has_value()) {
        setError(error, ErrorCode::Validation, QStringLiteral("Unknown core type '%1'.").arg(type));
        return false;
    }
    if (!minVersion.trimmed().isEmpty() && !parseCoreVersion(minVersion).has_value()) {
        setError(error, ErrorCode::Validation, QStringLiteral("Invalid minimum version '%1'.").arg(minVersion));
        return false;
    }
    return true;
}

void ConfigTemplateService::applyValidation(ConfigTemplate& tmpl)
{
    const ValidationResult result = TemplateValidator::validateTemplate(tmpl.content, tmpl.type);
    tmpl.isValid = result.valid;
    tmpl.validationError = result.valid ? QString() : result.errorText();
    for (const QString& warning : result.warnings) {
        qCDebug(lcTemplate).noquote() << "template" << tmpl.name << warning;
    }
}

QStringList ConfigTemplateService::normalizeCapabilities(const QStringList& capabilities)
{
    QStringList normalized;
    for (const QString& capability : capabilities) {
        const QString token = normalizeCapability(capability);
        if (!token.isEmpty() && !normalized.contains(token)) {
            normalized.append(token);
        }
    }
    normalized.sort();
    return normalized;
}
