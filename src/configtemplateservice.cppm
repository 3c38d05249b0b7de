/*!
 * @file        configtemplateservice.cppm
 * @brief       Configuration template management.
 *
 * @details
 * Creates, updates and removes templates. Validation runs when a template
 * is created and again whenever its content or type changes; the outcome is
 * stored with the template and never recomputed on read.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

export module corebridge.backend.configtemplateservice;
export import corebridge.backend.repositories;
export import corebridge.backend.templatevalidator;

export struct CreateTemplateRequest {
    QString name;
    QString description;
    QString type;
    QString content;
    QString minVersion;
    QStringList capabilities;
};

/**
 * @struct UpdateTemplateRequest
 * @brief Partial update; empty optionals leave the field unchanged.
 */
export struct UpdateTemplateRequest {
    std::optional<QString> name;
    std::optional<QString> description;
    std::optional<QString> type;
    std::optional<QString> content;
    std::optional<QString> minVersion;
    std::optional<QStringList> capabilities; //!< An empty list clears the capabilities.
};

export class ConfigTemplateService
{
public:
    explicit ConfigTemplateService(ConfigTemplateRepository& templates);

    std::optional<ConfigTemplate> create(const CreateTemplateRequest& request, PipelineError *error = nullptr);
    std::optional<ConfigTemplate> update(qint64 id, const UpdateTemplateRequest& request, PipelineError *error = nullptr);
    bool remove(qint64 id, PipelineError *error = nullptr);
    std::optional<ConfigTemplate> find(qint64 id, PipelineError *error = nullptr) const;
    QList<ConfigTemplate> list() const;

    ValidationResult validate(const QString& content, const QString& type) const;

    /**
     * @brief Render a stored template against the sample context.
     */
    std::optional<QByteArray> preview(qint64 id, QStringList *warnings = nullptr, PipelineError *error = nullptr) const;

private:
    static bool checkFields(const QString& name, const QString& type, const QString& minVersion, PipelineError *error);
    static void applyValidation(ConfigTemplate& tmpl);
    static QStringList normalizeCapabilities(const QStringList& capabilities);

    ConfigTemplateRepository& m_templates;
};
