/*!
 * @file        templateengine.cppm
 * @brief       Configuration template rendering.
 *
 * @details
 * Renders admin-authored templates against a `TemplateContext`. Templates
 * use `{{ ... }}` actions with paths (`.server.log_level`, `$.agent.id`),
 * literals, function calls, pipelines, `if`/`else`/`end` and `range` blocks.
 * Engine-specific helpers emit inbound, outbound, DNS, routing and stats
 * blocks through the format codecs. Rendering is deterministic; unresolved
 * placeholders and non-JSON output are fatal for the render call.
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

export module corebridge.backend.templateengine;
export import corebridge.backend.templatecontext;

/**
 * @enum TemplateErrorKind
 * @brief Render failure category.
 */
export enum class TemplateErrorKind
{
    Syntax,      //!< Template text could not be parsed.
    Execution,   //!< Parsed template failed while rendering.
    InvalidJson  //!< Rendered text is not a JSON document.
};

/**
 * @struct TemplateError
 * @brief Render failure description.
 */
export struct TemplateError {
    TemplateErrorKind kind = TemplateErrorKind::Execution; //!< Failure category.
    QString message; //!< Failure text.
    int line = 0;    //!< 1-based template line, 0 when unknown.

    //! Message prefixed with the category and line.
    QString toString() const;
};

/**
 * @class TemplateEngine
 * @brief Renders configuration templates.
 */
export class TemplateEngine
{
public:
    /**
     * @brief Render a template into an indented JSON configuration.
     * @param content Template text.
     * @param context Render input.
     * @param error Optional output error.
     * @param warnings Optional output for fields dropped by codec helpers.
     * @return Rendered configuration or empty optional on failure.
     */
    static std::optional<QByteArray> render(const QString& content,
                                            const TemplateContext& context,
                                            TemplateError *error = nullptr,
                                            QStringList *warnings = nullptr);

    /**
     * @brief Render against the built-in sample context.
     */
    static std::optional<QByteArray> previewRender(const QString& content,
                                                   TemplateError *error = nullptr,
                                                   QStringList *warnings = nullptr);

    /**
     * @brief Render without the JSON check.
     * @return Raw rendered text or empty optional on syntax/execution failure.
     */
    static std::optional<QString> renderText(const QString& content,
                                             const TemplateContext& context,
                                             TemplateError *error = nullptr,
                                             QStringList *warnings = nullptr);

    /**
     * @brief Parse a template without rendering it.
     * @return True when the template is syntactically valid.
     */
    static bool checkSyntax(const QString& content, TemplateError *error = nullptr);

    /**
     * @brief Names of the functions available to templates, sorted.
     */
    static QStringList functionNames();
};
