/*!
 * @file        templatevalidator.cppm
 * @brief       Template and rendered configuration validation.
 *
 * @details
 * Validates stored templates by parsing and preview-rendering them, then
 * runs engine-specific structural checks on the result. The same checks
 * run on final configurations before they are sent to an agent.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

export module corebridge.backend.templatevalidator;

/**
 * @struct ValidationResult
 * @brief Validation outcome.
 */
export struct ValidationResult {
    bool valid = true;    //!< False when any error was recorded.
    QStringList errors;   //!< Fatal problems.
    QStringList warnings; //!< Advisory problems.

    void addError(const QString& error);
    void addWarning(const QString& warning);

    //! Errors joined for storage in a single column.
    QString errorText() const;
};

/**
 * @class TemplateValidator
 * @brief Static validation entry points.
 */
export class TemplateValidator
{
public:
    /**
     * @brief Validate a template for an engine type.
     * @param content Template text.
     * @param coreType Engine name, e.g. "sing-box" or "xray".
     */
    static ValidationResult validateTemplate(const QString& content, const QString& coreType);

    /**
     * @brief Validate a rendered configuration.
     * @param config Configuration bytes.
     * @param coreType Engine name.
     */
    static ValidationResult validateFinalConfig(const QByteArray& config, const QString& coreType);

private:
    static void checkStructure(const QJsonObject& root, const QString& coreType, ValidationResult& result);
    static void checkSingBox(const QJsonObject& root, ValidationResult& result);
    static void checkXray(const QJsonObject& root, ValidationResult& result);
};
