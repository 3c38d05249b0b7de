module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <optional>

module corebridge.backend.templatevalidator;
import corebridge.backend.coreengine;
import corebridge.backend.jsonsupport;
import corebridge.backend.templateengine;

namespace {
Q_LOGGING_CATEGORY(lcValidator, "corebridge.template")

bool hasUsers(const QJsonObject& inbound)
{
    return !inbound.value(QStringLiteral("users")).toArray().isEmpty();
}

void checkPort(const QJsonValue& value, const QString& where, const QString& key, ValidationResult& result)
{
    if (value.isUndefined()) {
        return;
    }
    bool ok = false;
    const int port = jsonPort(value, &ok);
    if (!ok || port < 1 || port > 65535) {
        result.addError(QStringLiteral("%1: %2 must be between 1 and 65535").arg(where, key));
    }
}
}

void ValidationResult::addError(const QString& error)
{
    valid = false;
    errors.append(error);
}

void ValidationResult::addWarning(const QString& warning)
{
    warnings.append(warning);
}

QString ValidationResult::errorText() const
{
    return errors.join(QStringLiteral("; "));
}

ValidationResult TemplateValidator::validateTemplate(const QString& content, const QString& coreType)
{
    ValidationResult result;
    if (content.trimmed().isEmpty()) {
        result.addError(QStringLiteral("Template content is empty"));
        return result;
    }

    TemplateError error;
    if (!TemplateEngine::checkSyntax(content, &error)) {
        result.addError(error.toString());
        return result;
    }

    const std::optional<QByteArray> preview = TemplateEngine::previewRender(content, &error, &result.warnings);
    if (!preview.has_value()) {
        result.addError(error.toString());
        return result;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(preview.value());
    if (!doc.isObject()) {
        result.addError(QStringLiteral("Rendered template must be a JSON object"));
        return result;
    }

    checkStructure(doc.object(), coreType, result);
    qCDebug(lcValidator) << "Template validated for" << coreType << "valid:" << result.valid
                         << "errors:" << result.errors.size() << "warnings:" << result.warnings.size();
    return result;
}

ValidationResult TemplateValidator::validateFinalConfig(const QByteArray& config, const QString& coreType)
{
    ValidationResult result;
    QString parseError;
    const std::optional<QJsonDocument> doc = parseJsonDocument(config, &parseError);
    if (!doc.has_value()) {
        result.addError(parseError);
        return result;
    }
    if (!doc->isObject()) {
        result.addError(QStringLiteral("Configuration must be a JSON object"));
        return result;
    }

    checkStructure(doc->object(), coreType, result);
    return result;
}

void TemplateValidator::checkStructure(const QJsonObject& root, const QString& coreType, ValidationResult& result)
{
    const std::optional<CoreEngine> engine = parseCoreEngine(coreType);
    if (!engine.has_value()) {
        result.addWarning(QStringLiteral("Unknown core type '%1': structural checks skipped").arg(coreType));
        return;
    }

    switch (engine.value()) {
    case CoreEngine::SingBox:
        checkSingBox(root, result);
        break;
    case CoreEngine::Xray:
        checkXray(root, result);
        break;
    }
}

void TemplateValidator::checkSingBox(const QJsonObject& root, ValidationResult& result)
{
    if (!root.contains(QStringLiteral("log"))) {
        result.addWarning(QStringLiteral("Missing 'log' section"));
    }

    if (!root.contains(QStringLiteral("inbounds"))) {
        result.addWarning(QStringLiteral("Missing 'inbounds' section"));
    } else if (!root.value(QStringLiteral("inbounds")).isArray()) {
        result.addError(QStringLiteral("'inbounds' must be an array"));
    } else {
        const QJsonArray inbounds = root.value(QStringLiteral("inbounds")).toArray();
        for (qsizetype i = 0; i < inbounds.size(); ++i) {
            const QString where = QStringLiteral("inbounds[%1]").arg(i);
            if (!inbounds.at(i).isObject()) {
                result.addError(QStringLiteral("%1: must be an object").arg(where));
                continue;
            }
            const QJsonObject inbound = inbounds.at(i).toObject();
            const QString type = inbound.value(QStringLiteral("type")).toString();
            if (type.isEmpty()) {
                result.addError(QStringLiteral("%1: missing 'type'").arg(where));
            }
            if (inbound.value(QStringLiteral("tag")).toString().isEmpty()) {
                result.addError(QStringLiteral("%1: missing 'tag'").arg(where));
            }
            checkPort(inbound.value(QStringLiteral("listen_port")), where, QStringLiteral("listen_port"), result);

            if ((type == QStringLiteral("vless") || type == QStringLiteral("vmess") || type == QStringLiteral("trojan"))
                && !hasUsers(inbound)) {
                result.addWarning(QStringLiteral("%1: %2 inbound has no users").arg(where, type));
            }
            if ((type == QStringLiteral("hysteria2") || type == QStringLiteral("tuic"))
                && !inbound.value(QStringLiteral("tls")).toObject().value(QStringLiteral("enabled")).toBool()) {
                result.addWarning(QStringLiteral("%1: %2 inbound requires TLS").arg(where, type));
            }
        }
    }

    if (!root.contains(QStringLiteral("outbounds"))) {
        result.addWarning(QStringLiteral("Missing 'outbounds' section"));
    } else if (!root.value(QStringLiteral("outbounds")).isArray()) {
        result.addError(QStringLiteral("'outbounds' must be an array"));
    } else {
        const QJsonArray outbounds = root.value(QStringLiteral("outbounds")).toArray();
        for (qsizetype i = 0; i < outbounds.size(); ++i) {
            const QString where = QStringLiteral("outbounds[%1]").arg(i);
            const QJsonObject outbound = outbounds.at(i).toObject();
            if (outbound.value(QStringLiteral("type")).toString().isEmpty()) {
                result.addError(QStringLiteral("%1: missing 'type'").arg(where));
            }
            if (outbound.value(QStringLiteral("tag")).toString().isEmpty()) {
                result.addError(QStringLiteral("%1: missing 'tag'").arg(where));
            }
        }
    }
}

void TemplateValidator::checkXray(const QJsonObject& root, ValidationResult& result)
{
    if (!root.contains(QStringLiteral("inbounds"))) {
        result.addWarning(QStringLiteral("Missing 'inbounds' section"));
    } else if (!root.value(QStringLiteral("inbounds")).isArray()) {
        result.addError(QStringLiteral("'inbounds' must be an array"));
    } else {
        const QJsonArray inbounds = root.value(QStringLiteral("inbounds")).toArray();
        for (qsizetype i = 0; i < inbounds.size(); ++i) {
            const QString where = QStringLiteral("inbounds[%1]").arg(i);
            if (!inbounds.at(i).isObject()) {
                result.addError(QStringLiteral("%1: must be an object").arg(where));
                continue;
            }
            const QJsonObject inbound = inbounds.at(i).toObject();
            if (inbound.value(QStringLiteral("protocol")).toString().isEmpty()) {
                result.addError(QStringLiteral("%1: missing 'protocol'").arg(where));
            }
            if (inbound.value(QStringLiteral("tag")).toString().isEmpty()) {
                result.addError(QStringLiteral("%1: missing 'tag'").arg(where));
            }
            // String ports may be ranges or env references.
            if (inbound.value(QStringLiteral("port")).isDouble()) {
                checkPort(inbound.value(QStringLiteral("port")), where, QStringLiteral("port"), result);
            }
            if (!inbound.contains(QStringLiteral("settings"))) {
                result.addWarning(QStringLiteral("%1: missing 'settings'").arg(where));
            }
        }
    }

    if (!root.contains(QStringLiteral("outbounds"))) {
        result.addWarning(QStringLiteral("Missing 'outbounds' section"));
    } else if (!root.value(QStringLiteral("outbounds")).isArray()) {
        result.addError(QStringLiteral("'outbounds' must be an array"));
    } else {
        const QJsonArray outbounds = root.value(QStringLiteral("outbounds")).toArray();
        for (qsizetype i = 0; i < outbounds.size(); ++i) {
            if (outbounds.at(i).toObject().value(QStringLiteral("protocol")).toString().isEmpty()) {
                result.addError(QStringLiteral("outbounds[%1]: missing 'protocol'").arg(i));
            }
        }
    }
}
