module;
#include <QByteArray>
#include <QJsonDocument>
#include <QList>
#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <optional>

module corebridge.backend.converterregistry;
import corebridge.backend.jsonsupport;
import corebridge.backend.singboxcodec;
import corebridge.backend.xraycodec;

namespace {
Q_LOGGING_CATEGORY(lcConvert, "corebridge.convert")

bool canParse(CoreEngine engine, const QByteArray& raw)
{
    switch (engine) {
    case CoreEngine::SingBox:
        return SingBoxCodec::canParse(raw);
    case CoreEngine::Xray:
        return XrayCodec::canParse(raw);
    }
    return false;
}
}

std::optional<CoreEngine> ConverterRegistry::detect(const QByteArray& raw, QString *errorMessage)
{
    QString parseError;
    if (!parseJsonDocument(raw, &parseError).has_value()) {
        setError(errorMessage, parseError);
        return std::nullopt;
    }

    for (CoreEngine engine : supportedCoreEngines()) {
        if (canParse(engine, raw)) {
            return engine;
        }
    }

    setError(errorMessage, QStringLiteral("Configuration format was not recognized."));
    return std::nullopt;
}

std::optional<CodecParseResult> ConverterRegistry::parse(const QByteArray& raw,
                                                         CoreEngine engine,
                                                         const QString& fileName,
                                                         QString *errorMessage)
{
    switch (engine) {
    case CoreEngine::SingBox:
        return SingBoxCodec::parse(fileName, raw, errorMessage);
    case CoreEngine::Xray:
        return XrayCodec::parse(fileName, raw, errorMessage);
    }

    setError(errorMessage, QStringLiteral("Unsupported core engine."));
    return std::nullopt;
}

std::optional<CodecParseResult> ConverterRegistry::parse(const QByteArray& raw,
                                                         const QString& engineName,
                                                         QString *errorMessage)
{
    const std::optional<CoreEngine> engine = parseCoreEngine(engineName);
    if (!engine.has_value()) {
        setError(errorMessage, QStringLiteral("Unknown core engine '%1'.").arg(engineName));
        return std::nullopt;
    }
    return parse(raw, engine.value(), coreEngineName(engine.value()), errorMessage);
}

std::optional<CodecParseResult> ConverterRegistry::parseAny(const QString& fileName,
                                                            const QByteArray& raw,
                                                            QString *errorMessage)
{
    const std::optional<CoreEngine> engine = detect(raw, errorMessage);
    if (!engine.has_value()) {
        return std::nullopt;
    }
    return parse(raw, engine.value(), fileName, errorMessage);
}

CodecSerializeResult ConverterRegistry::serialize(const QList<Inbound>& inbounds, CoreEngine engine)
{
    switch (engine) {
    case CoreEngine::SingBox:
        return SingBoxCodec::serialize(inbounds);
    case CoreEngine::Xray:
        return XrayCodec::serialize(inbounds);
    }
    return {};
}

ConversionResult ConverterRegistry::convert(const QList<Inbound>& inbounds, CoreEngine target)
{
    const CodecSerializeResult serialized = serialize(inbounds, target);

    ConversionResult result;
    result.config = QJsonDocument(serialized.config).toJson(QJsonDocument::Indented);
    result.warnings = serialized.warnings;
    return result;
}

std::optional<ConversionResult> ConverterRegistry::convertConfig(const QString& sourceEngine,
                                                                 const QString& targetEngine,
                                                                 const QByteArray& raw,
                                                                 QString *errorMessage)
{
    if (sourceEngine.trimmed().isEmpty() || targetEngine.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Source and target core types are required."));
        return std::nullopt;
    }
    if (raw.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("Configuration payload is empty."));
        return std::nullopt;
    }

    const std::optional<CoreEngine> source = parseCoreEngine(sourceEngine);
    if (!source.has_value()) {
        setError(errorMessage, QStringLiteral("Unknown source core engine '%1'.").arg(sourceEngine));
        return std::nullopt;
    }
    const std::optional<CoreEngine> target = parseCoreEngine(targetEngine);
    if (!target.has_value()) {
        setError(errorMessage, QStringLiteral("Unknown target core engine '%1'.").arg(targetEngine));
        return std::nullopt;
    }

    const std::optional<CodecParseResult> parsed =
        parse(raw, source.value(), coreEngineName(source.value()), errorMessage);
    if (!parsed.has_value()) {
        return std::nullopt;
    }

    ConversionResult result = convert(parsed->inbounds, target.value());
    result.warnings = parsed->warnings + result.warnings;

    qCInfo(lcConvert) << "Converted" << parsed->inbounds.size() << "inbound(s) from"
                      << coreEngineName(source.value()) << "to" << coreEngineName(target.value())
                      << "with" << result.warnings.size() << "warning(s)";
    return result;
}

void ConverterRegistry::setError(QString *errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
