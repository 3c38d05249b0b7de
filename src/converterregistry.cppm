/*!
 * @file        converterregistry.cppm
 * @brief       Engine dispatch and cross-engine conversion.
 *
 * @details
 * Routes detection, parsing and serialization to the codec of a given
 * `CoreEngine` and composes them into lossy cross-engine conversion. Every
 * field the target engine cannot express is returned as a warning.
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

#include <optional>

export module corebridge.backend.converterregistry;
export import corebridge.backend.codecresult;
export import corebridge.backend.coreengine;

/**
 * @struct ConversionResult
 * @brief Native config bytes produced by a conversion.
 */
export struct ConversionResult {
    QByteArray config;    //!< Indented JSON in the target engine's shape.
    QStringList warnings; //!< Parse problems and dropped fields.
};

/**
 * @class ConverterRegistry
 * @brief Dispatches codec operations by engine.
 */
export class ConverterRegistry
{
public:
    /**
     * @brief Detect which engine produced a config.
     * @param raw Raw JSON or JSONC bytes.
     * @param errorMessage Optional output message when nothing matches.
     * @return Detected engine or empty optional.
     */
    static std::optional<CoreEngine> detect(const QByteArray& raw, QString *errorMessage = nullptr);

    /**
     * @brief Parse a config with the codec of @p engine.
     * @param raw Raw bytes.
     * @param engine Source engine.
     * @param fileName Source name used in error text.
     * @param errorMessage Optional output message on failure.
     */
    static std::optional<CodecParseResult> parse(const QByteArray& raw,
                                                 CoreEngine engine,
                                                 const QString& fileName = QStringLiteral("config"),
                                                 QString *errorMessage = nullptr);

    /**
     * @brief Parse a config with an engine given by name.
     * @param raw Raw bytes.
     * @param engineName Engine name, case-insensitive. Unknown names fail.
     * @param errorMessage Optional output message on failure.
     */
    static std::optional<CodecParseResult> parse(const QByteArray& raw,
                                                 const QString& engineName,
                                                 QString *errorMessage = nullptr);

    /**
     * @brief Detect the engine and parse.
     */
    static std::optional<CodecParseResult> parseAny(const QString& fileName,
                                                    const QByteArray& raw,
                                                    QString *errorMessage = nullptr);

    /**
     * @brief Serialize canonical inbounds for @p engine.
     */
    static CodecSerializeResult serialize(const QList<Inbound>& inbounds, CoreEngine engine);

    /**
     * @brief Serialize canonical inbounds into indented native JSON.
     * @param inbounds Canonical inbounds.
     * @param target Target engine.
     * @return Config bytes plus dropped-field warnings.
     */
    static ConversionResult convert(const QList<Inbound>& inbounds, CoreEngine target);

    /**
     * @brief Convert a native config from one engine to another.
     * @param sourceEngine Source engine name.
     * @param targetEngine Target engine name.
     * @param raw Non-empty source bytes.
     * @param errorMessage Optional output message on failure.
     * @return Converted config or empty optional on validation/parse failure.
     */
    static std::optional<ConversionResult> convertConfig(const QString& sourceEngine,
                                                         const QString& targetEngine,
                                                         const QByteArray& raw,
                                                         QString *errorMessage = nullptr);

private:
    static void setError(QString *errorMessage, const QString& error);
};
