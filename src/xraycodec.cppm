/*!
 * @file        xraycodec.cppm
 * @brief       Xray configuration codec.
 *
 * @details
 * Reads server-side Xray inbounds into canonical `Inbound` values and writes
 * canonical inbounds back as Xray inbound objects, including stream settings
 * for the supported transports and TLS/Reality security layers. Fields Xray
 * cannot carry are reported as warnings while writing.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

export module corebridge.backend.xraycodec;
import corebridge.backend.codecresult;

/**
 * @class XrayCodec
 * @brief Detects, parses and serializes Xray inbound configuration.
 */
export class XrayCodec
{
public:
    /**
     * @brief Sniff whether bytes look like an Xray config.
     * @param raw Raw JSON or JSONC bytes.
     * @return True when an `inbounds` element carries `protocol` or `streamSettings`.
     */
    static bool canParse(const QByteArray& raw);

    /**
     * @brief Parse Xray inbounds.
     * @param fileName Source name used in error text.
     * @param raw Raw JSON or JSONC bytes. A bare inbound array is accepted.
     * @param errorMessage Optional output message on failure.
     * @return Parse result or empty optional on malformed input.
     */
    static std::optional<CodecParseResult> parse(const QString& fileName,
                                                 const QByteArray& raw,
                                                 QString *errorMessage = nullptr);

    /**
     * @brief Serialize canonical inbounds into an Xray document.
     * @param inbounds Canonical inbounds.
     * @return `{"inbounds": [...]}` plus warnings for dropped fields.
     */
    static CodecSerializeResult serialize(const QList<Inbound>& inbounds);

    /**
     * @brief Build one Xray inbound object.
     * @param inbound Canonical inbound.
     * @param warnings Receives dropped-field warnings.
     * @return Inbound object, or empty optional when the protocol has no Xray form.
     */
    static std::optional<QJsonObject> buildInbound(const Inbound& inbound, QStringList *warnings);

private:
    /**
     * @brief Build stream settings from transport and TLS data.
     * @param inbound Canonical inbound.
     * @param warnings Receives dropped-field warnings.
     * @return Stream settings object.
     */
    static QJsonObject buildStreamSettings(const Inbound& inbound, QStringList *warnings);

    /**
     * @brief Build protocol settings for an inbound.
     */
    static QJsonObject buildSettings(const Inbound& inbound, QStringList *warnings);

    /**
     * @brief Read one native inbound element.
     * @param json Native inbound object.
     * @param index Element index for diagnostics.
     * @param warnings Receives element-level problems.
     * @return Canonical inbound, or empty optional when the element is unusable.
     */
    static std::optional<Inbound> parseInbound(const QJsonObject& json, int index, QStringList *warnings);

    /**
     * @brief Read streamSettings into transport and TLS data.
     */
    static void parseStreamSettings(const QJsonObject& stream, Inbound& inbound, QStringList *warnings);

    /**
     * @brief Helper to set consistent parse errors.
     * @param errorMessage Optional output pointer.
     * @param error Message value.
     */
    static void setError(QString *errorMessage, const QString& error);
};
