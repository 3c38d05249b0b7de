/*!
 * @file        singboxcodec.cppm
 * @brief       sing-box configuration codec.
 *
 * @details
 * Reads sing-box inbounds into canonical `Inbound` values and writes
 * canonical inbounds back as sing-box inbound objects. Multiplex and Brutal
 * survive natively; Xray-only fields such as Reality fingerprints and extra
 * server names are reported as dropped while writing.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

export module corebridge.backend.singboxcodec;
import corebridge.backend.codecresult;

/**
 * @class SingBoxCodec
 * @brief Detects, parses and serializes sing-box inbound configuration.
 */
export class SingBoxCodec
{
public:
    /**
     * @brief Sniff whether bytes look like a sing-box config.
     * @param raw Raw JSON or JSONC bytes.
     * @return True for an object with an `inbounds` array without Xray markers.
     */
    static bool canParse(const QByteArray& raw);

    /**
     * @brief Parse sing-box inbounds.
     * @param fileName Source name used in error text.
     * @param raw Raw JSON or JSONC bytes. A bare inbound array is accepted.
     * @param errorMessage Optional output message on failure.
     * @return Parse result or empty optional on malformed input.
     */
    static std::optional<CodecParseResult> parse(const QString& fileName,
                                                 const QByteArray& raw,
                                                 QString *errorMessage = nullptr);

    /**
     * @brief Serialize canonical inbounds into a sing-box document.
     * @param inbounds Canonical inbounds.
     * @return `{"inbounds": [...]}` plus warnings for dropped fields.
     */
    static CodecSerializeResult serialize(const QList<Inbound>& inbounds);

    /**
     * @brief Build one sing-box inbound object.
     * @param inbound Canonical inbound.
     * @param warnings Receives dropped-field warnings.
     * @return Inbound object, or empty optional when the protocol has no sing-box form.
     */
    static std::optional<QJsonObject> buildInbound(const Inbound& inbound, QStringList *warnings);

private:
    static std::optional<Inbound> parseInbound(const QJsonObject& json, int index, QStringList *warnings);
    static QJsonArray buildUsers(const Inbound& inbound, QStringList *warnings);
    static QJsonObject buildTls(const Inbound& inbound, QStringList *warnings);
    static std::optional<QJsonObject> buildTransport(const Inbound& inbound, QStringList *warnings);
    static void setError(QString *errorMessage, const QString& error);
};
