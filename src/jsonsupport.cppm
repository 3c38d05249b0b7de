/*!
 * @file        jsonsupport.cppm
 * @brief       Shared JSON helpers for configuration handling.
 *
 * @details
 * Proxy engine configs are frequently hand-edited JSONC. These helpers strip
 * comments and trailing commas, parse documents with consistent error text,
 * coerce loosely typed list fields and hash payloads.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include <optional>

export module corebridge.backend.jsonsupport;

/**
 * @brief Remove line and block comments plus trailing commas.
 * @param raw Raw JSONC text.
 * @return Plain JSON text. String literals are left untouched.
 */
export QByteArray stripJsonComments(const QByteArray& raw);

/**
 * @brief Parse JSON or JSONC bytes.
 * @param raw Input bytes.
 * @param errorMessage Optional output message on failure.
 * @return Parsed document or empty optional.
 */
export std::optional<QJsonDocument> parseJsonDocument(const QByteArray& raw, QString *errorMessage = nullptr);

/**
 * @brief Read a field that may be a single string or an array of strings.
 * @param value Source value.
 * @return Trimmed non-empty entries.
 */
export QStringList jsonStringList(const QJsonValue& value);

/**
 * @brief Convert a string list into a JSON array.
 */
export QJsonArray toJsonArray(const QStringList& values);

/**
 * @brief Read a port that may be encoded as a number or numeric string.
 * @param value Source value.
 * @param ok Set to false when a value is present but not a single port.
 * @return Port number or 0.
 */
export int jsonPort(const QJsonValue& value, bool *ok = nullptr);

/**
 * @brief SHA-256 digest of @p data in lowercase hex.
 */
export QString sha256Hex(const QByteArray& data);
