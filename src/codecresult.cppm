/*!
 * @file        codecresult.cppm
 * @brief       Result types shared by the format codecs.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QList>
#include <QStringList>

export module corebridge.backend.codecresult;
export import corebridge.backend.inbound;

/**
 * @struct CodecParseResult
 * @brief Inbounds read from a native config plus element-level problems.
 */
export struct CodecParseResult {
    QList<Inbound> inbounds; //!< Parsed canonical inbounds.
    QStringList warnings;    //!< Malformed elements that were skipped or partially read.
};

/**
 * @struct CodecSerializeResult
 * @brief Native config emitted from canonical inbounds.
 */
export struct CodecSerializeResult {
    QJsonObject config;   //!< Native document with an `inbounds` array.
    QStringList warnings; //!< Fields dropped because the engine cannot express them.
};
