/*!
 * @file        pipelineerror.cppm
 * @brief       Error type shared by the configuration pipeline services.
 *
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

export module corebridge.backend.pipelineerror;

/**
 * @enum ErrorCode
 * @brief Pipeline failure category.
 */
export enum class ErrorCode
{
    Validation,    //!< Request rejected before any write.
    NotFound,      //!< Referenced entity does not exist.
    Conflict,      //!< Duplicate entity or concurrent operation.
    Compatibility, //!< Template cannot run on the agent.
    Remote,        //!< Agent call failed.
    Cancelled,     //!< Caller cancelled the operation.
    Storage        //!< Repository write or read failed.
};

export QString errorCodeName(ErrorCode code);

/**
 * @struct PipelineError
 * @brief Failure code plus human-readable message.
 */
export struct PipelineError {
    ErrorCode code = ErrorCode::Validation;
    QString message;

    QString toString() const;
};

/**
 * @brief Fill @p error when the caller asked for it.
 */
export void setError(PipelineError *error, ErrorCode code, const QString& message);
