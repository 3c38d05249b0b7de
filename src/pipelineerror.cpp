module;
#include <QString>

module corebridge.backend.pipelineerror;

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Validation:
        return QStringLiteral("validation");
    case ErrorCode::NotFound:
        return QStringLiteral("not_found");
    case ErrorCode::Conflict:
        return QStringLiteral("conflict");
    case ErrorCode::Compatibility:
        return QStringLiteral("compatibility");
    case ErrorCode::Remote:
        return QStringLiteral("remote");
    case ErrorCode::Cancelled:
        return QStringLiteral("cancelled");
    case ErrorCode::Storage:
        return QStringLiteral("storage");
    }
    return QStringLiteral("unknown");
}

QString PipelineError::toString() const
{
    return QStringLiteral("%1: %2").arg(errorCodeName(code), message);
}

void setError(PipelineError *error, ErrorCode code, const QString& message)
{
    if (error) {
        error->code = code;
        error->message = message;
    }
}
