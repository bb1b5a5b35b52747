module;
#include <QString>
#include <QtGlobal>

module kiln.core.operation;

OperationResult OperationResult::success()
{
    return OperationResult{};
}

OperationResult OperationResult::cancelled(const QString& detail)
{
    OperationResult r;
    r.outcome = Outcome::Cancelled;
    r.detail = detail;
    return r;
}

OperationResult OperationResult::failure(ErrorKind kind, const QString& detail)
{
    OperationResult r;
    r.outcome = Outcome::Error;
    r.error = kind;
    r.detail = detail;
    return r;
}

OperationResult OperationResult::mismatch(qint64 start, qint64 end, const QString& detail)
{
    OperationResult r = failure(ErrorKind::VerifyMismatch, detail);
    r.rangeStart = start;
    r.rangeEnd = end;
    return r;
}

ErrorCategory OperationResult::categoryOf(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return ErrorCategory::None;
    case ErrorKind::InvalidArgument:
    case ErrorKind::NotFound:
        return ErrorCategory::Configuration;
    case ErrorKind::PermissionDenied:
        return ErrorCategory::Permission;
    case ErrorKind::OpenFailed:
    case ErrorKind::SeekFailed:
    case ErrorKind::ShortRead:
    case ErrorKind::IoError:
    case ErrorKind::Network:
    case ErrorKind::HttpStatus:
        return ErrorCategory::TransientIo;
    case ErrorKind::ShortWrite:
    case ErrorKind::VerifyMismatch:
    case ErrorKind::ChecksumMismatch:
    case ErrorKind::CorruptState:
    case ErrorKind::CorruptImage:
        return ErrorCategory::Integrity;
    }
    return ErrorCategory::TransientIo;
}

QString OperationResult::kindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:             return QStringLiteral("None");
    case ErrorKind::InvalidArgument:  return QStringLiteral("InvalidArgument");
    case ErrorKind::NotFound:         return QStringLiteral("NotFound");
    case ErrorKind::PermissionDenied: return QStringLiteral("PermissionDenied");
    case ErrorKind::OpenFailed:       return QStringLiteral("OpenFailed");
    case ErrorKind::SeekFailed:       return QStringLiteral("SeekFailed");
    case ErrorKind::ShortWrite:       return QStringLiteral("ShortWrite");
    case ErrorKind::ShortRead:        return QStringLiteral("ShortRead");
    case ErrorKind::IoError:          return QStringLiteral("IoError");
    case ErrorKind::Network:          return QStringLiteral("Network");
    case ErrorKind::HttpStatus:       return QStringLiteral("HttpStatus");
    case ErrorKind::VerifyMismatch:   return QStringLiteral("VerifyMismatch");
    case ErrorKind::ChecksumMismatch: return QStringLiteral("ChecksumMismatch");
    case ErrorKind::CorruptState:     return QStringLiteral("CorruptState");
    case ErrorKind::CorruptImage:     return QStringLiteral("CorruptImage");
    }
    return QStringLiteral("Unknown");
}

QString OperationResult::outcomeName(Outcome outcome)
{
    switch (outcome) {
    case Outcome::Completed: return QStringLiteral("Completed");
    case Outcome::Cancelled: return QStringLiteral("Cancelled");
    case Outcome::Error:     return QStringLiteral("Error");
    }
    return QStringLiteral("Unknown");
}

QString OperationResult::guidance(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::None:
        return QString();
    case ErrorCategory::Configuration:
        return QStringLiteral("Check the device path and options, then try again.");
    case ErrorCategory::TransientIo:
        return QStringLiteral("Check the connection or card reader and run the same command again to resume.");
    case ErrorCategory::Permission:
        return QStringLiteral("Raw device access was refused. Try running elevated (sudo / Administrator).");
    case ErrorCategory::Integrity:
        return QStringLiteral("The target cannot be trusted. Re-download or re-burn from the beginning.");
    }
    return QString();
}

QString OperationResult::toString() const
{
    if (outcome != Outcome::Error) {
        return detail.isEmpty() ? outcomeName(outcome)
                                : QStringLiteral("%1: %2").arg(outcomeName(outcome), detail);
    }
    QString line = QStringLiteral("Error[%1]: %2").arg(kindName(error), detail);
    if (hasRange()) {
        line += QStringLiteral(" (bytes %1-%2)").arg(rangeStart).arg(rangeEnd);
    }
    return line;
}
