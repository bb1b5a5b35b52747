/*!
 * @file        operation.cppm
 * @brief       Terminal outcome and typed error of a provisioning operation.
 * @details     Every long-running unit of work in Kiln (download, format,
 *              burn) finishes with exactly one OperationResult. The result
 *              carries the outcome tag, a typed error kind, a human-readable
 *              detail string and, for verification mismatches, the offending
 *              byte range.
 *
 *              Error kinds are grouped into categories so callers can decide
 *              between retrying, elevating privileges, or re-burning from
 *              scratch without inspecting message strings.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.core.operation;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief How an operation ended.
 *
 * Cancellation is a soft outcome and is never reported as an error.
 */
KILN_MODULE_EXPORT enum class Outcome {
    Completed,      //!< Operation finished and its artifact is usable.
    Cancelled,      //!< Operation stopped at a cancellation checkpoint.
    Error           //!< Operation failed; see ErrorKind.
};

/**
 * @brief Concrete failure reasons surfaced by Kiln components.
 */
KILN_MODULE_EXPORT enum class ErrorKind {
    None,               //!< No error.
    InvalidArgument,    //!< Rejected input (chunk count, geometry, empty path).
    NotFound,           //!< Device, file or sidecar does not exist.
    PermissionDenied,   //!< Open or unmount refused by the OS.
    OpenFailed,         //!< Open failed for a reason other than permission.
    SeekFailed,         //!< Positioning the device handle failed.
    ShortWrite,         //!< Fewer bytes written than requested.
    ShortRead,          //!< Fewer bytes read than requested.
    IoError,            //!< Generic read/write/flush failure.
    Network,            //!< Transport level failure.
    HttpStatus,         //!< Server answered with an unexpected status.
    VerifyMismatch,     //!< Device content differs from the source image.
    ChecksumMismatch,   //!< Downloaded file does not match the published hash.
    CorruptState,       //!< Sidecar state file is unreadable or inconsistent.
    CorruptImage        //!< Compressed image stream is damaged or truncated.
};

/**
 * @brief Coarse error grouping that drives user-facing guidance.
 */
KILN_MODULE_EXPORT enum class ErrorCategory {
    None,           //!< No error.
    Configuration,  //!< Bad input, rejected before any I/O.
    TransientIo,    //!< Network or device hiccup; resume or retry.
    Permission,     //!< Needs elevated privileges.
    Integrity       //!< Target is unusable; start over.
};

/**
 * @brief Final result of a download, format or burn invocation.
 */
KILN_MODULE_EXPORT struct OperationResult {
    Outcome outcome = Outcome::Completed;   //!< Terminal outcome.
    ErrorKind error = ErrorKind::None;      //!< Failure reason when outcome is Error.
    QString detail;                         //!< Human-readable context.
    qint64 rangeStart = -1;                 //!< First byte of a mismatching range.
    qint64 rangeEnd = -1;                   //!< One past the last byte of a mismatching range.

    //!< @brief True when the operation completed.
    bool ok() const { return outcome == Outcome::Completed; }

    //!< @brief True when the operation was cancelled.
    bool isCancelled() const { return outcome == Outcome::Cancelled; }

    //!< @brief True when the operation failed.
    bool isError() const { return outcome == Outcome::Error; }

    //!< @brief True when a byte range is attached.
    bool hasRange() const { return rangeStart >= 0 && rangeEnd > rangeStart; }

    //!< @brief Category of the carried error.
    ErrorCategory category() const { return categoryOf(error); }

    //!< @brief Completed result.
    static OperationResult success();

    //!< @brief Cancelled result.
    static OperationResult cancelled(const QString& detail = QString());

    /**
     * @brief Build an Error result.
     * @param kind Failure reason.
     * @param detail Human-readable context.
     */
    static OperationResult failure(ErrorKind kind, const QString& detail);

    /**
     * @brief Build a verification mismatch result for [start, end).
     * @param start First mismatching window byte.
     * @param end One past the last window byte.
     * @param detail Human-readable context.
     */
    static OperationResult mismatch(qint64 start, qint64 end, const QString& detail);

    /**
     * @brief Map an error kind to its category.
     * @param kind Error kind.
     * @return Category used to choose user guidance.
     */
    static ErrorCategory categoryOf(ErrorKind kind);

    //!< @brief Stable name of an error kind, used in logs.
    static QString kindName(ErrorKind kind);

    //!< @brief Stable name of an outcome, used in logs.
    static QString outcomeName(Outcome outcome);

    /**
     * @brief Actionable hint for a category.
     *
     * Permission errors suggest running elevated, integrity errors suggest
     * re-burning or re-downloading, transient errors suggest resuming.
     */
    static QString guidance(ErrorCategory category);

    //!< @brief One-line summary ("Error[ShortWrite]: ...").
    QString toString() const;
};
