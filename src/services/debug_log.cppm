/*!
 * @file        debug_log.cppm
 * @brief       Persistent debug log shared by provisioning components.
 * @details     DebugLog writes a plain-text trace of a provisioning run to a
 *              single file. The file is opened once with a header describing
 *              the host, every line is flushed immediately so the trace
 *              survives a crash or a yanked card reader, and the finished log
 *              can be copied onto the provisioned card for later support.
 *
 *              A DebugLog instance is passed to each component that wants to
 *              trace; there is no process-wide instance. Writes are
 *              serialized, so the same log may be shared by a worker thread
 *              and the main thread.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QFile>
#include <QMutex>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.services.debug_log;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Flushed, append-only trace file with an explicit lifecycle.
 */
KILN_MODULE_EXPORT class DebugLog {
public:
    DebugLog() = default;
    ~DebugLog();

    DebugLog(const DebugLog&) = delete;
    DebugLog& operator=(const DebugLog&) = delete;

    /**
     * @brief Create the log file and write the header.
     *
     * The file is truncated. A log that is already open is not re-opened.
     *
     * @param path Log file path.
     * @return true if the log is open after the call.
     */
    bool open(const QString& path);

    //!< @brief Close the log file. Further writes are dropped.
    void close();

    //!< @brief Whether the log file is open.
    bool isOpen() const;

    //!< @brief Path passed to open().
    QString path() const;

    /**
     * @brief Append a timestamped line and flush it.
     * @param line Message text.
     */
    void log(const QString& line);

    /**
     * @brief Append a section banner ("=== TITLE ===").
     * @param title Section name.
     */
    void section(const QString& title);

    /**
     * @brief Copy the log into a directory, typically the card root.
     *
     * @param dir Target directory.
     * @param fileName Name of the copy.
     * @return true if the copy was written.
     */
    bool copyTo(const QString& dir, const QString& fileName = QStringLiteral("installer_debug.txt"));

    //!< @brief Default log location in the system temp directory.
    static QString defaultPath();

private:
    //!< @brief Write raw text and flush. Caller holds m_mutex.
    void writeLocked(const QString& text);

    mutable QMutex m_mutex;     //!< Serializes writes.
    QFile m_file;               //!< Log file.
    QString m_path;             //!< Log file path.
};
