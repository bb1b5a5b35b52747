/*!
 * @file        imageburner.cppm
 * @brief       Raw image burn with per-window verification.
 * @details     ImageBurner streams a disk image onto a device in fixed-size
 *              chunks and then re-reads the device, comparing SHA-256 digests
 *              of matching windows of image and device. A mismatch is
 *              reported with the byte range of the offending window.
 *              Images ending in `.gz` are decompressed on the fly for both
 *              phases; sizes and progress count uncompressed bytes.
 *
 *              Both phases share one cancellation flag and one progress
 *              signal; consumers tell the phases apart by the BurnProgress
 *              phase tag. A cancelled or failed burn leaves the device
 *              partially written and must be treated as unusable.
 *
 *              State machine per burn() call:
 *              Started -> Writing -> Verifying -> Completed, with Cancelled
 *              reachable from Writing or Verifying and Error from any state.
 *              Terminal states are final for the call.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QtGlobal>
#include <atomic>

#ifndef Q_MOC_RUN
export module kiln.core.imageburner;
export import kiln.core.operation;
import kiln.core.imagesource;
import kiln.device.device_handle;
import kiln.device.unmounter;
import kiln.services.debug_log;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Progress event of a burn.
 */
KILN_MODULE_EXPORT struct BurnProgress {
    enum class Phase {
        Started,    //!< Image opened; total is known.
        Writing,    //!< processed = bytes written.
        Verifying,  //!< processed = bytes verified.
        Completed,  //!< Write and verify succeeded.
        Cancelled,  //!< Stopped between chunks.
        Error       //!< Failed; see detail.
    };

    Phase phase = Phase::Started;   //!< Event tag.
    qint64 processed = 0;           //!< Bytes done in the current phase.
    qint64 total = 0;               //!< Image size in bytes.
    QString detail;                 //!< Error or status text.
};

/**
 * @brief Writes a disk image to a device and verifies it.
 *
 * burn() is blocking and is meant to run on a worker thread; cancel() may
 * be called from any thread.
 */
KILN_MODULE_EXPORT class ImageBurner : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Burn state machine.
     *
     * RolledBack is part of the terminal set but is never entered: a burn
     * is never undone.
     */
    enum class State {
        Idle,           //!< No burn has started.
        Started,        //!< Image opened, device being prepared.
        Writing,        //!< Copying image chunks.
        Verifying,      //!< Comparing device against image.
        Completed,      //!< Terminal: success.
        Cancelled,      //!< Terminal: cancelled.
        Error,          //!< Terminal: failure.
        RolledBack      //!< Terminal: never reached.
    };

    static constexpr qint64 DefaultChunkSize = 4LL * 1024 * 1024;   //!< Write and verify window.
    static constexpr qint64 WipeBytes = 1024LL * 1024;              //!< Leading region cleared before writing.
    static constexpr qint64 SectorSize = 512;                       //!< Device sector size.

    /**
     * @brief Construct a burner.
     * @param device Handle used for all device I/O (not owned).
     * @param unmounter Unmount collaborator (not owned, may be nullptr).
     * @param parent Parent QObject.
     */
    ImageBurner(DeviceHandle* device, Unmounter* unmounter, QObject* parent = nullptr);

    //!< @brief Attach a debug log (not owned, may be nullptr).
    void setDebugLog(DebugLog* log) { m_log = log; }

    //!< @brief Chunk and verify window size; rounded up to whole sectors.
    void setChunkSize(qint64 bytes);
    qint64 chunkSize() const { return m_chunkSize; }

    //!< @brief Clear the first MiB of the device before writing.
    void setWipeBeforeWrite(bool enabled) { m_wipeBeforeWrite = enabled; }

    //!< @brief Deadline passed to the unmounter.
    void setUnmountTimeoutMs(int ms) { m_unmountTimeoutMs = ms; }

    /**
     * @brief Write an image to a device, then verify it.
     *
     * @param imagePath Source disk image, raw or `.gz`.
     * @param deviceId Target device.
     * @return Completed, Cancelled, or Error. A verification mismatch
     *         carries the window range [start, end).
     */
    OperationResult burn(const QString& imagePath, const QString& deviceId);

    //!< @brief Request cancellation; honored between chunks.
    void cancel() { m_cancelRequested.store(true); }

    //!< @brief Current state of the last burn() call.
    State state() const { return m_state.load(); }

    //!< @brief Stable name of a state, used in logs.
    static QString stateName(State state);

signals:
    //!< @brief Emitted after every chunk and on every phase change.
    void progress(const BurnProgress& progress);

    //!< @brief Emitted once with the final result.
    void finished(const OperationResult& result);

private:
    /**
     * @brief Move the state machine.
     * @return false when the transition is not allowed (terminal state).
     */
    bool transition(State next);

    //!< @brief Unmount, optionally wipe, and copy the image.
    OperationResult writePhase(ImageSource& image, qint64 total, const QString& deviceId);

    //!< @brief Re-read the device and compare window digests.
    OperationResult verifyPhase(ImageSource& image, qint64 total, const QString& deviceId);

    //!< @brief Release the unmounter, enter the terminal state, emit the last events.
    OperationResult finish(const OperationResult& result, qint64 total);

    //!< @brief Emit a progress event.
    void report(BurnProgress::Phase phase, qint64 processed, qint64 total, const QString& detail = QString());

    //!< @brief Trace to qDebug and the debug log.
    void trace(const QString& line);

    DeviceHandle* m_device = nullptr;               //!< Device I/O (not owned).
    Unmounter* m_unmounter = nullptr;               //!< Unmount collaborator (not owned).
    DebugLog* m_log = nullptr;                      //!< Debug log (not owned).
    qint64 m_chunkSize = DefaultChunkSize;          //!< Window size.
    bool m_wipeBeforeWrite = true;                  //!< Wipe leading MiB first.
    int m_unmountTimeoutMs = 5000;                  //!< Unmount deadline.
    std::atomic<bool> m_cancelRequested{false};     //!< Cancellation flag.
    std::atomic<State> m_state{State::Idle};        //!< Current state.
    qint64 m_processed = 0;                         //!< Bytes done in the current phase.
};

#include "imageburner.moc"
