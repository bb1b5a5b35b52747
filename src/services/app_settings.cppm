/*!
 * @file        app_settings.cppm
 * @brief       Persisted provisioning defaults.
 * @details     AppSettings groups the tunables of a provisioning run (volume
 *              label, download chunking, partition start, burn chunk size,
 *              unmount timeout, log location) and stores them with QSettings
 *              under the "provisioning" group. Command-line options override
 *              the loaded values for a single run.
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
export module kiln.services.app_settings;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Provisioning defaults backed by QSettings.
 */
KILN_MODULE_EXPORT struct AppSettings {
    QString volumeLabel = QStringLiteral("KILN");               //!< FAT32 volume label.
    int downloadChunks = 8;                                     //!< Chunks per ranged download.
    qint64 minChunkedSize = 10LL * 1024 * 1024;                 //!< Smallest size that is downloaded in chunks.
    QString userAgent = QStringLiteral("kiln/0.1");             //!< HTTP User-Agent.
    qint64 partitionStartSector = 2048;                         //!< First sector of the FAT32 partition.
    bool writePartitionTable = true;                            //!< Write an MBR before formatting.
    qint64 burnChunkBytes = 4LL * 1024 * 1024;                  //!< Burn and verify window size.
    bool wipeBeforeBurn = true;                                 //!< Zero the first MiB before burning.
    int unmountTimeoutMs = 5000;                                //!< Unmount deadline.
    QString logPath;                                            //!< Debug log path (empty = temp dir).

    //!< @brief QSettings group that holds the values.
    static QString settingsGroup() { return QStringLiteral("provisioning"); }

    //!< @brief Read values from QSettings, keeping defaults for missing keys.
    void load();

    //!< @brief Write values to QSettings.
    void save() const;
};
