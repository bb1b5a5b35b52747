/*!
 * @file        imagesource.cppm
 * @brief       Sequential reader for raw and gzip-compressed disk images.
 * @details     ImageSource hands the burner an image as a plain byte
 *              stream. Files ending in `.gz` are inflated on the fly through
 *              zlib; their uncompressed size is found by a full pre-scan on
 *              open() so progress totals are exact. Concatenated gzip
 *              members are read as one stream.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QFile>
#include <QString>
#include <QtGlobal>
#include <zlib.h>

#ifndef Q_MOC_RUN
export module kiln.core.imagesource;
export import kiln.core.operation;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

/**
 * @brief Reads an image front to back, decompressing `.gz` files.
 */
KILN_MODULE_EXPORT class ImageSource {
public:
    static constexpr qint64 InputBufferSize = 256LL * 1024;     //!< Compressed bytes read per refill.
    static constexpr qint64 ScanBufferSize = 1024LL * 1024;     //!< Window used by the size pre-scan.

    ImageSource() = default;
    ~ImageSource();

    ImageSource(const ImageSource&) = delete;
    ImageSource& operator=(const ImageSource&) = delete;

    /**
     * @brief Open an image and determine its uncompressed size.
     *
     * @param path Raw image or `.gz` file.
     * @return Completed; NotFound, PermissionDenied or OpenFailed when the
     *         file cannot be opened; InvalidArgument when it holds no data;
     *         CorruptImage when the gzip stream is damaged.
     */
    OperationResult open(const QString& path);

    /**
     * @brief Read the next bytes of the image.
     *
     * @param length Bytes wanted.
     * @param out Receives up to length bytes; fewer only at the end.
     */
    OperationResult read(qint64 length, QByteArray& out);

    //!< @brief Restart from the first byte.
    OperationResult rewind();

    //!< @brief Release the file and the decoder. Safe to call twice.
    void close();

    //!< @brief Uncompressed image size, -1 before open().
    qint64 size() const { return m_size; }

    //!< @brief Whether the image is inflated while read.
    bool isCompressed() const { return m_compressed; }

    //!< @brief Whether a path names a gzip image.
    static bool isGzipPath(const QString& path);

private:
    //!< @brief Inflate up to length bytes into out.
    OperationResult inflateInto(qint64 length, QByteArray& out);

    //!< @brief Whether another gzip member starts at the current input.
    bool nextMemberFollows();

    //!< @brief Read the whole stream once to count its bytes.
    OperationResult scanSize();

    QFile m_file;                   //!< Image file.
    z_stream m_stream{};            //!< Inflate state for `.gz` images.
    QByteArray m_input;             //!< Compressed input buffer.
    bool m_compressed = false;      //!< `.gz` image.
    bool m_inflating = false;       //!< m_stream is initialized.
    bool m_streamEnded = false;     //!< Last gzip member fully inflated.
    qint64 m_size = -1;             //!< Uncompressed size.
};
