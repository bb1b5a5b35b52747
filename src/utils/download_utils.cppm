/*!
 * @file        download_utils.cppm
 * @brief       Common helpers for download paths, URLs and checksums.
 * @details     Small, side-effect free helpers shared by the downloader, the
 *              resume state and the command-line front end: path
 *              normalization, filename inference from URLs, sidecar naming,
 *              checksum normalization and algorithm detection, and byte
 *              count formatting for logs.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kiln/blob/main/LICENSE.md
 */

module;
#include <QCryptographicHash>
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kiln.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define KILN_MODULE_EXPORT
#else
#define KILN_MODULE_EXPORT export
#endif

KILN_MODULE_EXPORT namespace kiln::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Path of the resume sidecar that belongs to a destination file.
 *
 * @param destPath Destination file path.
 * @return `<destPath>.partial`.
 */
QString partialStatePath(const QString& destPath);

/**
 * @brief Decodes a URL query string value.
 *
 * Handles standard percent-decoding and converts '+' characters into spaces.
 *
 * @param value Encoded query value.
 * @return Decoded string.
 */
QString decodeQueryValue(const QString& value);

/**
 * @brief Extracts a filename from a Content-Disposition header value.
 *
 * @param value Raw Content-Disposition header value.
 * @return Extracted filename, or an empty string if none could be determined.
 */
QString filenameFromDisposition(const QString& value);

/**
 * @brief Infers a filename from a URL.
 *
 * Release asset URLs often carry the real name in a
 * `response-content-disposition` query item; the last path segment is used
 * otherwise.
 *
 * @param url Source URL.
 * @return Inferred filename string.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Normalizes a checksum string.
 *
 * Converts the checksum to lowercase and removes whitespace.
 *
 * @param value Raw checksum string.
 * @return Normalized checksum string.
 */
QString normalizeChecksum(const QString& value);

/**
 * @brief Detects the checksum algorithm based on hash length.
 *
 * @param expected Expected checksum value.
 * @return "MD5", "SHA1", "SHA256", "SHA512", or an empty string if unknown.
 */
QString detectChecksumAlgo(const QString& expected);

/**
 * @brief Maps an algorithm name to a QCryptographicHash algorithm.
 *
 * @param name Algorithm name as returned by detectChecksumAlgo().
 * @param out Receives the algorithm.
 * @return false when the name is not supported.
 */
bool checksumAlgorithmFor(const QString& name, QCryptographicHash::Algorithm& out);

/**
 * @brief Hashes a whole file.
 *
 * Reads in 1 MiB blocks; safe to run on a worker thread.
 *
 * @param path File to hash.
 * @param algorithm Hash algorithm.
 * @return Lowercase hex digest, or an empty string if the file cannot be read.
 */
QString hashFile(const QString& path, QCryptographicHash::Algorithm algorithm);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

/**
 * @brief Formats a byte count for logs ("512 B", "4.00 MiB", "29.72 GiB").
 */
QString formatBytes(qint64 bytes);

} // namespace kiln::utils
