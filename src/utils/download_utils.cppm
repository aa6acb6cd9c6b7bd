/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for download naming, paths and display.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the sync core and the monitor tool. These utilities
 *              handle filename inference for optimistic entries, destination
 *              path normalization, backend host normalization and
 *              human-readable formatting of byte counts and durations.
 *
 *              All helpers are designed to be side-effect free and safe for use
 *              in both core sync logic and UI-related code.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module dlsync.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

DLSYNC_MODULE_EXPORT namespace dlsync::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs (as produced by drag-and-drop) to local paths and
 * leaves plain paths untouched.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Decodes a URL query string value.
 *
 * Handles standard percent-decoding and converts '+' characters into spaces,
 * as commonly used in application/x-www-form-urlencoded data.
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
 * Looks at disposition-style query parameters first, then an explicit
 * `filename` parameter, and finally the last path component.
 *
 * @param url Source URL.
 * @return Inferred filename string, empty when nothing usable was found.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Normalizes a host string.
 *
 * Converts the host to lowercase and removes any scheme, path or port.
 *
 * @param host Input host string.
 * @return Normalized host name.
 */
QString normalizeHost(const QString& host);

/**
 * @brief Formats a byte count for display ("1.5 MB").
 * @param bytes Byte count; negative values format as "?".
 */
QString formatBytes(qint64 bytes);

/**
 * @brief Formats a duration in seconds for display ("1h 02m", "45s").
 * @param seconds Duration; negative values format as "--".
 */
QString formatDuration(qint64 seconds);

} // namespace dlsync::utils
