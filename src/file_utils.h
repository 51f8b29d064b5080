#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDateTime>

/**
 * FileUtils - Standardized file operations utilities
 *
 * Provides consistent, centralized file existence validation and permission
 * handling for the transfer pipeline.
 */
namespace FileUtils {

/**
 * Check if a file exists at the given path.
 *
 * @param filePath The file path to check
 * @return true if the file exists and is a regular file, false otherwise
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

/**
 * Check if a directory exists at the given path.
 *
 * @param dirPath The directory path to check
 * @return true if the directory exists, false otherwise
 */
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Check if a path exists (file or directory).
 */
inline bool pathExists(const QString& path)
{
    return QFileInfo::exists(path);
}

/**
 * Copy the permission bits of src onto dst.
 *
 * @return false if either file is missing or the permissions could not be set
 */
inline bool copyMode(const QString& src, const QString& dst)
{
    if (!fileExists(src) || !fileExists(dst)) return false;
    return QFile::setPermissions(dst, QFile::permissions(src));
}

/**
 * Modification time in milliseconds since the epoch, or -1 if the file is missing.
 */
inline qint64 modifiedMs(const QString& path)
{
    QFileInfo fi(path);
    if (!fi.exists()) return -1;
    return fi.lastModified().toMSecsSinceEpoch();
}

} // namespace FileUtils
