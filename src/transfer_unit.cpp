#include "transfer_unit.h"
#include "errors.h"
#include "file_copier.h"
#include "file_utils.h"
#include "tag_store.h"
#include "transcode_engine.h"
#include "utils.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QScopeGuard>
#include <QTemporaryFile>
#include <QDebug>

namespace {
constexpr int kChecksumLength = 32;
}

TransferUnit::TransferUnit(const QString& source, const QString& destination,
                           const std::optional<QString>& encoderOptions, bool useChecksum)
    : m_source(source)
    , m_destination(destination)
    , m_sourceExt(Utils::extensionOf(source))
    , m_destExt(Utils::extensionOf(destination))
    , m_encoderOptions(encoderOptions)
    , m_useChecksum(useChecksum)
{
    m_needsTranscode = (m_sourceExt != m_destExt);
}

TransferUnit TransferUnit::staged(const QString& tempFile, const QString& destination)
{
    TransferUnit unit(tempFile, destination, std::nullopt, false);
    unit.m_kind = Kind::Staged;
    return unit;
}

QString TransferUnit::computeChecksum(const QString& path, const std::optional<QString>& encoderOptions)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        throw MissingInputError(QString("Unable to read %1: %2").arg(path, f.errorString()));
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&f)) {
        throw MissingInputError(QString("Unable to read %1").arg(path));
    }
    hash.addData(encoderOptions.value_or(QString()).toUtf8());
    return QString::fromLatin1(hash.result().toHex().left(kChecksumLength));
}

QString TransferUnit::sourceChecksum() const
{
    if (!m_sourceChecksum) {
        m_sourceChecksum = computeChecksum(m_source, m_encoderOptions);
    }
    return *m_sourceChecksum;
}

QString TransferUnit::destinationSavedChecksum(const TransferContext& ctx) const
{
    if (!m_savedChecksum) {
        if (!m_useChecksum || !FileUtils::fileExists(m_destination) || !ctx.tags) {
            m_savedChecksum = QString();
        } else {
            m_savedChecksum = TagTools::readChecksumTag(*ctx.tags, m_destination);
        }
    }
    return *m_savedChecksum;
}

bool TransferUnit::checksumCurrent(const TransferContext& ctx) const
{
    if (!m_useChecksum) return false;
    const QString saved = destinationSavedChecksum(ctx);
    return !saved.isEmpty() && saved == sourceChecksum();
}

bool TransferUnit::needsUpdate(const TransferContext& ctx) const
{
    if (m_kind == Kind::Staged) return true;
    if (m_needsUpdate) return *m_needsUpdate;

    bool result = false;
    if (!FileUtils::fileExists(m_destination)) {
        qDebug() << "[Transfer] Destination does not exist:" << m_destination;
        result = true;
    } else {
        bool decided = false;
        if (m_needsTranscode && m_useChecksum) {
            const bool current = checksumCurrent(ctx);
            if (!destinationSavedChecksum(ctx).isEmpty()) {
                if (current) {
                    qDebug() << "[Transfer] Destination checksum is current:" << m_destination;
                } else {
                    qDebug() << "[Transfer] Destination checksum does not match source:" << m_destination;
                }
                result = !current;
                decided = true;
            } else {
                qDebug() << "[Transfer] No checksum tag in destination, falling back to modification time:" << m_destination;
            }
        }
        if (!decided) {
            result = FileUtils::modifiedMs(m_source) > FileUtils::modifiedMs(m_destination);
            qDebug() << "[Transfer]" << (result ? "Source is newer than destination:" : "Destination is newer than source:") << m_destination;
        }
    }
    m_needsUpdate = result;
    return result;
}

void TransferUnit::invalidateCaches()
{
    m_savedChecksum.reset();
    m_needsUpdate.reset();
}

void TransferUnit::check() const
{
    if (!FileUtils::fileExists(m_source)) {
        throw MissingInputError(QString("Input file does not exist: %1").arg(m_source));
    }
    const QString parent = QFileInfo(m_destination).absolutePath();
    if (!FileUtils::dirExists(parent)) {
        throw MissingOutputDirError(QString("Output directory does not exist: %1").arg(parent));
    }
}

void TransferUnit::transcode(const TransferContext& ctx, bool dryRun)
{
    qInfo().noquote() << "Transcoding:" << m_source << "->" << m_destination;
    if (dryRun) return;
    if (!ctx.engine) {
        throw TranscodeError(QString("No transcoding engine configured for %1").arg(m_source));
    }

    QString err;
    if (!ctx.engine->identify(m_source, &err)) {
        throw TranscodeError(QString("Unable to identify %1 as a music file: %2").arg(m_source, err));
    }

    const QStringList flags = QProcess::splitCommand(m_encoderOptions.value_or(QString()));
    ctx.engine->transcode(m_source, m_destination, flags, ctx.cancel);
    // A staged destination is an empty placeholder until the engine writes it.
    if (!FileUtils::fileExists(m_destination) || QFileInfo(m_destination).size() == 0) {
        throw TranscodeError(QString("ffmpeg did not produce an output file: %1").arg(m_destination));
    }

    if (ctx.tags) {
        TagTools::copyTags(*ctx.tags, m_source, m_destination);
        if (m_useChecksum && !TagTools::writeChecksumTag(*ctx.tags, m_destination, sourceChecksum())) {
            qDebug() << "[Transfer] Continuing without checksum tag for" << m_destination;
        }
    }
    if (!FileUtils::copyMode(m_source, m_destination)) {
        qDebug() << "[Transfer] Could not copy permissions to" << m_destination;
    }
    invalidateCaches();
}

void TransferUnit::copy(const TransferContext& ctx, bool dryRun)
{
    qInfo().noquote() << "Copying:" << m_source << "->" << m_destination;
    if (dryRun) return;
    FileCopier::copy(m_source, m_destination, ctx.rsyncPath, ctx.cancel);
    invalidateCaches();
}

TransferUnit::Action TransferUnit::transferStaged(const TransferContext& ctx, bool dryRun)
{
    auto cleanup = qScopeGuard([this] {
        if (FileUtils::fileExists(m_source) && !QFile::remove(m_source)) {
            qWarning() << "[Transfer] Could not remove staged file" << m_source;
        }
    });
    if (!dryRun) check();
    copy(ctx, dryRun);
    return Action::Copied;
}

TransferUnit::Action TransferUnit::transfer(const TransferContext& ctx, bool force, bool dryRun, const QString& tempDir)
{
    if (m_kind == Kind::Staged) {
        return transferStaged(ctx, dryRun);
    }

    if (force || needsUpdate(ctx)) {
        if (!dryRun) check();
        if (m_needsTranscode) {
            if (!tempDir.isEmpty() && !dryRun) {
                TransferUnit temp = stageToTempdir(ctx, tempDir, true, dryRun);
                temp.transfer(ctx, force, dryRun);
                invalidateCaches();
            } else {
                transcode(ctx, dryRun);
            }
            return Action::Transcoded;
        }
        copy(ctx, dryRun);
        return Action::Copied;
    }

    if (m_needsTranscode && m_useChecksum && !checksumCurrent(ctx)) {
        qInfo().noquote() << "Saving checksum to destination:" << m_destination;
        if (!dryRun && ctx.tags) {
            if (!TagTools::writeChecksumTag(*ctx.tags, m_destination, sourceChecksum())) {
                qDebug() << "[Transfer] Checksum tag not saved for" << m_destination;
            }
            invalidateCaches();
        }
        return Action::ChecksumSaved;
    }

    qDebug() << "[Transfer] Skipping:" << m_source << "->" << m_destination;
    return Action::Skipped;
}

TransferUnit TransferUnit::stageToTempdir(const TransferContext& ctx, const QString& tempDir, bool force, bool dryRun) const
{
    if (dryRun || !m_needsTranscode || m_kind == Kind::Staged || !(force || needsUpdate(ctx))) {
        return *this;
    }

    const QPair<QString, QString> parts = Utils::splitExtension(QFileInfo(m_destination).fileName());
    QString base = parts.first;
    if (base.endsWith('.')) base.chop(1);
    const QString suffix = parts.second.isEmpty() ? QString() : "." + parts.second;

    QTemporaryFile tmp(QDir(tempDir).filePath(base + "_XXXXXX" + suffix));
    tmp.setAutoRemove(false);
    if (!tmp.open()) {
        throw TranscodeError(QString("Unable to create temporary file in %1: %2").arg(tempDir, tmp.errorString()));
    }
    const QString tempName = tmp.fileName();
    tmp.close();

    try {
        TransferUnit(m_source, tempName, m_encoderOptions, m_useChecksum).transfer(ctx, true, dryRun);
    } catch (const std::exception&) {
        if (FileUtils::fileExists(tempName) && !QFile::remove(tempName)) {
            qWarning() << "[Transfer] Could not remove temp file" << tempName;
        }
        throw;
    }
    return staged(tempName, m_destination);
}
