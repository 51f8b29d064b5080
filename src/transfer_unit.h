#pragma once
#include <QString>
#include <atomic>
#include <optional>

class TranscodeEngine;
class TagBackend;

// Collaborators shared by every unit of a run.
struct TransferContext {
    const TranscodeEngine* engine = nullptr;
    const TagBackend* tags = nullptr;
    QString rsyncPath;                      // empty: plain copy only
    const std::atomic_bool* cancel = nullptr;
};

// One source -> destination mapping plus its transcode/copy policy.
//
// A unit is either Regular or Staged. A Staged unit's source is a private
// temp file holding an already transcoded result: it always needs an update,
// is moved into place by a plain copy, and deletes its source after transfer
// whether or not the transfer succeeded.
class TransferUnit {
public:
    enum class Kind { Regular, Staged };
    enum class Action { Skipped, Transcoded, Copied, ChecksumSaved };

    TransferUnit(const QString& source, const QString& destination,
                 const std::optional<QString>& encoderOptions = std::nullopt, bool useChecksum = true);

    // Wrap a staged temp file that must be moved to destination.
    static TransferUnit staged(const QString& tempFile, const QString& destination);

    Kind kind() const { return m_kind; }
    bool isStaged() const { return m_kind == Kind::Staged; }
    QString source() const { return m_source; }
    QString destination() const { return m_destination; }
    QString sourceExtension() const { return m_sourceExt; }
    QString destinationExtension() const { return m_destExt; }
    std::optional<QString> encoderOptions() const { return m_encoderOptions; }
    bool usesChecksum() const { return m_useChecksum; }
    bool needsTranscode() const { return m_needsTranscode; }

    // Hash of the source bytes followed by the encoder options. Memoized.
    QString sourceChecksum() const;
    // Checksum tag stored in the destination, or empty if absent. Memoized.
    QString destinationSavedChecksum(const TransferContext& ctx) const;
    bool checksumCurrent(const TransferContext& ctx) const;

    // Whether the destination is missing or out of date. Memoized.
    bool needsUpdate(const TransferContext& ctx) const;

    // Forget memoized state after the destination was rewritten.
    void invalidateCaches();

    // Throws MissingInputError / MissingOutputDirError.
    void check() const;

    void transcode(const TransferContext& ctx, bool dryRun);
    void copy(const TransferContext& ctx, bool dryRun);

    // Bring the destination up to date. With a non-empty tempDir, transcodes
    // are staged there and then moved into place.
    Action transfer(const TransferContext& ctx, bool force, bool dryRun, const QString& tempDir = QString());

    // Transcode into a unique file in tempDir and return a Staged unit for it.
    // Returns a copy of this unit when there is nothing to stage.
    TransferUnit stageToTempdir(const TransferContext& ctx, const QString& tempDir, bool force, bool dryRun) const;

    // Hex digest used for the checksum tag.
    static QString computeChecksum(const QString& path, const std::optional<QString>& encoderOptions);

private:
    Action transferStaged(const TransferContext& ctx, bool dryRun);

    Kind m_kind = Kind::Regular;
    QString m_source;
    QString m_destination;
    QString m_sourceExt;
    QString m_destExt;
    std::optional<QString> m_encoderOptions;
    bool m_useChecksum = true;
    bool m_needsTranscode = false;

    mutable std::optional<QString> m_sourceChecksum;
    mutable std::optional<QString> m_savedChecksum;
    mutable std::optional<bool> m_needsUpdate;
};
