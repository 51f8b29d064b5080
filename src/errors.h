#pragma once
#include <QString>
#include <stdexcept>

// Base for every error raised by the mirroring engine.
class MirrorError : public std::runtime_error {
public:
    explicit MirrorError(const QString& message)
        : std::runtime_error(message.toStdString()) {}

    QString message() const { return QString::fromStdString(what()); }
};

// Run-level: bad arguments or environment. Raised before any file is touched.
class ConfigError : public MirrorError {
public:
    using MirrorError::MirrorError;
};

// A path handed to PathMapper does not live under the source root.
class PathOutsideRootError : public MirrorError {
public:
    using MirrorError::MirrorError;
};

class MissingInputError : public MirrorError {
public:
    using MirrorError::MirrorError;
};

class MissingOutputDirError : public MirrorError {
public:
    using MirrorError::MirrorError;
};

// Engine failure, unidentifiable input, missing output or a hard tag failure.
class TranscodeError : public MirrorError {
public:
    using MirrorError::MirrorError;
};

class CopyError : public MirrorError {
public:
    using MirrorError::MirrorError;
};

// Work abandoned because the run was interrupted.
class CancelledError : public MirrorError {
public:
    using MirrorError::MirrorError;
};
