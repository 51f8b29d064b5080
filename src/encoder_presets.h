#pragma once
#include <QMap>
#include <QString>
#include <optional>

// Per-target-format ffmpeg encoder options.
namespace EncoderPresets {

// Built-in table keyed by lower-cased target extension.
const QMap<QString, QString>& builtIn();

// Effective encoder options for a target format. Precedence: an explicit
// option, then a configured preset, then the built-in table. Returns nullopt
// when nothing applies and ffmpeg's own defaults should be used.
std::optional<QString> resolve(const QString& targetFormat,
                               const std::optional<QString>& explicitOptions,
                               const QMap<QString, QString>& configured = {});

} // namespace EncoderPresets
