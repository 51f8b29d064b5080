#include "encoder_presets.h"

namespace EncoderPresets {

const QMap<QString, QString>& builtIn()
{
    static const QMap<QString, QString> table = {
        {"mp3", "-codec:a libmp3lame -q:a 2"},
        {"ogg", "-codec:a libvorbis -q:a 5"},
        {"aac", "-codec:a libfdk_aac -vbr 5"},
        {"m4a", "-codec:a libfdk_aac -vbr 5"},
        {"mp4", "-codec:a libfdk_aac -vbr 5"},
        {"opus", "-codec:a libopus -b:a 160k"},
    };
    return table;
}

std::optional<QString> resolve(const QString& targetFormat,
                               const std::optional<QString>& explicitOptions,
                               const QMap<QString, QString>& configured)
{
    if (explicitOptions) {
        return explicitOptions;
    }
    const QString key = targetFormat.toLower();
    if (configured.contains(key)) {
        return configured.value(key);
    }
    if (builtIn().contains(key)) {
        return builtIn().value(key);
    }
    return std::nullopt;
}

} // namespace EncoderPresets
