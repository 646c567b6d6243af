#pragma once

#include <optional>
#include <string>
#include <vector>

namespace camper {

/// Audio file formats offered by Bandcamp downloads.
enum class Format {
    Mp3V0,
    Mp3,
    Flac,
    Aac,
    OggVorbis,
    Alac,
    Wav,
    Aiff,
};

/// Kebab-case name, e.g. "mp3-v0", "ogg-vorbis".
std::string toString(Format format);

/// Inverse of toString(); std::nullopt for unknown names.
std::optional<Format> parseFormat(const std::string& name);

/// Every format in declaration order.
const std::vector<Format>& allFormats();

} // namespace camper
