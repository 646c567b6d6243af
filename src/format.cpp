#include "format.hpp"

namespace camper {

std::string toString(Format format) {
    switch (format) {
    case Format::Mp3V0:     return "mp3-v0";
    case Format::Mp3:       return "mp3";
    case Format::Flac:      return "flac";
    case Format::Aac:       return "aac";
    case Format::OggVorbis: return "ogg-vorbis";
    case Format::Alac:      return "alac";
    case Format::Wav:       return "wav";
    case Format::Aiff:      return "aiff";
    }
    return "unknown";
}

std::optional<Format> parseFormat(const std::string& name) {
    for (Format f : allFormats()) {
        if (toString(f) == name) return f;
    }
    return std::nullopt;
}

const std::vector<Format>& allFormats() {
    static const std::vector<Format> kFormats = {
        Format::Mp3V0, Format::Mp3,  Format::Flac, Format::Aac,
        Format::OggVorbis, Format::Alac, Format::Wav, Format::Aiff,
    };
    return kFormats;
}

} // namespace camper
