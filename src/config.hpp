#pragma once

#include "format.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace camper {

/// Persisted user settings, stored as JSON in ~/.camper/config.json.
struct Config {
    std::optional<std::uint32_t> fanId;
    std::optional<std::string>   identity;
    std::optional<std::string>   library;
    std::optional<Format>        format;

    /// Load from @p path. A missing file yields an empty Config.
    /// @throws std::runtime_error if the file exists but cannot be parsed.
    static Config load(const std::string& path);

    /// Load from defaultPath().
    static Config load();

    /// Write to @p path, replacing any previous contents.
    /// @throws std::runtime_error on I/O failure.
    void save(const std::string& path) const;

    /// Write to defaultPath().
    void save() const;

    /// True when every field is set, the fan id is non-zero, the identity is
    /// non-empty and the library directory exists.
    bool isValid() const;

    /// One "key: value" line per set field.
    std::string toString() const;

    /// ~/.camper/config.json; creates ~/.camper if it does not exist.
    /// @throws std::runtime_error if $HOME is unset or the directory cannot
    ///         be created.
    static std::string defaultPath();
};

} // namespace camper
