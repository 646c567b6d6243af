#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace camper {

namespace {

constexpr const char* kConfigDir  = ".camper";
constexpr const char* kConfigFile = "config.json";

} // namespace

// ---------------------------------------------------------------------------
// Load / save
// ---------------------------------------------------------------------------

Config Config::load(const std::string& path) {
    Config cfg;

    std::ifstream in(path);
    if (!in) {
        return cfg;
    }

    nlohmann::json j;
    try {
        in >> j;

        if (j.contains("fan_id") && !j["fan_id"].is_null()) {
            const auto& id = j["fan_id"];
            if (!id.is_number_unsigned() ||
                id.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
                throw std::runtime_error("fan_id is not an unsigned 32-bit integer");
            }
            cfg.fanId = id.get<std::uint32_t>();
        }
        if (j.contains("identity") && !j["identity"].is_null()) {
            cfg.identity = j["identity"].get<std::string>();
        }
        if (j.contains("library") && !j["library"].is_null()) {
            cfg.library = j["library"].get<std::string>();
        }
        if (j.contains("format") && !j["format"].is_null()) {
            const auto name = j["format"].get<std::string>();
            cfg.format = parseFormat(name);
            if (!cfg.format) {
                throw std::runtime_error("unknown format '" + name + "'");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(
            "Invalid configuration file '" + path + "': " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(
            "Invalid configuration file '" + path + "': " + e.what());
    }

    return cfg;
}

Config Config::load() {
    return load(defaultPath());
}

void Config::save(const std::string& path) const {
    nlohmann::json j = nlohmann::json::object();
    if (fanId)    j["fan_id"]   = *fanId;
    if (identity) j["identity"] = *identity;
    if (library)  j["library"]  = *library;
    if (format)   j["format"]   = camper::toString(*format);

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            "Unable to create configuration file '" + path + "'");
    }
    out << j.dump(2) << "\n";
    if (!out) {
        throw std::runtime_error(
            "Unable to save configuration file '" + path + "'");
    }
}

void Config::save() const {
    save(defaultPath());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool Config::isValid() const {
    const bool fanIdSet    = fanId && *fanId > 0;
    const bool identitySet = identity && !identity->empty();

    std::error_code ec;
    const bool librarySet = library && fs::exists(*library, ec);

    return fanIdSet && identitySet && librarySet && format.has_value();
}

std::string Config::toString() const {
    std::ostringstream out;
    if (fanId)    out << "fan_id:   " << *fanId << "\n";
    if (identity) out << "identity: " << *identity << "\n";
    if (library)  out << "library:  " << *library << "\n";
    if (format)   out << "format:   " << camper::toString(*format) << "\n";
    return out.str();
}

std::string Config::defaultPath() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        throw std::runtime_error("Unable to determine user's home directory");
    }

    const fs::path dir = fs::path(home) / kConfigDir;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Unable to create configuration directory '" +
                                 dir.string() + "': " + ec.message());
    }

    return (dir / kConfigFile).string();
}

} // namespace camper
