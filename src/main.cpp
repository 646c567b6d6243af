#include "api_client.hpp"
#include "config.hpp"
#include "endpoints.hpp"
#include "format.hpp"
#include "models.hpp"
#include "pagination.hpp"
#include "util.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace camper;

namespace {

struct GlobalOptions {
    std::string endpoint  = endpoints::kDefaultBaseUrl;
    int         timeoutMs = 10000;
    bool        verbose   = false;
};

struct ConfigureOptions {
    std::optional<std::uint32_t> fanId;
    std::optional<std::string>   identity;
    std::optional<std::string>   library;
    std::optional<Format>        format;
    bool                         update = false;
    bool                         print  = false;
};

struct ListOptions {
    std::optional<std::uint32_t> fanId;
    bool                         wishlist = false;
};

struct DownloadOptions {
    std::optional<Format>      format;
    std::vector<std::uint32_t> albumIds;
};

struct SyncOptions {
    std::optional<Format> format;
    std::string           directory;
};

struct Command {
    std::string      name;
    GlobalOptions    global;
    ConfigureOptions configure;
    ListOptions      list;
    DownloadOptions  download;
    SyncOptions      sync;
};

void printUsage() {
    std::cout
        << "Usage: camper [global options] <command> [options]\n\n"
        << "Commands:\n"
        << "  configure   Configure authentication and library settings\n"
        << "  list        List all albums in a collection or wishlist\n"
        << "  download    Download one or more albums from a collection\n"
        << "  sync        Synchronize a directory with a collection\n\n"
        << "Global options:\n"
        << "  --endpoint URL   API base URL        (default: "
        << endpoints::kDefaultBaseUrl << ")\n"
        << "  --timeout-ms N   HTTP timeout in ms  (default: 10000)\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --version, -V    Print version\n"
        << "  --help, -h       Show this message\n\n"
        << "configure options:\n"
        << "  -f, --fan-id ID            Bandcamp user identifier\n"
        << "  -i, --identity COOKIE      Bandcamp identity cookie\n"
        << "  -l, --library DIR          Path to music library\n"
        << "  -d, --default-format FMT   Default audio file format to download\n"
        << "  -u, --update               Overwrite existing values with the given ones\n"
        << "  -p, --print                Print the current configuration\n\n"
        << "list options:\n"
        << "  -f, --fan-id ID            User whose items to list (default: configured)\n"
        << "  -w, --wishlist             List items from the wishlist instead\n\n"
        << "download options:\n"
        << "  -f, --format FMT           File format to download albums in\n"
        << "  ALBUM_ID...                One or more album IDs\n\n"
        << "sync options:\n"
        << "  -f, --format FMT           File format to download albums in\n"
        << "  DIRECTORY                  Directory to sync albums to\n\n"
        << "Formats:";
    for (Format f : allFormats()) {
        std::cout << " " << toString(f);
    }
    std::cout << "\n";
}

[[noreturn]] void usageError(const std::string& message) {
    std::cerr << message << "\n\n";
    printUsage();
    std::exit(1);
}

std::uint32_t parseUint32(const std::string& text, const char* what) {
    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        if (text.empty() || text[0] == '-') throw std::invalid_argument(text);
        value = std::stoull(text, &used);
    } catch (const std::logic_error&) {
        usageError(std::string("Invalid ") + what + ": " + text);
    }
    if (used != text.size() ||
        value > std::numeric_limits<std::uint32_t>::max()) {
        usageError(std::string("Invalid ") + what + ": " + text);
    }
    return static_cast<std::uint32_t>(value);
}

Format parseFormatArg(const std::string& text) {
    auto format = parseFormat(text);
    if (!format) {
        usageError("Unknown format: " + text);
    }
    return *format;
}

Command parseArgs(int argc, char* argv[]) {
    Command cmd;
    int i = 1;

    // --- global options ---
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--endpoint" && i + 1 < argc) {
            cmd.global.endpoint = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                cmd.global.timeoutMs = parseTimeoutMs(argv[++i]);
            } catch (const std::invalid_argument& e) {
                usageError(e.what());
            }
        } else if (arg == "--verbose") {
            cmd.global.verbose = true;
        } else if (arg == "--version" || arg == "-V") {
            std::cout << "camper " << kVersion << "\n";
            std::exit(0);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            usageError("Unknown argument: " + arg);
        } else {
            break;
        }
    }

    if (i >= argc) {
        usageError("Missing command");
    }
    cmd.name = argv[i++];

    // --- subcommand options ---
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        }

        if (cmd.name == "configure") {
            auto& o = cmd.configure;
            if ((arg == "--fan-id" || arg == "-f") && hasValue) {
                o.fanId = parseUint32(argv[++i], "fan ID");
            } else if ((arg == "--identity" || arg == "-i") && hasValue) {
                o.identity = argv[++i];
            } else if ((arg == "--library" || arg == "-l") && hasValue) {
                o.library = argv[++i];
            } else if ((arg == "--default-format" || arg == "-d") && hasValue) {
                o.format = parseFormatArg(argv[++i]);
            } else if (arg == "--update" || arg == "-u") {
                o.update = true;
            } else if (arg == "--print" || arg == "-p") {
                o.print = true;
            } else {
                usageError("Unknown argument: " + arg);
            }
        } else if (cmd.name == "list") {
            auto& o = cmd.list;
            if ((arg == "--fan-id" || arg == "-f") && hasValue) {
                o.fanId = parseUint32(argv[++i], "fan ID");
            } else if (arg == "--wishlist" || arg == "-w") {
                o.wishlist = true;
            } else {
                usageError("Unknown argument: " + arg);
            }
        } else if (cmd.name == "download") {
            auto& o = cmd.download;
            if ((arg == "--format" || arg == "-f") && hasValue) {
                o.format = parseFormatArg(argv[++i]);
            } else if (!arg.empty() && arg[0] == '-') {
                usageError("Unknown argument: " + arg);
            } else {
                o.albumIds.push_back(parseUint32(arg, "album ID"));
            }
        } else if (cmd.name == "sync") {
            auto& o = cmd.sync;
            if ((arg == "--format" || arg == "-f") && hasValue) {
                o.format = parseFormatArg(argv[++i]);
            } else if (!arg.empty() && arg[0] == '-') {
                usageError("Unknown argument: " + arg);
            } else if (o.directory.empty()) {
                o.directory = arg;
            } else {
                usageError("Unexpected argument: " + arg);
            }
        } else {
            usageError("Unknown command: " + cmd.name);
        }
    }

    if (cmd.name == "download" && cmd.download.albumIds.empty()) {
        usageError("download requires at least one album ID");
    }
    if (cmd.name == "sync" && cmd.sync.directory.empty()) {
        usageError("sync requires a directory");
    }
    if (cmd.name != "configure" && cmd.name != "list" &&
        cmd.name != "download" && cmd.name != "sync") {
        usageError("Unknown command: " + cmd.name);
    }
    return cmd;
}

// ---------------------------------------------------------------------------
// Prompting
// ---------------------------------------------------------------------------

std::string promptLine(const std::string& prompt) {
    while (true) {
        std::cerr << prompt << ": " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            throw std::runtime_error("No input for '" + prompt + "'");
        }
        if (!line.empty()) return line;
    }
}

std::uint32_t promptFanId() {
    while (true) {
        const std::string text = promptLine("Bandcamp fan ID");
        try {
            std::size_t used = 0;
            const unsigned long long value = std::stoull(text, &used);
            if (used == text.size() && text[0] != '-' &&
                value <= std::numeric_limits<std::uint32_t>::max()) {
                return static_cast<std::uint32_t>(value);
            }
        } catch (const std::logic_error&) {
            // fall through to the retry message
        }
        std::cerr << "Not a valid fan ID: " << text << "\n";
    }
}

Format promptFormat() {
    const auto& formats = allFormats();
    for (std::size_t i = 0; i < formats.size(); ++i) {
        std::cerr << "  " << (i + 1) << ") " << toString(formats[i]) << "\n";
    }

    while (true) {
        std::cerr << "Default audio format [1]: " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            throw std::runtime_error("No input for default audio format");
        }
        if (line.empty()) return formats.front();

        if (auto byName = parseFormat(line)) return *byName;
        try {
            const auto index = std::stoul(line);
            if (index >= 1 && index <= formats.size()) return formats[index - 1];
        } catch (const std::logic_error&) {
            // fall through to the retry message
        }
        std::cerr << "Choose 1-" << formats.size() << " or a format name\n";
    }
}

// ---------------------------------------------------------------------------
// Subcommands
// ---------------------------------------------------------------------------

int configureCreate(const ConfigureOptions& opts) {
    Config cfg;
    cfg.fanId    = opts.fanId ? *opts.fanId : promptFanId();
    cfg.identity = opts.identity ? *opts.identity
                                 : promptLine("Bandcamp identity cookie");
    const std::string library = opts.library ? *opts.library
                                             : promptLine("Music library directory");
    cfg.format   = opts.format ? *opts.format : promptFormat();

    std::error_code ec;
    const fs::path canonical = fs::canonical(library, ec);
    if (ec || !fs::exists(canonical)) {
        std::cerr << "[camper] Library path does not exist: '" << library << "'\n";
        return 1;
    }
    cfg.library = canonical.string();

    cfg.save();
    std::cerr << "[camper] Saved configuration to " << Config::defaultPath() << "\n";
    return 0;
}

int configureUpdate(Config cfg, const ConfigureOptions& opts) {
    std::vector<std::string> messages;

    if (opts.fanId) {
        messages.push_back("Updated fan ID to " + std::to_string(*opts.fanId));
        cfg.fanId = opts.fanId;
    }
    if (opts.identity) {
        messages.push_back("Updated identity to " + *opts.identity);
        cfg.identity = opts.identity;
    }
    if (opts.library) {
        messages.push_back("Updated library to " + *opts.library);
        cfg.library = opts.library;
    }
    if (opts.format) {
        messages.push_back("Updated default format to " + toString(*opts.format));
        cfg.format = opts.format;
    }

    cfg.save();
    for (const auto& message : messages) {
        std::cerr << "[camper] " << message << "\n";
    }
    return 0;
}

int runConfigure(const Config& cfg, const ConfigureOptions& opts) {
    if (opts.print) {
        std::cerr << cfg.toString();
        return 0;
    }
    if (opts.update) {
        return configureUpdate(cfg, opts);
    }
    return configureCreate(opts);
}

void printItems(const std::vector<CatalogItem>& items) {
    std::size_t idWidth     = std::string("Album ID").size();
    std::size_t bandWidth   = std::string("Band").size();
    std::size_t titleWidth  = std::string("Album Title").size();
    for (const auto& item : items) {
        idWidth    = std::max(idWidth, std::to_string(item.itemId).size());
        bandWidth  = std::max(bandWidth, item.artistName.size());
        titleWidth = std::max(titleWidth, item.itemTitle.size());
    }
    const std::size_t addedWidth = std::string("YYYY-MM-DD HH:MM:SS").size();

    const auto rule = [&]() {
        std::cout << "+" << std::string(idWidth + 2, '-')
                  << "+" << std::string(bandWidth + 2, '-')
                  << "+" << std::string(titleWidth + 2, '-')
                  << "+" << std::string(addedWidth + 2, '-') << "+\n";
    };

    rule();
    std::cout << "| " << std::right << std::setw(idWidth) << "Album ID"
              << " | " << std::left << std::setw(bandWidth) << "Band"
              << " | " << std::setw(titleWidth) << "Album Title"
              << " | " << std::setw(addedWidth) << "Added (UTC)" << " |\n";
    rule();
    for (const auto& item : items) {
        std::cout << "| " << std::right << std::setw(idWidth) << item.itemId
                  << " | " << std::left << std::setw(bandWidth) << item.artistName
                  << " | " << std::setw(titleWidth) << item.itemTitle
                  << " | " << std::setw(addedWidth) << formatUtc(item.added)
                  << " |\n";
    }
    rule();

    std::cout << "\n" << items.size() << " items\n";
}

int runList(const Config& cfg, const ListOptions& opts, const GlobalOptions& global) {
    // Another fan's id may be given; the configured identity is still sent
    // so that private or hidden items of the authenticated user show up.
    const std::uint32_t fanId = opts.fanId ? *opts.fanId : *cfg.fanId;
    const std::string&  identity = *cfg.identity;

    ApiClient client(global.endpoint, global.timeoutMs);
    client.setVerbose(global.verbose);
    Paginator paginator(client, global.verbose);

    const auto kind  = opts.wishlist ? ResourceKind::Wishlist
                                     : ResourceKind::Collection;
    const auto items = paginator.list(kind, fanId, identity);

    printItems(items);

    if (global.verbose) {
        const auto stats = paginator.getStats();
        std::cerr << "[camper] " << stats.totalFetched << " items in "
                  << stats.totalRequests << " requests\n";
    }
    return 0;
}

int runDownload(const DownloadOptions& opts, const Config& cfg) {
    const Format format = opts.format ? *opts.format : *cfg.format;
    std::cerr << "[camper] download is not implemented yet ("
              << opts.albumIds.size() << " album(s), format "
              << toString(format) << ")\n";
    return 0;
}

int runSync(const SyncOptions& opts, const Config& cfg) {
    const Format format = opts.format ? *opts.format : *cfg.format;
    std::cerr << "[camper] sync is not implemented yet (directory "
              << opts.directory << ", format " << toString(format) << ")\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const Command cmd = parseArgs(argc, argv);
        const Config  cfg = Config::load();

        if (cmd.name == "configure") {
            return runConfigure(cfg, cmd.configure);
        }

        if (!cfg.isValid()) {
            std::cerr << "[camper] Missing or invalid configuration; please run "
                         "`camper configure` and try again.\n";
            return 1;
        }

        if (cmd.name == "list") {
            return runList(cfg, cmd.list, cmd.global);
        }
        if (cmd.name == "download") {
            return runDownload(cmd.download, cfg);
        }
        return runSync(cmd.sync, cfg);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
