/**
 * mefw CLI - Common utilities and types
 */

#pragma once

#include <mefw/mefw.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace mefw::cli {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_INPUT_ERROR = 1;     // unreadable image or config, no FPT
constexpr int EXIT_DIAGNOSTIC_ERROR = 3;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr so --json output stays clean.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("mefw");
    spdlog::set_default_logger(logger);
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::warn);
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << dump_json(output) << std::endl;
    } else {
        std::cout << dump_json(j) << std::endl;
    }
}

inline std::string hex(uint64_t v, int width = 0) {
    std::ostringstream os;
    os << "0x" << std::hex;
    if (width > 0) {
        os.width(width);
        os.fill('0');
    }
    os << v;
    return os.str();
}

/**
 * File loading.
 */
inline std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) return std::nullopt;
    return bytes;
}

inline std::optional<std::string> read_file_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Resolve parse options from --config, reporting configuration warnings.
 */
inline std::optional<ParseOptions> load_parse_options(const GlobalOptions& opts) {
    if (opts.config.empty()) {
        return default_parse_options();
    }

    auto content = read_file_text(opts.config);
    if (!content) {
        print_error("cannot read config file: " + opts.config, opts.json);
        return std::nullopt;
    }

    auto result = parse_options_json(*content, opts.config);
    if (!result.ok) {
        print_error(opts.config + ": " + result.error, opts.json);
        return std::nullopt;
    }
    for (const auto& w : result.warnings) {
        print_warning(opts.config + ": " + w);
    }
    return result.options;
}

/**
 * Load an image and run the structural decode. Errors are printed here.
 */
inline std::optional<StructuralModel> load_and_parse(const std::string& path,
                                                     const ParseOptions& options,
                                                     const GlobalOptions& opts) {
    auto bytes = read_file_bytes(path);
    if (!bytes) {
        print_error("cannot read image: " + path, opts.json);
        return std::nullopt;
    }

    spdlog::debug("loaded {} ({} bytes)", path, bytes->size());
    auto image = std::make_shared<const Image>(std::move(*bytes));
    auto result = parse_image(image, options);
    if (!result.ok) {
        print_error(path + ": " + result.error, opts.json);
        return std::nullopt;
    }
    return std::move(result.model);
}

} // namespace mefw::cli
