#include "mefw/parse_options.hpp"
#include "mefw/fpt.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace mefw {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Boolean field; a present value of another type is reported
void read_bool(const nlohmann::json& j, const std::string& key, bool& out,
               std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_boolean()) {
        out = j[key].get<bool>();
    } else {
        warnings.push_back("invalid_configuration:invalid_" + key);
    }
}

} // namespace

ParseOptions default_parse_options() {
    ParseOptions options;
    options.fpt_offsets = default_fpt_offsets();
    options.diagnostics = default_diagnostic_policy();
    return options;
}

ParseOptionsResult parse_options_json(const std::string& json_str, const std::string& source_path) {
    ParseOptionsResult result;
    result.options = default_parse_options();
    result.options.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (auto schema = get_string(j, "$schema")) {
            result.options.schema = *schema;
        } else {
            result.error = "$schema missing";
            return result;
        }
        if (result.options.schema != PARSE_OPTIONS_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + PARSE_OPTIONS_SCHEMA;
            return result;
        }

        // fpt_offsets
        if (j.contains("fpt_offsets")) {
            const auto& offsets = j["fpt_offsets"];
            std::vector<size_t> parsed;
            bool valid = offsets.is_array();
            if (valid) {
                for (const auto& elem : offsets) {
                    if (!elem.is_number_unsigned()) {
                        valid = false;
                        break;
                    }
                    parsed.push_back(elem.get<size_t>());
                }
            }
            if (valid && !parsed.empty()) {
                result.options.fpt_offsets = parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_fpt_offsets");
            }
        }

        read_bool(j, "scan_fpt", result.options.scan_fpt, result.warnings);
        read_bool(j, "parallel", result.options.parallel, result.warnings);
        read_bool(j, "decode_metadata", result.options.decode_metadata, result.warnings);
        read_bool(j, "decode_fit", result.options.decode_fit, result.warnings);
        read_bool(j, "decode_mfs", result.options.decode_mfs, result.warnings);

        // max_workers
        if (j.contains("max_workers")) {
            const auto& workers = j["max_workers"];
            if (workers.is_number_unsigned() && workers.get<size_t>() > 0) {
                result.options.max_workers = workers.get<size_t>();
            } else {
                result.warnings.push_back("invalid_configuration:invalid_max_workers");
            }
        }

        // "diagnostics" section
        if (j.contains("diagnostics") && j["diagnostics"].is_object()) {
            for (auto& [key, val] : j["diagnostics"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_diagnostic_kind(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_diagnostic:" + key_str);
                    continue;
                }
                std::optional<DiagnosticAction> action;
                if (val.is_string()) {
                    action = parse_diagnostic_action(val.get<std::string>());
                }
                if (action) {
                    result.options.diagnostics[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_diagnostic_action:" +
                                              key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace mefw
