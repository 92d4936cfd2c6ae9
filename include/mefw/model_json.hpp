#pragma once

#include "mefw/model.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace mefw {

// Machine-readable rendering of a decoded model. Offsets are absolute image
// offsets; no image bytes are copied except short hashes rendered as hex.
nlohmann::json model_to_json(const StructuralModel& model);

nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic);

nlohmann::json manifest_to_json(const Manifest& manifest, const Image* image);

// Serialize for output. Invalid UTF-8 in strings taken from the image is
// replaced with U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json& j, int indent = 2);

} // namespace mefw
