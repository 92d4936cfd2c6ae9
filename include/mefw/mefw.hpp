/**
 * @file mefw.hpp
 * @brief Intel (CS)ME firmware structural parser
 *
 * Decodes a flat firmware image into a StructuralModel:
 *
 *     FPT -> partitions -> CPD or Gen 2 directory -> manifest -> extensions
 *                       -> MFS pages -> volume header -> file table
 *
 * Every structure references the shared Image by absolute offset and length.
 * Problems below the FPT are reported as Diagnostics and never abort the
 * parse; only a missing $FPT signature fails parse_image().
 *
 * ## Example
 *
 * ```cpp
 * auto image = std::make_shared<const mefw::Image>(std::move(bytes));
 * auto result = mefw::parse_image(image);
 * if (!result.ok) {
 *     std::cerr << result.error << "\n";
 *     return 1;
 * }
 * if (const auto* ftpr = result.model.find_partition("FTPR")) {
 *     if (ftpr->manifest) std::cout << ftpr->manifest->version.to_string() << "\n";
 * }
 * ```
 */

#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/cpd.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/extensions.hpp"
#include "mefw/fit.hpp"
#include "mefw/fpt.hpp"
#include "mefw/gen2.hpp"
#include "mefw/manifest.hpp"
#include "mefw/mfs.hpp"
#include "mefw/model.hpp"
#include "mefw/model_json.hpp"
#include "mefw/module_content.hpp"
#include "mefw/parse_options.hpp"
#include "mefw/types.hpp"
