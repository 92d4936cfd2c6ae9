/**
 * mefw CLI - modules command
 *
 * List the modules of every code partition, optionally with content digests.
 */

#include "../common.hpp"

#include <CLI/CLI.hpp>
#include <iomanip>

namespace mefw::cli::commands {

namespace {

struct ModulesOptions {
    std::string image;
    bool digest = false;
};

int cmd_modules(const GlobalOptions& opts, const ModulesOptions& modules_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto options = load_parse_options(opts);
    if (!options) return EXIT_INPUT_ERROR;

    auto model = load_and_parse(modules_opts.image, *options, opts);
    if (!model) return EXIT_INPUT_ERROR;

    const auto registry = DecompressorRegistry::with_defaults();
    DiagnosticSink sink(options->diagnostics);

    nlohmann::json result;
    result["modules"] = nlohmann::json::array();

    for (const auto& module : list_modules(*model)) {
        nlohmann::json m;
        m["partition"] = module.partition;
        m["name"] = module.name;
        m["offset"] = module.range.offset;
        m["length"] = module.range.length;
        m["compression"] = compression_to_string(module.compression);
        if (module.uncompressed_size != 0) m["uncompressed_size"] = module.uncompressed_size;

        if (modules_opts.digest) {
            auto content = read_module_content(*model, module, registry, sink);
            if (content.ok) {
                auto hash = compute_sha256(content.data);
                if (hash.ok) {
                    m["sha256"] = hash.hex_digest;
                } else {
                    print_warning(module.name + ": " + hash.error);
                }
            } else {
                print_warning(module.partition + "/" + module.name + ": " + content.error);
            }
        }
        result["modules"].push_back(m);
    }

    if (opts.json) {
        result["ok"] = true;
        output_json(result);
    } else {
        for (const auto& m : result["modules"]) {
            std::cout << std::left << std::setw(4) << m["partition"].get<std::string>() << " "
                      << std::setw(16) << m["name"].get<std::string>() << std::right << " "
                      << hex(m["offset"].get<size_t>(), 8) << " +"
                      << hex(m["length"].get<size_t>(), 8) << " " << std::left << std::setw(7)
                      << m["compression"].get<std::string>() << std::right;
            if (m.contains("sha256")) std::cout << " " << m["sha256"].get<std::string>();
            std::cout << std::endl;
        }
    }

    bool escalated = model->has_errors || sink.has_errors();
    return escalated ? EXIT_DIAGNOSTIC_ERROR : EXIT_OK;
}

} // anonymous namespace

void setup_modules(CLI::App* app, GlobalOptions& opts) {
    static ModulesOptions modules_opts;

    app->add_option("image", modules_opts.image, "Firmware image file")->required();
    app->add_flag("--digest", modules_opts.digest, "Compute SHA-256 of module content");

    app->callback([&opts]() {
        std::exit(cmd_modules(opts, modules_opts));
    });
}

} // namespace mefw::cli::commands
