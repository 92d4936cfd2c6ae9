/**
 * mefw CLI - parse command
 *
 * Decode an image and print its structure.
 */

#include "../common.hpp"
#include "../report.hpp"

#include <mefw/model_json.hpp>
#include <CLI/CLI.hpp>

namespace mefw::cli::commands {

namespace {

struct ParseCommandOptions {
    std::string image;
    bool print = false;
};

int cmd_parse(const GlobalOptions& opts, const ParseCommandOptions& parse_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto options = load_parse_options(opts);
    if (!options) return EXIT_INPUT_ERROR;

    auto model = load_and_parse(parse_opts.image, *options, opts);
    if (!model) return EXIT_INPUT_ERROR;

    if (opts.json) {
        nlohmann::json j = model_to_json(*model);
        j["ok"] = true;
        output_json(j);
    } else if (parse_opts.print) {
        print_report(*model, std::cout);
    } else {
        size_t decoded = 0;
        for (const auto& p : model->partitions) {
            if (p.kind == PartitionKind::Cpd || p.kind == PartitionKind::Gen2) ++decoded;
        }
        std::cout << parse_opts.image << ": $FPT @ " << hex(model->fpt.offset) << ", "
                  << model->partitions.size() << " partitions, " << decoded
                  << " with directories, " << model->diagnostics.size() << " diagnostics"
                  << std::endl;
        if (!opts.quiet) print_diagnostics(model->diagnostics, std::cerr);
    }

    return model->has_errors ? EXIT_DIAGNOSTIC_ERROR : EXIT_OK;
}

} // anonymous namespace

void setup_parse(CLI::App* app, GlobalOptions& opts) {
    static ParseCommandOptions parse_opts;

    app->add_option("image", parse_opts.image, "Firmware image file")->required();
    app->add_flag("--print", parse_opts.print, "Print the partition tree");

    app->callback([&opts]() {
        std::exit(cmd_parse(opts, parse_opts));
    });
}

} // namespace mefw::cli::commands
