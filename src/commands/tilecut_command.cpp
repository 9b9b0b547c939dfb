// tilecut_command.cpp
// MIT License (c) 2026 Pedro

#include "tilecut_command.h"

#include <filesystem>
#include <iostream>
#include <string>
namespace fs = std::filesystem;
#include "core/cli_parse.h"
#include "core/config.h"
#include "core/errors.h"
#include "core/markup.h"
#include "core/output_sink.h"
#include "core/tile_splitter.h"

namespace {
using tilecut::core::ConfigValues;
using tilecut::core::Error;
using tilecut::core::OutputOptions;
using tilecut::core::OutputTarget;
using tilecut::core::SplitConfig;
using tilecut::core::TileSplitter;
using tilecut::core::parse_positive_double;
using tilecut::core::parse_positive_int;

struct Config {
    fs::path input_path;
    fs::path config_path;
    ConfigValues values;
    OutputOptions output;
    bool verbose = false;
};

void print_usage() {
    std::cout << "Usage: tilecut [OPTIONS] <pc_image>\n"
              << "\n"
              << "Resize an image, split it into overlapping row tiles saved next to it\n"
              << "(1.jpg, 2.jpg, ...) and print the markup that stacks them.\n"
              << "An image under .../images/.../pc/... is paired with its .../sp/... counterpart.\n"
              << "\n"
              << "Options:\n"
              << "  --width N                  Target width of the PC image\n"
              << "  --scale F                  Scale of the PC image (default: 2.0)\n"
              << "  --sp-width N               Target width of the SP image\n"
              << "  --sp-scale F               Scale of the SP image (default: 2.0)\n"
              << "  --media QUERY              Media condition of the SP source (default: "
              << tilecut::core::k_default_media_query << ")\n"
              << "  --config PATH              JSON file with width, scale, sp_width, sp_scale, media\n"
              << "  -o, --output PATH          Write the markup to PATH instead of stdout\n"
              << "  -c, --clipboard            Copy the markup to the clipboard\n"
              << "  -v, --verbose              Print sizes and written tiles to stderr\n"
              << "  -h, --help                 Show this help message\n";
}

bool read_option_value(int argc, char** argv, int& i, const std::string& arg, std::string& out) {
    if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << "\n";
        return false;
    }
    out = argv[++i];
    return true;
}

bool set_once(bool already_set, const std::string& arg) {
    if (already_set) {
        std::cerr << "Error: " << arg << " given more than once\n";
        return false;
    }
    return true;
}

} // namespace

int run_tilecut(int argc, char** argv) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--width") {
            int width = 0;
            if (!set_once(config.values.width.has_value(), arg)
                || !read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            if (!parse_positive_int(value, width)) {
                std::cerr << "Error: Invalid width: " << value << "\n";
                return 1;
            }
            config.values.width = width;
        } else if (arg == "--scale") {
            double scale = 0.0;
            if (!set_once(config.values.scale.has_value(), arg)
                || !read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            if (!parse_positive_double(value, scale)) {
                std::cerr << "Error: Invalid scale: " << value << "\n";
                return 1;
            }
            config.values.scale = scale;
        } else if (arg == "--sp-width") {
            int width = 0;
            if (!set_once(config.values.sp_width.has_value(), arg)
                || !read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            if (!parse_positive_int(value, width)) {
                std::cerr << "Error: Invalid SP width: " << value << "\n";
                return 1;
            }
            config.values.sp_width = width;
        } else if (arg == "--sp-scale") {
            double scale = 0.0;
            if (!set_once(config.values.sp_scale.has_value(), arg)
                || !read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            if (!parse_positive_double(value, scale)) {
                std::cerr << "Error: Invalid SP scale: " << value << "\n";
                return 1;
            }
            config.values.sp_scale = scale;
        } else if (arg == "--media") {
            if (!read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            config.values.media = value;
        } else if (arg == "--config") {
            if (!read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            config.config_path = value;
        } else if (arg == "-o" || arg == "--output") {
            if (!read_option_value(argc, argv, i, arg, value)) {
                return 1;
            }
            config.output.target = OutputTarget::file;
            config.output.file_path = value;
        } else if (arg == "-c" || arg == "--clipboard") {
            config.output.target = OutputTarget::clipboard;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg.starts_with("-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else if (config.input_path.empty()) {
            config.input_path = arg;
        } else {
            std::cerr << "Error: Too many arguments: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    if (config.input_path.empty()) {
        std::cerr << "Error: PC image path is required\n";
        print_usage();
        return 1;
    }
    if (config.values.width && config.values.scale) {
        std::cerr << "Error: --width and --scale cannot be used together\n";
        return 1;
    }
    if (config.values.sp_width && config.values.sp_scale) {
        std::cerr << "Error: --sp-width and --sp-scale cannot be used together\n";
        return 1;
    }

    ConfigValues file_values;
    if (!config.config_path.empty()) {
        std::string warning;
        file_values = tilecut::core::load_config_file(config.config_path, warning);
        if (!warning.empty()) {
            std::cerr << "Warning: " << warning << "\n";
        }
    }

    SplitConfig split_config;
    Error error;
    if (!tilecut::core::merge_config(config.input_path, config.values, file_values, split_config, error)) {
        std::cerr << "Error: " << error.message << "\n";
        return 1;
    }

    TileSplitter splitter(split_config, tilecut::core::make_markup_sink(config.output),
                          config.verbose, std::cerr);
    if (!splitter.run()) {
        std::cerr << "Error: " << splitter.error().message << "\n";
        if (config.verbose) {
            std::cerr << "Failed during " << tilecut::core::stage_name(splitter.failed_stage())
                      << " (" << tilecut::core::error_kind_name(splitter.error().kind) << ")\n";
        }
        return 1;
    }

    const int tile_count = splitter.result().tile_count;
    if (config.output.target == OutputTarget::clipboard) {
        std::cerr << "Copied markup for " << tile_count << " tiles to the clipboard.\n";
    } else if (config.output.target == OutputTarget::file) {
        std::cerr << "Wrote markup for " << tile_count << " tiles to " << config.output.file_path.string() << "\n";
    } else if (config.verbose) {
        std::cerr << "Split into " << tile_count << " tiles.\n";
    }
    return 0;
}
