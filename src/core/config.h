#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "errors.h"
#include "geometry.h"
#include "markup.h"

namespace tilecut::core {

// Resize and markup options as given by one source (command line or config
// file). Unset fields fall through to the other source, then to defaults.
struct ConfigValues {
    std::optional<int> width;
    std::optional<double> scale;
    std::optional<int> sp_width;
    std::optional<double> sp_scale;
    std::optional<std::string> media;
};

struct SplitConfig {
    std::filesystem::path pc_image_path;
    ResizeSpec pc_resize = ScaleFactor{};
    ResizeSpec sp_resize = ScaleFactor{};
    std::string media_query = k_default_media_query;
};

// Reads a flat JSON object with the keys width, scale, sp_width, sp_scale
// and media. `null` leaves a key unset; unknown keys are ignored.
bool parse_config_json(const std::string& text, ConfigValues& out, std::string& error);

// A missing or malformed file yields empty values and a warning.
ConfigValues load_config_file(const std::filesystem::path& path, std::string& warning);

bool make_resize_spec(const std::optional<int>& width,
                      const std::optional<double>& scale,
                      const std::string& width_key,
                      const std::string& scale_key,
                      ResizeSpec& out,
                      Error& error);

// Config file values take precedence over command line values.
bool merge_config(const std::filesystem::path& pc_image_path,
                  const ConfigValues& cli,
                  const ConfigValues& file,
                  SplitConfig& out,
                  Error& error);

} // namespace tilecut::core
