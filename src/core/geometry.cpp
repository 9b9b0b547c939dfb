#include "geometry.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace tilecut::core {

const char* extension_name(OutputExtension ext) {
    return ext == OutputExtension::png ? "png" : "jpg";
}

double resize_scale_factor(int current_width, const ResizeSpec& spec) {
    if (const auto* target = std::get_if<TargetWidth>(&spec)) {
        return static_cast<double>(target->width) / static_cast<double>(current_width);
    }
    return std::get<ScaleFactor>(spec).scale;
}

bool compute_resize_dimensions(int current_width, int current_height, const ResizeSpec& spec,
                               Dimensions& out, Error& error) {
    if (current_width < 1 || current_height < 1) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Cannot resize an image of " + std::to_string(current_width) + "x"
                        + std::to_string(current_height));
    }
    const double scale = resize_scale_factor(current_width, spec);
    const double width = std::floor(current_width * scale);
    const double height = std::floor(current_height * scale);
    if (!std::isfinite(width) || !std::isfinite(height) || width < 1.0 || height < 1.0) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Resize produces an empty image from " + std::to_string(current_width) + "x"
                        + std::to_string(current_height));
    }
    if (width > k_max_image_dimension || height > k_max_image_dimension
        || width * height > static_cast<double>(k_max_total_pixels)) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0) << "Resized image too large: " << width << "x" << height
            << " (limit " << k_max_image_dimension << " per side, " << k_max_total_pixels << " pixels)";
        return fail(error, ErrorKind::invalid_geometry, oss.str());
    }

    Dimensions dims;
    dims.width = static_cast<int>(width);
    dims.height = static_cast<int>(height);
    out = dims;
    return true;
}

bool validate_dimensions(const Dimensions& dims, Error& error) {
    if (dims.width < 1 || dims.height < 1) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Resize produces an empty image (" + std::to_string(dims.width) + "x"
                        + std::to_string(dims.height) + ")");
    }
    const long long total_pixels = static_cast<long long>(dims.width) * static_cast<long long>(dims.height);
    if (dims.width > k_max_image_dimension || dims.height > k_max_image_dimension
        || total_pixels > k_max_total_pixels) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Image too large: " + std::to_string(dims.width) + "x" + std::to_string(dims.height));
    }
    return true;
}

int compute_tile_count(int resized_height) {
    return std::max(1, resized_height / k_nominal_tile_height);
}

bool compute_tile_boundaries(int resized_height, int tile_count,
                             std::vector<TileBoundary>& out, Error& error) {
    if (resized_height < 1 || tile_count < 1) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Cannot split height " + std::to_string(resized_height) + " into "
                        + std::to_string(tile_count) + " tiles");
    }
    const int base_tile_height = resized_height / tile_count;
    if (tile_count > 1 && base_tile_height < k_tile_overlap) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Image height " + std::to_string(resized_height) + " is too short for "
                        + std::to_string(tile_count) + " overlapping tiles");
    }

    std::vector<TileBoundary> boundaries;
    boundaries.reserve(static_cast<size_t>(tile_count));
    for (int i = 0; i < tile_count; ++i) {
        TileBoundary tile;
        tile.top = i * base_tile_height - (i > 0 ? k_tile_overlap : 0);
        tile.bottom = (i == tile_count - 1) ? resized_height : (i + 1) * base_tile_height;
        boundaries.push_back(tile);
    }
    out = std::move(boundaries);
    return true;
}

std::vector<int> tile_heights(const std::vector<TileBoundary>& boundaries) {
    std::vector<int> heights;
    heights.reserve(boundaries.size());
    for (const auto& tile : boundaries) {
        heights.push_back(tile.height());
    }
    return heights;
}

NormalizationAction decide_encoding_transform(bool source_has_alpha, OutputExtension ext) {
    if (ext == OutputExtension::jpg && source_has_alpha) {
        return NormalizationAction::flatten_onto_white;
    }
    return NormalizationAction::pass_through;
}

} // namespace tilecut::core
