#pragma once

#include <variant>
#include <vector>

#include "errors.h"

namespace tilecut::core {

constexpr double k_default_scale = 2.0;
constexpr int k_nominal_tile_height = 200;
constexpr int k_tile_overlap = 10;
constexpr int k_max_image_dimension = 32768;
constexpr long long k_max_total_pixels = 100000000;

struct TargetWidth {
    int width = 0;
};

struct ScaleFactor {
    double scale = k_default_scale;
};

// Width and scale are mutually exclusive for one image.
using ResizeSpec = std::variant<TargetWidth, ScaleFactor>;

struct Dimensions {
    int width = 0;
    int height = 0;
};

struct TileBoundary {
    int top = 0;
    int bottom = 0;

    [[nodiscard]] int height() const { return bottom - top; }

    bool operator==(const TileBoundary& other) const {
        return top == other.top && bottom == other.bottom;
    }
};

enum class NormalizationAction {
    pass_through,
    flatten_onto_white
};

enum class OutputExtension {
    png,
    jpg
};

const char* extension_name(OutputExtension ext);

double resize_scale_factor(int current_width, const ResizeSpec& spec);

// floor(current * scale) on both axes. Fails with InvalidGeometry when an
// axis collapses below one pixel or the result exceeds the size limits.
bool compute_resize_dimensions(int current_width, int current_height, const ResizeSpec& spec,
                               Dimensions& out, Error& error);

// Rejects dimensions below one pixel or above k_max_image_dimension /
// k_max_total_pixels.
bool validate_dimensions(const Dimensions& dims, Error& error);

int compute_tile_count(int resized_height);

bool compute_tile_boundaries(int resized_height, int tile_count,
                             std::vector<TileBoundary>& out, Error& error);

std::vector<int> tile_heights(const std::vector<TileBoundary>& boundaries);

NormalizationAction decide_encoding_transform(bool source_has_alpha, OutputExtension ext);

} // namespace tilecut::core
