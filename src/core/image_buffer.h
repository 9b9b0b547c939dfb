#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "errors.h"
#include "geometry.h"

namespace tilecut::core {

constexpr int k_num_channels = 4;
constexpr int k_jpeg_quality = 75;

// Decoded image, always stored as 8-bit RGBA rows. `has_alpha` records
// whether the source carried transparency at all.
struct PixelBuffer {
    int width = 0;
    int height = 0;
    bool has_alpha = false;
    std::vector<unsigned char> pixels;

    [[nodiscard]] bool empty() const { return pixels.empty(); }
    [[nodiscard]] size_t row_bytes() const {
        return static_cast<size_t>(width) * k_num_channels;
    }

    void release() {
        std::vector<unsigned char>().swap(pixels);
        width = 0;
        height = 0;
        has_alpha = false;
    }
};

bool read_binary_file(const std::filesystem::path& path, std::vector<unsigned char>& out, Error& error);
bool write_binary_file(const std::filesystem::path& path, const std::vector<unsigned char>& bytes, Error& error);

bool decode_image(const std::vector<unsigned char>& bytes, PixelBuffer& out, Error& error);
bool load_image_file(const std::filesystem::path& path, PixelBuffer& out, Error& error);

// Separable Lanczos-3 resample on premultiplied alpha.
bool resize_lanczos(const PixelBuffer& src, const Dimensions& dims, PixelBuffer& out, Error& error);

bool crop_rows(const PixelBuffer& src, const TileBoundary& rows, PixelBuffer& out, Error& error);

// Composites onto opaque white and drops the alpha flag.
void flatten_onto_white(PixelBuffer& image);

// PNG keeps alpha when present; JPEG is always written as RGB.
bool encode_image(const PixelBuffer& image, OutputExtension ext, std::vector<unsigned char>& out, Error& error);

bool save_image(const PixelBuffer& image, OutputExtension ext, const std::filesystem::path& path, Error& error);

} // namespace tilecut::core
