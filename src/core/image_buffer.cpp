#include "image_buffer.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <new>
#include <numbers>
#include <string>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace tilecut::core {

namespace {

constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;
constexpr int MAX_CHANNEL_VALUE = 255;
constexpr int k_rgb_channels = 3;
constexpr double k_lanczos_lobes = 3.0;
constexpr double k_kernel_epsilon = 1e-12;

bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

bool rgba_byte_count(int width, int height, size_t& out) {
    size_t pixel_count = 0;
    return width > 0 && height > 0
        && checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixel_count)
        && checked_mul_size_t(pixel_count, static_cast<size_t>(k_num_channels), out);
}

double lanczos_kernel(double x) {
    x = std::fabs(x);
    if (x < k_kernel_epsilon) {
        return 1.0;
    }
    if (x >= k_lanczos_lobes) {
        return 0.0;
    }
    const double pix = std::numbers::pi * x;
    return k_lanczos_lobes * std::sin(pix) * std::sin(pix / k_lanczos_lobes) / (pix * pix);
}

struct Contribution {
    int first = 0;
    std::vector<float> weights;
};

// Filter taps for every output column (or row). Downscaling widens the
// kernel by the reduction factor so every source pixel contributes.
std::vector<Contribution> compute_contributions(int in_size, int out_size) {
    const double scale = static_cast<double>(in_size) / static_cast<double>(out_size);
    const double filter_scale = std::max(1.0, scale);
    const double support = k_lanczos_lobes * filter_scale;

    std::vector<Contribution> contributions(static_cast<size_t>(out_size));
    for (int i = 0; i < out_size; ++i) {
        const double center = (i + 0.5) * scale;
        const int lo = std::max(0, static_cast<int>(std::floor(center - support)));
        const int hi = std::min(in_size, static_cast<int>(std::ceil(center + support)));

        Contribution& contribution = contributions[static_cast<size_t>(i)];
        contribution.first = lo;
        std::vector<double> weights;
        weights.reserve(static_cast<size_t>(std::max(0, hi - lo)));
        double total = 0.0;
        for (int j = lo; j < hi; ++j) {
            const double w = lanczos_kernel((j + 0.5 - center) / filter_scale);
            weights.push_back(w);
            total += w;
        }
        if (weights.empty() || std::fabs(total) < k_kernel_epsilon) {
            contribution.first = std::clamp(static_cast<int>(center), 0, in_size - 1);
            contribution.weights.assign(1, 1.0F);
            continue;
        }
        contribution.weights.reserve(weights.size());
        for (double w : weights) {
            contribution.weights.push_back(static_cast<float>(w / total));
        }
    }
    return contributions;
}

unsigned char clamp_channel(float value) {
    const float rounded = std::round(value);
    if (rounded <= 0.0F) {
        return 0;
    }
    if (rounded >= static_cast<float>(MAX_CHANNEL_VALUE)) {
        return static_cast<unsigned char>(MAX_CHANNEL_VALUE);
    }
    return static_cast<unsigned char>(rounded);
}

std::vector<unsigned char> strip_alpha(const PixelBuffer& image) {
    const size_t pixel_count = static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
    std::vector<unsigned char> rgb(pixel_count * k_rgb_channels);
    for (size_t p = 0; p < pixel_count; ++p) {
        const size_t src = p * k_num_channels;
        const size_t dst = p * k_rgb_channels;
        rgb[dst + CHANNEL_R] = image.pixels[src + CHANNEL_R];
        rgb[dst + CHANNEL_G] = image.pixels[src + CHANNEL_G];
        rgb[dst + CHANNEL_B] = image.pixels[src + CHANNEL_B];
    }
    return rgb;
}

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<unsigned char>*>(context);
    const auto* bytes = static_cast<const unsigned char*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

bool read_binary_file(const fs::path& path, std::vector<unsigned char>& out, Error& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail(error, ErrorKind::source_not_found, "Failed to open file: " + path.string());
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        return fail(error, ErrorKind::decode_error, "Failed to read file: " + path.string());
    }
    out = std::move(bytes);
    return true;
}

bool write_binary_file(const fs::path& path, const std::vector<unsigned char>& bytes, Error& error) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return fail(error, ErrorKind::encode_error, "Failed to open output file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return fail(error, ErrorKind::encode_error, "Failed to write output file: " + path.string());
    }
    return true;
}

bool decode_image(const std::vector<unsigned char>& bytes, PixelBuffer& out, Error& error) {
    if (bytes.empty()) {
        return fail(error, ErrorKind::decode_error, "No image data");
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return fail(error, ErrorKind::decode_error, "Image data is too large");
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &width, &height, &channels, k_num_channels);
    if (data == nullptr) {
        const char* reason = stbi_failure_reason();
        return fail(error, ErrorKind::decode_error,
                    std::string("Failed to decode image: ") + (reason != nullptr ? reason : "unknown error"));
    }

    size_t byte_count = 0;
    if (!rgba_byte_count(width, height, byte_count)) {
        stbi_image_free(data);
        return fail(error, ErrorKind::decode_error, "Decoded image has invalid dimensions");
    }

    PixelBuffer image;
    image.width = width;
    image.height = height;
    image.has_alpha = channels == 2 || channels == 4;
    image.pixels.assign(data, data + byte_count);
    stbi_image_free(data);

    out = std::move(image);
    return true;
}

bool load_image_file(const fs::path& path, PixelBuffer& out, Error& error) {
    std::vector<unsigned char> bytes;
    if (!read_binary_file(path, bytes, error)) {
        return false;
    }
    if (!decode_image(bytes, out, error)) {
        error.message += ": " + path.string();
        return false;
    }
    return true;
}

namespace {

void resample(const PixelBuffer& src, size_t src_bytes, const Dimensions& dims, size_t dst_bytes,
              PixelBuffer& out) {
    const auto columns = compute_contributions(src.width, dims.width);
    const auto rows = compute_contributions(src.height, dims.height);

    // Premultiplied source so transparent pixels do not bleed color.
    std::vector<float> premultiplied(src_bytes);
    for (size_t i = 0; i < src_bytes; i += k_num_channels) {
        const float alpha = src.pixels[i + CHANNEL_A];
        const float factor = alpha / static_cast<float>(MAX_CHANNEL_VALUE);
        premultiplied[i + CHANNEL_R] = src.pixels[i + CHANNEL_R] * factor;
        premultiplied[i + CHANNEL_G] = src.pixels[i + CHANNEL_G] * factor;
        premultiplied[i + CHANNEL_B] = src.pixels[i + CHANNEL_B] * factor;
        premultiplied[i + CHANNEL_A] = alpha;
    }

    const size_t horizontal_stride = static_cast<size_t>(dims.width) * k_num_channels;
    std::vector<float> horizontal(horizontal_stride * static_cast<size_t>(src.height), 0.0F);
    for (int y = 0; y < src.height; ++y) {
        const float* src_row = premultiplied.data() + static_cast<size_t>(y) * src.row_bytes();
        float* dst_row = horizontal.data() + static_cast<size_t>(y) * horizontal_stride;
        for (int x = 0; x < dims.width; ++x) {
            const Contribution& c = columns[static_cast<size_t>(x)];
            float acc[k_num_channels] = {0.0F, 0.0F, 0.0F, 0.0F};
            for (size_t k = 0; k < c.weights.size(); ++k) {
                const float* px = src_row + (static_cast<size_t>(c.first) + k) * k_num_channels;
                for (int ch = 0; ch < k_num_channels; ++ch) {
                    acc[ch] += px[ch] * c.weights[k];
                }
            }
            std::memcpy(dst_row + static_cast<size_t>(x) * k_num_channels, acc, sizeof(acc));
        }
    }

    PixelBuffer resized;
    resized.width = dims.width;
    resized.height = dims.height;
    resized.has_alpha = src.has_alpha;
    resized.pixels.assign(dst_bytes, 0);
    for (int y = 0; y < dims.height; ++y) {
        const Contribution& c = rows[static_cast<size_t>(y)];
        unsigned char* dst_row = resized.pixels.data() + static_cast<size_t>(y) * resized.row_bytes();
        for (int x = 0; x < dims.width; ++x) {
            float acc[k_num_channels] = {0.0F, 0.0F, 0.0F, 0.0F};
            for (size_t k = 0; k < c.weights.size(); ++k) {
                const float* px = horizontal.data()
                    + (static_cast<size_t>(c.first) + k) * horizontal_stride
                    + static_cast<size_t>(x) * k_num_channels;
                for (int ch = 0; ch < k_num_channels; ++ch) {
                    acc[ch] += px[ch] * c.weights[k];
                }
            }
            unsigned char* dst = dst_row + static_cast<size_t>(x) * k_num_channels;
            const unsigned char alpha = clamp_channel(acc[CHANNEL_A]);
            dst[CHANNEL_A] = alpha;
            if (alpha == 0) {
                dst[CHANNEL_R] = 0;
                dst[CHANNEL_G] = 0;
                dst[CHANNEL_B] = 0;
                continue;
            }
            const float unpremultiply = static_cast<float>(MAX_CHANNEL_VALUE) / static_cast<float>(alpha);
            dst[CHANNEL_R] = clamp_channel(acc[CHANNEL_R] * unpremultiply);
            dst[CHANNEL_G] = clamp_channel(acc[CHANNEL_G] * unpremultiply);
            dst[CHANNEL_B] = clamp_channel(acc[CHANNEL_B] * unpremultiply);
        }
    }

    out = std::move(resized);
}

} // namespace

bool resize_lanczos(const PixelBuffer& src, const Dimensions& dims, PixelBuffer& out, Error& error) {
    size_t src_bytes = 0;
    size_t dst_bytes = 0;
    if (!rgba_byte_count(src.width, src.height, src_bytes) || src.pixels.size() < src_bytes) {
        return fail(error, ErrorKind::invalid_geometry, "Cannot resize an empty image");
    }
    if (!validate_dimensions(dims, error) || !rgba_byte_count(dims.width, dims.height, dst_bytes)) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Invalid resize target " + std::to_string(dims.width) + "x" + std::to_string(dims.height));
    }

    if (dims.width == src.width && dims.height == src.height) {
        out = src;
        return true;
    }

    try {
        resample(src, src_bytes, dims, dst_bytes, out);
    } catch (const std::bad_alloc&) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Not enough memory to resize to " + std::to_string(dims.width) + "x"
                        + std::to_string(dims.height));
    }
    return true;
}

bool crop_rows(const PixelBuffer& src, const TileBoundary& rows, PixelBuffer& out, Error& error) {
    if (rows.top < 0 || rows.bottom > src.height || rows.bottom <= rows.top) {
        return fail(error, ErrorKind::invalid_geometry,
                    "Tile rows " + std::to_string(rows.top) + ".." + std::to_string(rows.bottom)
                        + " fall outside image height " + std::to_string(src.height));
    }

    const size_t row_bytes = src.row_bytes();
    PixelBuffer tile;
    tile.width = src.width;
    tile.height = rows.height();
    tile.has_alpha = src.has_alpha;
    tile.pixels.assign(src.pixels.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(rows.top) * row_bytes),
                       src.pixels.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(rows.bottom) * row_bytes));
    out = std::move(tile);
    return true;
}

void flatten_onto_white(PixelBuffer& image) {
    for (size_t i = 0; i + CHANNEL_A < image.pixels.size(); i += k_num_channels) {
        const int alpha = image.pixels[i + CHANNEL_A];
        const int background = (MAX_CHANNEL_VALUE - alpha) * MAX_CHANNEL_VALUE;
        for (size_t ch = CHANNEL_R; ch <= CHANNEL_B; ++ch) {
            const int blended = image.pixels[i + ch] * alpha + background;
            image.pixels[i + ch] = static_cast<unsigned char>((blended + MAX_CHANNEL_VALUE / 2) / MAX_CHANNEL_VALUE);
        }
        image.pixels[i + CHANNEL_A] = static_cast<unsigned char>(MAX_CHANNEL_VALUE);
    }
    image.has_alpha = false;
}

bool encode_image(const PixelBuffer& image, OutputExtension ext, std::vector<unsigned char>& out, Error& error) {
    size_t byte_count = 0;
    if (!rgba_byte_count(image.width, image.height, byte_count) || image.pixels.size() < byte_count) {
        return fail(error, ErrorKind::encode_error, "Cannot encode an empty image");
    }

    std::vector<unsigned char> encoded;
    int ok = 0;
    if (ext == OutputExtension::png && image.has_alpha) {
        ok = stbi_write_png_to_func(append_to_vector, &encoded, image.width, image.height,
                                    k_num_channels, image.pixels.data(),
                                    static_cast<int>(image.row_bytes()));
    } else {
        const std::vector<unsigned char> rgb = strip_alpha(image);
        if (ext == OutputExtension::png) {
            ok = stbi_write_png_to_func(append_to_vector, &encoded, image.width, image.height,
                                        k_rgb_channels, rgb.data(), image.width * k_rgb_channels);
        } else {
            ok = stbi_write_jpg_to_func(append_to_vector, &encoded, image.width, image.height,
                                        k_rgb_channels, rgb.data(), k_jpeg_quality);
        }
    }
    if (ok == 0 || encoded.empty()) {
        return fail(error, ErrorKind::encode_error,
                    std::string("Failed to encode ") + extension_name(ext) + " data");
    }
    out = std::move(encoded);
    return true;
}

bool save_image(const PixelBuffer& image, OutputExtension ext, const fs::path& path, Error& error) {
    std::vector<unsigned char> encoded;
    if (!encode_image(image, ext, encoded, error)) {
        error.message += ": " + path.string();
        return false;
    }
    return write_binary_file(path, encoded, error);
}

} // namespace tilecut::core
