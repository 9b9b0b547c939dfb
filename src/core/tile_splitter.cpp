#include "tile_splitter.h"

#include <array>
#include <ostream>
#include <system_error>
#include <utility>

#include "markup.h"
#include "pair_resolver.h"

namespace fs = std::filesystem;

namespace tilecut::core {

const char* stage_name(SplitStage stage) {
    switch (stage) {
        case SplitStage::validate: return "validate";
        case SplitStage::load: return "load";
        case SplitStage::compute_geometry: return "compute-geometry";
        case SplitStage::split: return "split";
        case SplitStage::persist: return "persist";
        case SplitStage::generate_markup: return "generate-markup";
        case SplitStage::done: return "done";
        case SplitStage::failed: return "failed";
    }
    return "unknown";
}

TileSplitter::TileSplitter(SplitConfig config, MarkupSink sink, bool verbose, std::ostream& log)
    : config_(std::move(config)), sink_(std::move(sink)), verbose_(verbose), log_(log) {}

bool TileSplitter::run() {
    using Step = bool (TileSplitter::*)();
    const std::array<std::pair<SplitStage, Step>, 6> steps = {{
        {SplitStage::validate, &TileSplitter::validate},
        {SplitStage::load, &TileSplitter::load},
        {SplitStage::compute_geometry, &TileSplitter::compute_geometry},
        {SplitStage::split, &TileSplitter::split},
        {SplitStage::persist, &TileSplitter::persist},
        {SplitStage::generate_markup, &TileSplitter::generate_markup},
    }};

    result_ = SplitResult{};
    error_ = Error{};
    for (const auto& [stage, step] : steps) {
        stage_ = stage;
        if (!(this->*step)()) {
            failed_stage_ = stage;
            stage_ = SplitStage::failed;
            release_buffers();
            return false;
        }
    }
    stage_ = SplitStage::done;
    release_buffers();
    return true;
}

bool TileSplitter::validate() {
    const fs::path& pc_path = config_.pc_image_path;
    std::error_code ec;
    if (pc_path.empty() || !fs::is_regular_file(pc_path, ec)) {
        return fail(error_, ErrorKind::source_not_found, "Image not found: " + pc_path.string());
    }
    if (!resolve_path_semantics(pc_path, semantics_, error_)) {
        return false;
    }
    if (verbose_) {
        log_ << "Layout: " << (semantics_.is_responsive ? "responsive (pc/sp)" : "single image")
             << ", wrapper: " << semantics_.wrapper_class.value_or("(none)")
             << ", first view: " << (semantics_.is_first_view ? "yes" : "no")
             << ", output: ." << extension_name(semantics_.output_extension) << "\n";
    }
    return true;
}

bool TileSplitter::load() {
    if (!load_image_file(config_.pc_image_path, pc_source_, error_)) {
        return false;
    }
    if (verbose_) {
        log_ << "PC image original size: " << pc_source_.width << "x" << pc_source_.height << "\n";
    }

    result_.sp_image_path = find_sp_counterpart(config_.pc_image_path);
    if (!result_.sp_image_path) {
        return true;
    }
    if (!load_image_file(*result_.sp_image_path, sp_source_, error_)) {
        return false;
    }
    if (verbose_) {
        log_ << "SP image: " << result_.sp_image_path->string() << "\n"
             << "SP image original size: " << sp_source_.width << "x" << sp_source_.height << "\n";
    }
    return true;
}

bool TileSplitter::compute_geometry() {
    if (!compute_resize_dimensions(pc_source_.width, pc_source_.height, config_.pc_resize, pc_dims_, error_)) {
        return false;
    }
    result_.tile_count = compute_tile_count(pc_dims_.height);
    if (!compute_tile_boundaries(pc_dims_.height, result_.tile_count, result_.pc_boundaries, error_)) {
        return false;
    }
    if (verbose_) {
        log_ << "PC image new size: " << pc_dims_.width << "x" << pc_dims_.height << "\n"
             << "Tiles: " << result_.tile_count << "\n";
    }

    if (sp_source_.empty()) {
        return true;
    }
    // SP keeps its own size but follows the PC tile count.
    if (!compute_resize_dimensions(sp_source_.width, sp_source_.height, config_.sp_resize, sp_dims_, error_)) {
        error_.message = "SP image: " + error_.message;
        return false;
    }
    if (!compute_tile_boundaries(sp_dims_.height, result_.tile_count, result_.sp_boundaries, error_)) {
        error_.message = "SP image: " + error_.message;
        return false;
    }
    if (verbose_) {
        log_ << "SP image new size: " << sp_dims_.width << "x" << sp_dims_.height << "\n";
    }
    return true;
}

bool TileSplitter::split_image(PixelBuffer& source, const Dimensions& dims,
                               const std::vector<TileBoundary>& boundaries,
                               std::vector<PixelBuffer>& tiles) {
    PixelBuffer resized;
    if (!resize_lanczos(source, dims, resized, error_)) {
        return false;
    }
    source.release();

    tiles.clear();
    tiles.reserve(boundaries.size());
    for (const auto& boundary : boundaries) {
        PixelBuffer tile;
        if (!crop_rows(resized, boundary, tile, error_)) {
            return false;
        }
        tiles.push_back(std::move(tile));
    }
    return true;
}

bool TileSplitter::split() {
    if (!split_image(pc_source_, pc_dims_, result_.pc_boundaries, pc_tile_images_)) {
        return false;
    }
    result_.tile_heights = tile_heights(result_.pc_boundaries);
    if (!sp_source_.empty()) {
        return split_image(sp_source_, sp_dims_, result_.sp_boundaries, sp_tile_images_);
    }
    return true;
}

bool TileSplitter::save_tiles(std::vector<PixelBuffer>& tiles, const fs::path& dir,
                              std::vector<fs::path>& written) {
    const OutputExtension ext = semantics_.output_extension;
    for (size_t i = 0; i < tiles.size(); ++i) {
        PixelBuffer& tile = tiles[i];
        if (decide_encoding_transform(tile.has_alpha, ext) == NormalizationAction::flatten_onto_white) {
            flatten_onto_white(tile);
        }
        const fs::path output_path = dir / (std::to_string(i + 1) + "." + extension_name(ext));
        if (!save_image(tile, ext, output_path, error_)) {
            return false;
        }
        written.push_back(output_path);
        if (verbose_) {
            log_ << "Saved: " << output_path.string() << " (" << tile.width << "x" << tile.height << ")\n";
        }
        tile.release();
    }
    return true;
}

bool TileSplitter::persist() {
    fs::path pc_dir = config_.pc_image_path.parent_path();
    if (pc_dir.empty()) {
        pc_dir = ".";
    }
    if (!save_tiles(pc_tile_images_, pc_dir, result_.pc_tiles)) {
        return false;
    }

    if (sp_tile_images_.empty() || !result_.sp_image_path) {
        return true;
    }
    fs::path sp_dir = result_.sp_image_path->parent_path();
    if (sp_dir.empty()) {
        sp_dir = ".";
    }
    std::error_code ec;
    fs::create_directories(sp_dir, ec);
    if (ec) {
        return fail(error_, ErrorKind::encode_error,
                    "Failed to create output directory " + sp_dir.string() + ": " + ec.message());
    }
    return save_tiles(sp_tile_images_, sp_dir, result_.sp_tiles);
}

bool TileSplitter::generate_markup() {
    result_.markup = core::generate_markup(result_.tile_count, semantics_, result_.tile_heights,
                                           config_.media_query);
    if (!sink_) {
        return true;
    }
    return sink_(result_.markup, error_);
}

void TileSplitter::release_buffers() {
    pc_source_.release();
    sp_source_.release();
    pc_tile_images_.clear();
    sp_tile_images_.clear();
}

} // namespace tilecut::core
