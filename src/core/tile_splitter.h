#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "errors.h"
#include "geometry.h"
#include "image_buffer.h"
#include "output_sink.h"
#include "path_resolver.h"

namespace tilecut::core {

enum class SplitStage {
    validate,
    load,
    compute_geometry,
    split,
    persist,
    generate_markup,
    done,
    failed
};

const char* stage_name(SplitStage stage);

struct SplitResult {
    int tile_count = 0;
    std::vector<int> tile_heights;
    std::vector<TileBoundary> pc_boundaries;
    std::vector<TileBoundary> sp_boundaries;
    std::optional<std::filesystem::path> sp_image_path;
    std::vector<std::filesystem::path> pc_tiles;
    std::vector<std::filesystem::path> sp_tiles;
    std::string markup;
};

// One split job: resize the PC image (and its SP pair, if any), cut both into
// the same number of overlapping row tiles, write `1.ext`, `2.ext`, ... next
// to the sources and hand the markup to the sink. Stops at the first failing
// stage; tiles already written stay on disk.
class TileSplitter {
public:
    TileSplitter(SplitConfig config, MarkupSink sink, bool verbose, std::ostream& log);

    bool run();

    [[nodiscard]] SplitStage stage() const { return stage_; }
    [[nodiscard]] SplitStage failed_stage() const { return failed_stage_; }
    [[nodiscard]] const Error& error() const { return error_; }
    [[nodiscard]] const SplitResult& result() const { return result_; }
    [[nodiscard]] const PathSemantics& semantics() const { return semantics_; }

private:
    SplitConfig config_;
    MarkupSink sink_;
    bool verbose_;
    std::ostream& log_;

    SplitStage stage_ = SplitStage::validate;
    SplitStage failed_stage_ = SplitStage::validate;
    Error error_;
    SplitResult result_;
    PathSemantics semantics_;

    PixelBuffer pc_source_;
    PixelBuffer sp_source_;
    Dimensions pc_dims_;
    Dimensions sp_dims_;
    std::vector<PixelBuffer> pc_tile_images_;
    std::vector<PixelBuffer> sp_tile_images_;

    bool validate();
    bool load();
    bool compute_geometry();
    bool split();
    bool persist();
    bool generate_markup();

    bool split_image(PixelBuffer& source, const Dimensions& dims,
                     const std::vector<TileBoundary>& boundaries,
                     std::vector<PixelBuffer>& tiles);
    bool save_tiles(std::vector<PixelBuffer>& tiles, const std::filesystem::path& dir,
                    std::vector<std::filesystem::path>& written);
    void release_buffers();
};

} // namespace tilecut::core
