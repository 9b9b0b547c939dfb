// End-to-end runs of TileSplitter against generated image trees.
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/tile_splitter.h"
#include "test_utils.hpp"

using namespace tilecut::core;
namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "[tile_splitter_e2e] FAIL: " << msg << "\n";
    }
    return cond;
}

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

struct CapturingSink {
    std::string markup;
    int calls = 0;

    MarkupSink sink() {
        return [this](const std::string& text, Error&) {
            markup = text;
            ++calls;
            return true;
        };
    }
};

SplitConfig make_config(const fs::path& image, ResizeSpec pc_resize = ScaleFactor{},
                        ResizeSpec sp_resize = ScaleFactor{}) {
    SplitConfig config;
    config.pc_image_path = image;
    config.pc_resize = pc_resize;
    config.sp_resize = sp_resize;
    return config;
}

bool test_single_image(const fs::path& root) {
    const fs::path image = root / "single/images/banner.png";
    bool ok = check(test_utils::write_fixture(test_utils::make_row_gradient(1500, 1000), OutputExtension::png, image),
                    "single fixture written");

    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(image, ScaleFactor{1.0}), capture.sink(), true, log);
    ok &= check(splitter.run(), "single image run succeeds: " + splitter.error().message);
    ok &= check(splitter.stage() == SplitStage::done, "stage is done");

    const SplitResult& result = splitter.result();
    ok &= check(result.tile_count == 5, "1000 rows make 5 tiles");
    const std::vector<TileBoundary> expected = {{0, 200}, {190, 400}, {390, 600}, {590, 800}, {790, 1000}};
    ok &= check(result.pc_boundaries == expected, "each tile after the first starts 10 rows early");
    ok &= check(result.tile_heights == std::vector<int>({200, 210, 210, 210, 210}), "tile heights");
    ok &= check(!result.sp_image_path.has_value(), "no sp pairing");
    ok &= check(result.sp_tiles.empty(), "no sp tiles");

    ok &= check(result.pc_tiles.size() == 5, "five tiles written");
    for (int i = 1; i <= 5; ++i) {
        const fs::path tile_path = image.parent_path() / (std::to_string(i) + ".png");
        PixelBuffer tile;
        Error error;
        ok &= check(load_image_file(tile_path, tile, error), "tile " + std::to_string(i) + " readable");
        ok &= check(tile.width == 1500, "tile keeps the full width");
        ok &= check(tile.height == result.tile_heights[static_cast<size_t>(i - 1)], "tile height on disk");
    }

    ok &= check(capture.calls == 1, "sink called once");
    ok &= check(capture.markup == result.markup, "sink got the markup");
    ok &= check(count_occurrences(capture.markup, "<img ") == 5, "one img per tile");
    ok &= check(capture.markup.find("<div") == std::string::npos, "no wrapper for a bare images path");
    ok &= check(capture.markup.find("src=\"./images/1.png\"") != std::string::npos, "first tile url");
    ok &= check(log.str().find("Tiles: 5") != std::string::npos, "verbose log reports tile count");
    ok &= check(log.str().find("PC image original size: 1500x1000") != std::string::npos, "verbose log reports size");
    return ok;
}

bool test_responsive_pair(const fs::path& root) {
    const fs::path pc = root / "pair/images/widget/pc/hero/banner.jpg";
    const fs::path sp = root / "pair/images/widget/sp/hero/banner.png";
    bool ok = check(test_utils::write_fixture(test_utils::make_row_gradient(300, 260), OutputExtension::jpg, pc),
                    "pc fixture written");
    ok &= check(test_utils::write_fixture(test_utils::make_solid(150, 260, 10, 200, 10, 128), OutputExtension::png, sp),
                "sp fixture written");

    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(pc), capture.sink(), false, log);
    ok &= check(splitter.run(), "responsive run succeeds: " + splitter.error().message);

    const SplitResult& result = splitter.result();
    ok &= check(result.tile_count == 2, "520 rows make 2 tiles");
    ok &= check(result.sp_image_path && *result.sp_image_path == sp, "png counterpart paired with jpg source");
    ok &= check(result.sp_tiles.size() == result.pc_tiles.size(), "sp follows the pc tile count");
    ok &= check(splitter.semantics().is_responsive, "responsive layout");

    for (const auto& tile_path : result.sp_tiles) {
        ok &= check(tile_path.parent_path() == sp.parent_path(), "sp tiles written beside the sp source");
        ok &= check(tile_path.extension() == ".jpg", "sp tiles use the pc extension");
        PixelBuffer tile;
        Error error;
        ok &= check(load_image_file(tile_path, tile, error), "sp tile readable");
        ok &= check(tile.width == 300 && !tile.has_alpha, "sp tile resized and flattened");
    }
    for (const auto& tile_path : result.pc_tiles) {
        ok &= check(tile_path.parent_path() == pc.parent_path(), "pc tiles written beside the pc source");
    }

    ok &= check(capture.markup.find("<div class=\"widget\">") == 0, "widget wrapper");
    ok &= check(count_occurrences(capture.markup, "<picture ") == 2, "one picture per tile");
    ok &= check(capture.markup.find("srcset=\"./images/widget/sp/hero/2.jpg\"") != std::string::npos, "sp url");
    ok &= check(capture.markup.find("src=\"./images/widget/pc/hero/1.jpg\"") != std::string::npos, "pc url");
    ok &= check(log.str().empty(), "quiet without verbose");
    return ok;
}

bool test_target_width(const fs::path& root) {
    const fs::path image = root / "width/images/top/fv/hero.png";
    bool ok = check(test_utils::write_fixture(test_utils::make_solid(100, 300, 1, 2, 3), OutputExtension::png, image),
                    "width fixture written");

    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(image, TargetWidth{50}), capture.sink(), false, log);
    ok &= check(splitter.run(), "target width run succeeds: " + splitter.error().message);
    ok &= check(splitter.result().tile_count == 1, "150 rows make a single tile");
    ok &= check(splitter.result().tile_heights == std::vector<int>({150}), "single tile spans the image");
    ok &= check(splitter.semantics().is_first_view, "fv directory detected");
    ok &= check(capture.markup.find("<div class=\"top\">") == 0, "wrapper from the first directory");
    return ok;
}

bool test_missing_source(const fs::path& root) {
    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(root / "nowhere/images/missing.png"), capture.sink(), false, log);
    bool ok = check(!splitter.run(), "missing source fails");
    ok &= check(splitter.stage() == SplitStage::failed, "stage is failed");
    ok &= check(splitter.failed_stage() == SplitStage::validate, "fails while validating");
    ok &= check(splitter.error().kind == ErrorKind::source_not_found, "reported as source not found");
    ok &= check(capture.calls == 0, "sink never called");
    return ok;
}

bool test_invalid_path_kind(const fs::path& root) {
    const fs::path image = root / "assets/banner.png";
    bool ok = check(test_utils::write_fixture(test_utils::make_solid(10, 10, 0, 0, 0), OutputExtension::png, image),
                    "assets fixture written");
    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(image), capture.sink(), false, log);
    ok &= check(!splitter.run(), "path without images fails");
    ok &= check(splitter.error().kind == ErrorKind::invalid_path_kind, "reported as invalid path kind");
    ok &= check(!fs::exists(image.parent_path() / "1.png"), "nothing written");
    return ok;
}

bool test_corrupt_source(const fs::path& root) {
    const fs::path image = root / "corrupt/images/broken.png";
    fs::create_directories(image.parent_path());
    std::ofstream(image, std::ios::binary) << "definitely not a png";

    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(image), capture.sink(), false, log);
    bool ok = check(!splitter.run(), "corrupt source fails");
    ok &= check(splitter.failed_stage() == SplitStage::load, "fails while loading");
    ok &= check(splitter.error().kind == ErrorKind::decode_error, "reported as decode error");
    ok &= check(capture.calls == 0, "sink never called");
    return ok;
}

bool test_oversized_scale(const fs::path& root) {
    const fs::path image = root / "huge/images/banner.png";
    bool ok = check(test_utils::write_fixture(test_utils::make_solid(20, 20, 0, 0, 0), OutputExtension::png, image),
                    "huge fixture written");
    CapturingSink capture;
    std::ostringstream log;
    TileSplitter splitter(make_config(image, ScaleFactor{5000.0}), capture.sink(), false, log);
    ok &= check(!splitter.run(), "oversized scale fails");
    ok &= check(splitter.failed_stage() == SplitStage::compute_geometry, "fails while computing geometry");
    ok &= check(splitter.error().kind == ErrorKind::invalid_geometry, "reported as invalid geometry");
    ok &= check(!fs::exists(image.parent_path() / "1.png"), "nothing written");
    ok &= check(capture.calls == 0, "sink never called");

    TileSplitter overflow(make_config(image, ScaleFactor{1e300}), capture.sink(), false, log);
    ok &= check(!overflow.run(), "scale beyond int range fails");
    ok &= check(overflow.error().kind == ErrorKind::invalid_geometry, "overflow reported as invalid geometry");
    return ok;
}

bool test_failing_sink(const fs::path& root) {
    const fs::path image = root / "sink/images/banner.png";
    bool ok = check(test_utils::write_fixture(test_utils::make_solid(20, 20, 0, 0, 0), OutputExtension::png, image),
                    "sink fixture written");
    MarkupSink refusing = [](const std::string&, Error& error) {
        return fail(error, ErrorKind::output_error, "clipboard unavailable");
    };
    std::ostringstream log;
    TileSplitter splitter(make_config(image), refusing, false, log);
    ok &= check(!splitter.run(), "failing sink fails the run");
    ok &= check(splitter.failed_stage() == SplitStage::generate_markup, "fails while emitting markup");
    ok &= check(splitter.error().kind == ErrorKind::output_error, "reported as output error");
    ok &= check(fs::exists(image.parent_path() / "1.png"), "tiles stay on disk");
    return ok;
}

bool test_file_sink(const fs::path& root) {
    const fs::path image = root / "file/images/banner.png";
    const fs::path markup_path = root / "file/markup.html";
    bool ok = check(test_utils::write_fixture(test_utils::make_solid(20, 20, 0, 0, 0), OutputExtension::png, image),
                    "file sink fixture written");
    OutputOptions options;
    options.target = OutputTarget::file;
    options.file_path = markup_path;
    std::ostringstream log;
    TileSplitter splitter(make_config(image), make_markup_sink(options), false, log);
    ok &= check(splitter.run(), "file sink run succeeds: " + splitter.error().message);

    std::ifstream in(markup_path);
    std::stringstream written;
    written << in.rdbuf();
    ok &= check(written.str().find(splitter.result().markup) == 0, "markup written to file");
    return ok;
}

} // namespace

int main() {
    test_utils::ScratchDir scratch("e2e");
    bool ok = true;
    ok &= test_single_image(scratch.path());
    ok &= test_responsive_pair(scratch.path());
    ok &= test_target_width(scratch.path());
    ok &= test_missing_source(scratch.path());
    ok &= test_invalid_path_kind(scratch.path());
    ok &= test_corrupt_source(scratch.path());
    ok &= test_oversized_scale(scratch.path());
    ok &= test_failing_sink(scratch.path());
    ok &= test_file_sink(scratch.path());
    return ok ? 0 : 1;
}
