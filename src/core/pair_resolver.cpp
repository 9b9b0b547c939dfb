#include "pair_resolver.h"

#include <system_error>

#include "cli_parse.h"
#include "path_resolver.h"

namespace fs = std::filesystem;

namespace tilecut::core {

namespace {

bool is_existing_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace

std::optional<fs::path> find_sp_counterpart(const fs::path& pc_path) {
    std::optional<fs::path> candidate = sp_counterpart_path(pc_path);
    if (!candidate) {
        return std::nullopt;
    }
    if (is_existing_file(*candidate)) {
        return candidate;
    }
    if (to_lower_copy(candidate->extension().string()) != ".jpg") {
        return std::nullopt;
    }
    fs::path png_candidate = *candidate;
    png_candidate.replace_extension(".png");
    if (is_existing_file(png_candidate)) {
        return png_candidate;
    }
    return std::nullopt;
}

} // namespace tilecut::core
