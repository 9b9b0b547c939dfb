#include "path_resolver.h"

#include <algorithm>
#include <utility>

#include "cli_parse.h"

namespace fs = std::filesystem;

namespace tilecut::core {

namespace {

constexpr size_t k_not_found = static_cast<size_t>(-1);

size_t find_segment(const std::vector<std::string>& segments, const std::string& name, size_t from) {
    for (size_t i = from; i < segments.size(); ++i) {
        if (segments[i] == name) {
            return i;
        }
    }
    return k_not_found;
}

// `pc` only counts below the `images` root.
size_t find_pc_segment(const std::vector<std::string>& segments) {
    const size_t images_index = find_segment(segments, k_images_segment, 0);
    if (images_index == k_not_found) {
        return k_not_found;
    }
    return find_segment(segments, k_pc_segment, images_index + 1);
}

} // namespace

std::vector<std::string> directory_segments(const fs::path& path) {
    std::vector<std::string> segments;
    for (const auto& part : path.parent_path().relative_path()) {
        std::string segment = part.generic_string();
        if (!segment.empty()) {
            segments.push_back(std::move(segment));
        }
    }
    return segments;
}

std::string join_segments(const std::vector<std::string>& segments, size_t begin, size_t end) {
    std::string joined;
    end = std::min(end, segments.size());
    for (size_t i = begin; i < end; ++i) {
        if (!joined.empty()) {
            joined.push_back('/');
        }
        joined += segments[i];
    }
    return joined;
}

OutputExtension output_extension_for(const fs::path& path) {
    return to_lower_copy(path.extension().string()) == ".png" ? OutputExtension::png
                                                               : OutputExtension::jpg;
}

bool resolve_path_semantics(const fs::path& path, PathSemantics& out, Error& error) {
    if (!path.has_filename()) {
        return fail(error, ErrorKind::invalid_path_kind,
                    "Path does not name an image file: " + path.string());
    }
    const std::vector<std::string> segments = directory_segments(path);
    const size_t images_index = find_segment(segments, k_images_segment, 0);
    if (images_index == k_not_found) {
        return fail(error, ErrorKind::invalid_path_kind,
                    "Path has no '" + std::string(k_images_segment) + "' directory: " + path.string());
    }
    const size_t pc_index = find_segment(segments, k_pc_segment, images_index + 1);

    PathSemantics semantics;
    semantics.is_responsive = pc_index != k_not_found;
    if (semantics.is_responsive) {
        semantics.relative_base_path = "./" + join_segments(segments, images_index, pc_index);
        semantics.sub_directory = join_segments(segments, pc_index + 1, segments.size());
    } else {
        semantics.relative_base_path = "./" + segments[images_index];
        semantics.sub_directory = join_segments(segments, images_index + 1, segments.size());
    }

    // Only directories name the wrapper: images/banner.png has no class, not
    // class="banner.png".
    const size_t class_index = images_index + 1;
    if (class_index < segments.size()) {
        if (segments[class_index] != k_pc_segment) {
            semantics.wrapper_class = segments[class_index];
        } else if (class_index + 1 < segments.size()) {
            semantics.wrapper_class = segments[class_index + 1];
        }
    }

    semantics.is_first_view = std::ranges::any_of(segments, [](const std::string& segment) {
        return segment == "fv" || segment == "FV";
    });
    semantics.output_extension = output_extension_for(path);

    out = std::move(semantics);
    return true;
}

std::optional<fs::path> sp_counterpart_path(const fs::path& pc_path) {
    const size_t pc_index = find_pc_segment(directory_segments(pc_path));
    if (pc_index == k_not_found) {
        return std::nullopt;
    }

    fs::path result = pc_path.root_path();
    size_t index = 0;
    for (const auto& part : pc_path.parent_path().relative_path()) {
        if (part.empty()) {
            continue;
        }
        result /= (index == pc_index) ? fs::path(k_sp_segment) : part;
        ++index;
    }
    result /= pc_path.filename();
    return result;
}

} // namespace tilecut::core
