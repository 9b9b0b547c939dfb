#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "errors.h"
#include "geometry.h"

namespace tilecut::core {

inline constexpr const char* k_images_segment = "images";
inline constexpr const char* k_pc_segment = "pc";
inline constexpr const char* k_sp_segment = "sp";

// Markup and output-layout facts derived from where a PC image lives:
//
//   <anything>/images/<class>/pc/<sub...>/<file>   responsive, pc/ and sp/ branches
//   <anything>/images/pc/<class>/<sub...>/<file>   responsive, class taken after pc
//   <anything>/images/<sub...>/<file>              single image
struct PathSemantics {
    std::optional<std::string> wrapper_class;
    bool is_first_view = false;
    bool is_responsive = false;
    std::string relative_base_path;
    std::string sub_directory;
    OutputExtension output_extension = OutputExtension::jpg;
};

// Directory components of `path`, excluding the root and the filename.
std::vector<std::string> directory_segments(const std::filesystem::path& path);

std::string join_segments(const std::vector<std::string>& segments, size_t begin, size_t end);

OutputExtension output_extension_for(const std::filesystem::path& path);

bool resolve_path_semantics(const std::filesystem::path& path, PathSemantics& out, Error& error);

// Same path with the responsive `pc` directory swapped for `sp`.
std::optional<std::filesystem::path> sp_counterpart_path(const std::filesystem::path& pc_path);

} // namespace tilecut::core
