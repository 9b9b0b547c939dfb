#pragma once

#include <filesystem>
#include <optional>

namespace tilecut::core {

// Mobile counterpart of a responsive PC image, if one exists on disk.
// A missing `.jpg` counterpart is retried as `.png`.
std::optional<std::filesystem::path> find_sp_counterpart(const std::filesystem::path& pc_path);

} // namespace tilecut::core
