#pragma once

#include <string>
#include <vector>

#include "path_resolver.h"

namespace tilecut::core {

inline constexpr const char* k_default_media_query = "(max-width: 750px)";

std::string escape_xml(const std::string& s);

// `--h` carries half the tile height, for 2x density output.
std::string format_height_hint(int tile_height);

std::string tile_url(const PathSemantics& semantics, const std::string& branch, int index);

// One element per tile, top to bottom, joined by newlines. `tile_heights`
// must hold `tile_count` entries.
std::string generate_markup(int tile_count,
                            const PathSemantics& semantics,
                            const std::vector<int>& tile_heights,
                            const std::string& media_query = k_default_media_query);

} // namespace tilecut::core
