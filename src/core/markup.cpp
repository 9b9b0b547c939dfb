#include "markup.h"

#include <iomanip>
#include <sstream>

namespace tilecut::core {

namespace {

constexpr size_t k_string_growth_padding = 8;

std::string picture_tag(const PathSemantics& semantics, int index, int height,
                        const std::string& media_query) {
    std::ostringstream oss;
    oss << "<picture style=\"--h: " << format_height_hint(height) << ";\">\n"
        << "  <source srcset=\"" << escape_xml(tile_url(semantics, k_sp_segment, index))
        << "\" media=\"" << escape_xml(media_query) << "\" />\n"
        << "  <img src=\"" << escape_xml(tile_url(semantics, k_pc_segment, index))
        << "\" alt=\"\" />\n"
        << "</picture>";
    return oss.str();
}

std::string img_tag(const PathSemantics& semantics, int index, int height) {
    std::ostringstream oss;
    oss << "<img src=\"" << escape_xml(tile_url(semantics, "", index))
        << "\" style=\"--h: " << format_height_hint(height) << ";\" alt=\"\" />";
    return oss.str();
}

} // namespace

std::string escape_xml(const std::string& s) {
    std::string out;
    out.reserve(s.size() + k_string_growth_padding);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string format_height_hint(int tile_height) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (static_cast<double>(tile_height) / 2.0);
    return oss.str();
}

std::string tile_url(const PathSemantics& semantics, const std::string& branch, int index) {
    std::string url = semantics.relative_base_path;
    if (!branch.empty()) {
        url += "/" + branch;
    }
    if (!semantics.sub_directory.empty()) {
        url += "/" + semantics.sub_directory;
    }
    url += "/" + std::to_string(index) + "." + extension_name(semantics.output_extension);
    return url;
}

std::string generate_markup(int tile_count,
                            const PathSemantics& semantics,
                            const std::vector<int>& tile_heights,
                            const std::string& media_query) {
    std::vector<std::string> tags;
    tags.reserve(static_cast<size_t>(tile_count) + 2);

    if (semantics.wrapper_class) {
        tags.push_back("<div class=\"" + escape_xml(*semantics.wrapper_class) + "\">");
    }
    for (int i = 1; i <= tile_count; ++i) {
        const int height = tile_heights.at(static_cast<size_t>(i - 1));
        if (semantics.is_responsive) {
            tags.push_back(picture_tag(semantics, i, height, media_query));
        } else {
            tags.push_back(img_tag(semantics, i, height));
        }
    }
    if (semantics.wrapper_class) {
        tags.emplace_back("</div>");
    }

    std::string markup;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) {
            markup.push_back('\n');
        }
        markup += tags[i];
    }
    return markup;
}

} // namespace tilecut::core
