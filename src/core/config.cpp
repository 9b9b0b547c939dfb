#include "config.h"

#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

#include "cli_parse.h"

namespace fs = std::filesystem;

namespace tilecut::core {

namespace {

enum class JsonValueKind {
    string,
    number,
    literal,
    nested
};

struct JsonValue {
    JsonValueKind kind = JsonValueKind::literal;
    std::string text;
};

bool read_text_file(const fs::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Config file not found: " + path.string();
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        error = "Failed to read config file: " + path.string();
        return false;
    }
    out = buffer.str();
    return true;
}

void skip_whitespace(const std::string& text, size_t& pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
}

// Skips a nested object or array, honoring quoted strings.
bool skip_nested(const std::string& text, size_t& pos, std::string& error) {
    int depth = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '"') {
            std::string ignored;
            if (!parse_quoted(text, pos, ignored, error)) {
                return false;
            }
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
            if (depth == 0) {
                ++pos;
                return true;
            }
        }
        ++pos;
    }
    error = "unterminated nested value";
    return false;
}

bool parse_value(const std::string& text, size_t& pos, JsonValue& out, std::string& error) {
    if (pos >= text.size()) {
        error = "missing value";
        return false;
    }
    const char c = text[pos];
    if (c == '"') {
        out.kind = JsonValueKind::string;
        return parse_quoted(text, pos, out.text, error);
    }
    if (c == '{' || c == '[') {
        const size_t start = pos;
        if (!skip_nested(text, pos, error)) {
            return false;
        }
        out.kind = JsonValueKind::nested;
        out.text = text.substr(start, pos - start);
        return true;
    }

    const size_t start = pos;
    while (pos < text.size() && text[pos] != ',' && text[pos] != '}'
           && std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
        ++pos;
    }
    out.text = text.substr(start, pos - start);
    if (out.text == "null" || out.text == "true" || out.text == "false") {
        out.kind = JsonValueKind::literal;
        return true;
    }
    double ignored = 0.0;
    if (!parse_double(out.text, ignored)) {
        error = "invalid value '" + out.text + "'";
        return false;
    }
    out.kind = JsonValueKind::number;
    return true;
}

bool is_null(const JsonValue& value) {
    return value.kind == JsonValueKind::literal && value.text == "null";
}

bool assign_int(const std::string& key, const JsonValue& value, std::optional<int>& out, std::string& error) {
    if (is_null(value)) {
        out.reset();
        return true;
    }
    int parsed = 0;
    if (value.kind != JsonValueKind::number || !parse_positive_int(value.text, parsed)) {
        error = "'" + key + "' must be a positive integer";
        return false;
    }
    out = parsed;
    return true;
}

bool assign_double(const std::string& key, const JsonValue& value, std::optional<double>& out, std::string& error) {
    if (is_null(value)) {
        out.reset();
        return true;
    }
    double parsed = 0.0;
    if (value.kind != JsonValueKind::number || !parse_positive_double(value.text, parsed)) {
        error = "'" + key + "' must be a positive number";
        return false;
    }
    out = parsed;
    return true;
}

bool assign_string(const std::string& key, const JsonValue& value, std::optional<std::string>& out, std::string& error) {
    if (is_null(value)) {
        out.reset();
        return true;
    }
    if (value.kind != JsonValueKind::string) {
        error = "'" + key + "' must be a string";
        return false;
    }
    out = value.text;
    return true;
}

bool assign_field(const std::string& key, const JsonValue& value, ConfigValues& values, std::string& error) {
    if (key == "width") {
        return assign_int(key, value, values.width, error);
    }
    if (key == "scale") {
        return assign_double(key, value, values.scale, error);
    }
    if (key == "sp_width") {
        return assign_int(key, value, values.sp_width, error);
    }
    if (key == "sp_scale") {
        return assign_double(key, value, values.sp_scale, error);
    }
    if (key == "media") {
        return assign_string(key, value, values.media, error);
    }
    return true;
}

template <typename T>
std::optional<T> prefer(const std::optional<T>& primary, const std::optional<T>& fallback) {
    return primary ? primary : fallback;
}

} // namespace

bool parse_config_json(const std::string& text, ConfigValues& out, std::string& error) {
    size_t pos = 0;
    skip_whitespace(text, pos);
    if (pos >= text.size() || text[pos] != '{') {
        error = "expected a JSON object";
        return false;
    }
    ++pos;

    ConfigValues values;
    skip_whitespace(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        ++pos;
    } else {
        while (true) {
            skip_whitespace(text, pos);
            std::string key;
            if (!parse_quoted(text, pos, key, error)) {
                return false;
            }
            skip_whitespace(text, pos);
            if (pos >= text.size() || text[pos] != ':') {
                error = "expected ':' after key '" + key + "'";
                return false;
            }
            ++pos;
            skip_whitespace(text, pos);
            JsonValue value;
            if (!parse_value(text, pos, value, error)) {
                return false;
            }
            if (!assign_field(key, value, values, error)) {
                return false;
            }
            skip_whitespace(text, pos);
            if (pos < text.size() && text[pos] == ',') {
                ++pos;
                continue;
            }
            if (pos < text.size() && text[pos] == '}') {
                ++pos;
                break;
            }
            error = "expected ',' or '}'";
            return false;
        }
    }

    skip_whitespace(text, pos);
    if (pos != text.size()) {
        error = "unexpected trailing content";
        return false;
    }
    out = std::move(values);
    return true;
}

ConfigValues load_config_file(const fs::path& path, std::string& warning) {
    std::string text;
    std::string error;
    if (!read_text_file(path, text, error)) {
        warning = error;
        return {};
    }
    ConfigValues values;
    if (!parse_config_json(text, values, error)) {
        warning = "Invalid config file " + path.string() + ": " + error;
        return {};
    }
    return values;
}

bool make_resize_spec(const std::optional<int>& width,
                      const std::optional<double>& scale,
                      const std::string& width_key,
                      const std::string& scale_key,
                      ResizeSpec& out,
                      Error& error) {
    if (width && scale) {
        return fail(error, ErrorKind::config_conflict,
                    "'" + width_key + "' and '" + scale_key + "' cannot be used together");
    }
    if (width) {
        out = TargetWidth{*width};
    } else {
        out = ScaleFactor{scale.value_or(k_default_scale)};
    }
    return true;
}

bool merge_config(const fs::path& pc_image_path,
                  const ConfigValues& cli,
                  const ConfigValues& file,
                  SplitConfig& out,
                  Error& error) {
    SplitConfig config;
    config.pc_image_path = pc_image_path;
    if (!make_resize_spec(prefer(file.width, cli.width), prefer(file.scale, cli.scale),
                          "width", "scale", config.pc_resize, error)) {
        return false;
    }
    if (!make_resize_spec(prefer(file.sp_width, cli.sp_width), prefer(file.sp_scale, cli.sp_scale),
                          "sp_width", "sp_scale", config.sp_resize, error)) {
        return false;
    }
    config.media_query = prefer(file.media, cli.media).value_or(k_default_media_query);
    out = std::move(config);
    return true;
}

} // namespace tilecut::core
