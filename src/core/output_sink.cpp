#include "output_sink.h"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace tilecut::core {

namespace {

struct ClipboardTool {
    const char* probe;
    const char* command;
};

constexpr std::array<ClipboardTool, 4> k_clipboard_tools = {{
    {"pbcopy", "pbcopy"},
    {"wl-copy", "wl-copy"},
    {"xclip", "xclip -selection clipboard"},
    {"xsel", "xsel --clipboard --input"},
}};

bool tool_available(const char* name) {
    const std::string probe = std::string("command -v ") + name + " >/dev/null 2>&1";
    return std::system(probe.c_str()) == 0;
}

} // namespace

bool write_markup_to_stream(std::ostream& out, const std::string& markup, Error& error) {
    out << markup << "\n";
    out.flush();
    if (!out) {
        return fail(error, ErrorKind::output_error, "Failed to write markup");
    }
    return true;
}

bool write_markup_to_file(const fs::path& path, const std::string& markup, Error& error) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return fail(error, ErrorKind::output_error, "Failed to open markup output: " + path.string());
    }
    file << markup << "\n";
    if (!file) {
        return fail(error, ErrorKind::output_error, "Failed to write markup output: " + path.string());
    }
    return true;
}

bool copy_markup_to_clipboard(const std::string& markup, Error& error) {
    for (const auto& tool : k_clipboard_tools) {
        if (!tool_available(tool.probe)) {
            continue;
        }
        FILE* pipe = popen(tool.command, "w");
        if (pipe == nullptr) {
            return fail(error, ErrorKind::output_error, std::string("Failed to start ") + tool.command);
        }
        const size_t written = std::fwrite(markup.data(), 1, markup.size(), pipe);
        const int status = pclose(pipe);
        if (written != markup.size() || status != 0) {
            return fail(error, ErrorKind::output_error, std::string("Clipboard command failed: ") + tool.command);
        }
        return true;
    }
    return fail(error, ErrorKind::output_error,
                "No clipboard tool found (tried pbcopy, wl-copy, xclip, xsel)");
}

MarkupSink make_markup_sink(const OutputOptions& options) {
    switch (options.target) {
        case OutputTarget::file:
            return [path = options.file_path](const std::string& markup, Error& error) {
                return write_markup_to_file(path, markup, error);
            };
        case OutputTarget::clipboard:
            return [](const std::string& markup, Error& error) {
                return copy_markup_to_clipboard(markup, error);
            };
        case OutputTarget::standard_output:
            break;
    }
    return [](const std::string& markup, Error& error) {
        return write_markup_to_stream(std::cout, markup, error);
    };
}

} // namespace tilecut::core
