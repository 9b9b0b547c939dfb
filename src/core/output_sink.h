#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>

#include "errors.h"

namespace tilecut::core {

enum class OutputTarget {
    standard_output,
    file,
    clipboard
};

struct OutputOptions {
    OutputTarget target = OutputTarget::standard_output;
    std::filesystem::path file_path;
};

// Receives the finished markup fragment.
using MarkupSink = std::function<bool(const std::string& markup, Error& error)>;

bool write_markup_to_stream(std::ostream& out, const std::string& markup, Error& error);
bool write_markup_to_file(const std::filesystem::path& path, const std::string& markup, Error& error);

// Pipes the markup into the first clipboard tool found on PATH.
bool copy_markup_to_clipboard(const std::string& markup, Error& error);

MarkupSink make_markup_sink(const OutputOptions& options);

} // namespace tilecut::core
