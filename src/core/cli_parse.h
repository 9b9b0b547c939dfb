#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tilecut::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_double(const std::string& token, double& out);
bool parse_positive_double(const std::string& token, double& out);

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error);

std::string to_lower_copy(std::string value);

} // namespace tilecut::core
