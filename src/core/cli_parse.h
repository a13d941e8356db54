#pragma once

#include <string>
#include <vector>

namespace imgopt::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);
bool parse_non_negative_uint(const std::string& value, unsigned int& out);
bool parse_int(const std::string& token, int& out);
bool parse_bool_value(const std::string& value, bool& out);

// "320, 640,1280" -> {320, 640, 1280}; duplicates are dropped, order is kept.
bool parse_width_list(const std::string& value, std::vector<int>& out);

// Comma separated items, trimmed, empty items rejected.
bool split_list(const std::string& value, std::vector<std::string>& out);

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

} // namespace imgopt::core
