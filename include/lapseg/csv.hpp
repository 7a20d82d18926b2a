#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lapseg {

// Tiny CSV helpers shared by the config and recording loaders.
// No quoted fields; rows are split on ',' and each field is trimmed.
std::string trim(std::string s);
std::vector<std::string> split_csv_line(const std::string& line);

// Whole-field numeric parse; nullopt on trailing junk, empty input or non-finite.
std::optional<double> parse_double(const std::string& s);
std::optional<int> parse_int(const std::string& s);
std::optional<bool> parse_bool(const std::string& s);

} // namespace lapseg
