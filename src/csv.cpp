#include <lapseg/csv.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace lapseg {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

std::optional<double> parse_double(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty()) return std::nullopt;
  try {
    size_t idx = 0;
    const double v = std::stod(t, &idx);
    if (idx != t.size() || !std::isfinite(v)) return std::nullopt;
    return v;
  } catch (const std::logic_error&) {
    // invalid_argument / out_of_range
    return std::nullopt;
  }
}

std::optional<int> parse_int(const std::string& s) {
  const auto v = parse_double(s);
  if (!v) return std::nullopt;
  const double r = std::round(*v);
  if (r < -2147483648.0 || r > 2147483647.0) return std::nullopt;
  return static_cast<int>(r);
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string t = trim(s);
  for (auto& c : t) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (t == "1" || t == "true" || t == "yes" || t == "on")  return true;
  if (t == "0" || t == "false" || t == "no" || t == "off") return false;
  return std::nullopt;
}

} // namespace lapseg
