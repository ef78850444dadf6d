#include "document_model.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::string cellToString(const CellValue& value) {
  if (const auto* s = std::get_if<std::string>(&value)) return *s;
  if (const auto* i = std::get_if<long long>(&value)) return std::to_string(*i);
  double d = std::get<double>(value);
  if (std::isnan(d)) return "";
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", d);
  std::string out(buf);
  // Keep floats recognizable as floats: 3 -> 3.0
  if (out.find_first_of(".eEn") == std::string::npos) out += ".0";
  return out;
}

bool isNumericCell(const CellValue& value) {
  return !std::holds_alternative<std::string>(value);
}

size_t gridColumnCount(const Grid& grid) {
  size_t cols = 0;
  for (const auto& row : grid) cols = std::max(cols, row.size());
  return cols;
}
