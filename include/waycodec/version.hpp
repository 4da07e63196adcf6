#pragma once
#include <string_view>

namespace waycodec {

constexpr std::string_view LIBRARY_VERSION = "0.1.0";

constexpr char DEFAULT_DELIMITER       = ';';
constexpr char DEFAULT_INNER_DELIMITER = ',';

constexpr int MAX_FRACTION_DIGITS = 6;

} // namespace waycodec
