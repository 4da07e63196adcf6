#pragma once
#include <string>

namespace waycodec {

/// Canonical wire text for a number: fixed notation, at most six fractional
/// digits, no trailing zeros, no dangling '.', '.' as separator regardless of
/// the host locale. Throws ValidationError for NaN and infinities.
[[nodiscard]] std::string format_number(double value);

[[nodiscard]] std::string format_number(int value);

} // namespace waycodec
