#include "waycodec/number_format.hpp"
#include "waycodec/error.hpp"
#include "waycodec/version.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

namespace waycodec {

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        throw ValidationError(0, "Number must be finite");
    }

    // 1.8e308 in fixed notation is 309 digits plus sign, point and fraction
    std::array<char, 400> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::fixed, MAX_FRACTION_DIGITS);
    if (ec != std::errc{}) {
        throw ValidationError(0, "Number cannot be formatted");
    }

    std::string out(buf.data(), end);
    auto dot = out.find('.');
    if (dot != std::string::npos) {
        auto last = out.find_last_not_of('0');
        out.erase(last == dot ? dot : last + 1);
    }
    if (out == "-0") out = "0";
    return out;
}

std::string format_number(int value) {
    return std::to_string(value);
}

} // namespace waycodec
