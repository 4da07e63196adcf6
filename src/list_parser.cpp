#include "waycodec/list_parser.hpp"
#include "waycodec/error.hpp"
#include <charconv>
#include <cmath>
#include <system_error>

namespace waycodec {

namespace {

// from_chars rejects a leading '+'. Strip it, but never in front of another sign.
bool strip_plus(std::string_view& token) {
    if (token.empty() || token.front() != '+') return true;
    token.remove_prefix(1);
    return !token.empty() && token.front() != '-' && token.front() != '+';
}

// from_chars reports both overflow and underflow as result_out_of_range. The
// number underflowed when its decimal magnitude (digits before the point of
// 0.ddd x 10^m, plus the exponent) is not positive.
bool is_underflow(std::string_view s) {
    if (!s.empty() && s.front() == '-') s.remove_prefix(1);

    long long magnitude = 0;
    bool significant = false;
    bool after_point = false;
    std::size_t i = 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c == '.') {
            after_point = true;
            continue;
        }
        if (c < '0' || c > '9') break;
        if (!significant && c != '0') significant = true;
        if (significant && !after_point) ++magnitude;
        if (!significant && after_point) --magnitude;
    }

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        std::string_view exponent = s.substr(i + 1);
        bool negative = !exponent.empty() && exponent.front() == '-';
        if (!exponent.empty() && exponent.front() == '+') exponent.remove_prefix(1);
        long long e = 0;
        auto [ptr, ec] = std::from_chars(exponent.data(), exponent.data() + exponent.size(), e);
        if (ec == std::errc::result_out_of_range) return negative;
        if (ec != std::errc{}) return false;
        magnitude += e;
    }
    return magnitude <= 0;
}

std::string quoted(std::string_view token) {
    return "'" + std::string(token) + "'";
}

} // anonymous namespace

std::vector<std::string_view> ListParser::tokenize(std::string_view input, char delimiter) {
    std::vector<std::string_view> tokens;
    std::size_t start = 0;
    while (true) {
        auto pos = input.find(delimiter, start);
        if (pos == std::string_view::npos) {
            tokens.push_back(input.substr(start));
            break;
        }
        tokens.push_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

int ListParser::parse_integer(std::string_view token) {
    std::string_view digits = token;
    if (!strip_plus(digits) || digits.empty()) {
        throw MalformedElementError(0, "Expected integer, got " + quoted(token));
    }

    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw MalformedElementError(0, "Integer out of range: " + quoted(token));
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw MalformedElementError(0, "Expected integer, got " + quoted(token));
    }
    return value;
}

double ListParser::parse_double(std::string_view token) {
    std::string_view digits = token;
    if (!strip_plus(digits) || digits.empty()) {
        throw MalformedElementError(0, "Expected number, got " + quoted(token));
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value,
                                     std::chars_format::general);
    bool consumed = ptr == digits.data() + digits.size();
    if (ec == std::errc::result_out_of_range) {
        if (consumed && is_underflow(digits)) {
            return digits.front() == '-' ? -0.0 : 0.0;
        }
        throw MalformedElementError(0, "Number out of range: " + quoted(token));
    }
    if (ec != std::errc{} || !consumed || !std::isfinite(value)) {
        throw MalformedElementError(0, "Expected number, got " + quoted(token));
    }
    return value;
}

bool ListParser::parse_boolean(std::string_view token) {
    if (token == "true") return true;
    if (token == "false") return false;
    throw MalformedElementError(0, "Expected 'true' or 'false', got " + quoted(token));
}

Point ListParser::parse_point(std::string_view token, char inner_delimiter) {
    auto fields = tokenize(token, inner_delimiter);
    if (fields.size() != 2) {
        throw MalformedElementError(0, "Point needs exactly longitude and latitude, got "
                                           + quoted(token));
    }
    return Point::from_lng_lat(parse_double(fields[0]), parse_double(fields[1]));
}

std::vector<double> ListParser::parse_double_list(std::string_view token, char inner_delimiter) {
    std::vector<double> values;
    for (auto field : tokenize(token, inner_delimiter)) {
        values.push_back(parse_double(field));
    }
    return values;
}

std::optional<Sequence<int>> ListParser::parse_integers(std::optional<std::string_view> input,
                                                        char delimiter) {
    return parse<int>(input, delimiter, &ListParser::parse_integer);
}

std::optional<Sequence<double>> ListParser::parse_doubles(std::optional<std::string_view> input,
                                                          char delimiter) {
    return parse<double>(input, delimiter, &ListParser::parse_double);
}

std::optional<Sequence<std::string>> ListParser::parse_strings(
    std::optional<std::string_view> input, char delimiter) {
    return parse<std::string>(input, delimiter,
                              [](std::string_view token) { return std::string(token); });
}

std::optional<Sequence<Point>> ListParser::parse_points(std::optional<std::string_view> input,
                                                        char delimiter, char inner_delimiter) {
    if (delimiter == inner_delimiter) {
        throw std::invalid_argument("Outer and inner delimiters must differ");
    }
    return parse<Point>(input, delimiter, [inner_delimiter](std::string_view token) {
        return parse_point(token, inner_delimiter);
    });
}

std::optional<Sequence<bool>> ListParser::parse_booleans(std::optional<std::string_view> input,
                                                         char delimiter) {
    return parse<bool>(input, delimiter, &ListParser::parse_boolean);
}

std::optional<Sequence<std::vector<double>>> ListParser::parse_double_lists(
    std::optional<std::string_view> input, char delimiter, char inner_delimiter) {
    if (delimiter == inner_delimiter) {
        throw std::invalid_argument("Outer and inner delimiters must differ");
    }
    return parse<std::vector<double>>(input, delimiter, [inner_delimiter](std::string_view token) {
        return parse_double_list(token, inner_delimiter);
    });
}

} // namespace waycodec
