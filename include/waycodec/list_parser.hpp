#pragma once
#include "error.hpp"
#include "types.hpp"
#include "version.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waycodec {

/// Reads delimiter-separated wire values back into positional sequences.
///
/// An unset input yields an unset result, an empty input yields an empty
/// sequence, and every empty token between delimiters yields an absent
/// position. A token that fails to convert fails the whole call with
/// MalformedElementError; nothing partial is returned.
class ListParser {
public:
    /// Split on every occurrence of delimiter. Leading, trailing and
    /// consecutive delimiters produce empty tokens.
    [[nodiscard]] static std::vector<std::string_view> tokenize(std::string_view input,
                                                                char delimiter);

    /// Generic split-then-map. element_parser receives each non-empty token
    /// and returns a T; it may throw MalformedElementError,
    /// std::invalid_argument or std::out_of_range.
    template <typename T, typename F>
    [[nodiscard]] static std::optional<Sequence<T>> parse(std::optional<std::string_view> input,
                                                          char delimiter,
                                                          F element_parser);

    [[nodiscard]] static std::optional<Sequence<int>> parse_integers(
        std::optional<std::string_view> input, char delimiter = DEFAULT_DELIMITER);

    [[nodiscard]] static std::optional<Sequence<double>> parse_doubles(
        std::optional<std::string_view> input, char delimiter = DEFAULT_DELIMITER);

    [[nodiscard]] static std::optional<Sequence<std::string>> parse_strings(
        std::optional<std::string_view> input, char delimiter = DEFAULT_DELIMITER);

    /// Each token is "longitude<inner>latitude".
    [[nodiscard]] static std::optional<Sequence<Point>> parse_points(
        std::optional<std::string_view> input, char delimiter = DEFAULT_DELIMITER,
        char inner_delimiter = DEFAULT_INNER_DELIMITER);

    [[nodiscard]] static std::optional<Sequence<bool>> parse_booleans(
        std::optional<std::string_view> input, char delimiter = DEFAULT_DELIMITER);

    /// Each token is a list of numbers, e.g. "5.1,7.4;;3,4".
    [[nodiscard]] static std::optional<Sequence<std::vector<double>>> parse_double_lists(
        std::optional<std::string_view> input, char delimiter = DEFAULT_DELIMITER,
        char inner_delimiter = DEFAULT_INNER_DELIMITER);

    /// Text tokens mapped through value_map (e.g. annotation_from_string).
    template <typename E, typename Map>
    [[nodiscard]] static std::optional<Sequence<E>> parse_strings_as(
        std::optional<std::string_view> input, char delimiter, Map value_map);

    // ---- Single elements ----

    /// Base 10, optional leading sign, no grouping, must fit in int.
    [[nodiscard]] static int parse_integer(std::string_view token);

    /// Decimal or exponential form, optional leading sign, finite only.
    [[nodiscard]] static double parse_double(std::string_view token);

    /// Exactly "true" or "false".
    [[nodiscard]] static bool parse_boolean(std::string_view token);

    [[nodiscard]] static Point parse_point(std::string_view token,
                                           char inner_delimiter = DEFAULT_INNER_DELIMITER);

    [[nodiscard]] static std::vector<double> parse_double_list(
        std::string_view token, char inner_delimiter = DEFAULT_INNER_DELIMITER);
};

template <typename T, typename F>
std::optional<Sequence<T>> ListParser::parse(std::optional<std::string_view> input,
                                             char delimiter,
                                             F element_parser) {
    if (!input) return std::nullopt;

    Sequence<T> result;
    if (input->empty()) return result;

    auto tokens = tokenize(*input, delimiter);
    result.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].empty()) {
            result.emplace_back(std::nullopt);
            continue;
        }
        try {
            result.emplace_back(element_parser(tokens[i]));
        } catch (const MalformedElementError& e) {
            throw MalformedElementError(i, e.what());
        } catch (const std::invalid_argument& e) {
            throw MalformedElementError(i, e.what());
        } catch (const std::out_of_range& e) {
            throw MalformedElementError(i, e.what());
        }
    }
    return result;
}

template <typename E, typename Map>
std::optional<Sequence<E>> ListParser::parse_strings_as(std::optional<std::string_view> input,
                                                        char delimiter,
                                                        Map value_map) {
    return parse<E>(input, delimiter, [&value_map](std::string_view token) {
        return value_map(std::string(token));
    });
}

} // namespace waycodec
