#pragma once
#include "types.hpp"
#include "version.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace waycodec {

/// Whether absent positions at the end of a sequence are rendered.
enum class TrailingAbsences { Keep, Trim };

/// Joins positional sequences into single query-parameter values.
///
/// Absent positions render as empty text between delimiters. The field
/// wrappers check every present value in positional order and throw on the
/// first violation (MalformedElementError or ValidationError), so a failed
/// call never produces output.
class ListFormatter {
public:
    /// to_token turns a present T into its wire text.
    template <typename T, typename F>
    [[nodiscard]] static std::string join(const Sequence<T>& tokens, char delimiter,
                                          F to_token, TrailingAbsences trailing);

    /// Unset sequence in, unset string out.
    template <typename T, typename F>
    [[nodiscard]] static std::optional<std::string> join(const std::optional<Sequence<T>>& tokens,
                                                         char delimiter, F to_token,
                                                         TrailingAbsences trailing);

    // ---- Field wrappers ----

    /// "angle,tolerance;..." with both values in [0, 360]. A bearing with an
    /// absent component is rendered as an absent position.
    [[nodiscard]] static std::optional<std::string> format_bearings(
        const std::optional<Sequence<Bearing>>& bearings);

    /// "pickup,dropoff;...". An empty list is unset; an empty pair is absent.
    [[nodiscard]] static std::optional<std::string> format_distributions(
        const std::optional<Sequence<Distribution>>& distributions);

    /// Only "unrestricted" and "curb" are accepted.
    [[nodiscard]] static std::optional<std::string> format_approaches(
        const std::optional<Sequence<std::string>>& approaches);

    /// "unlimited" or a non-negative number; tokens pass through unchanged.
    [[nodiscard]] static std::optional<std::string> format_radiuses(
        const std::optional<Sequence<std::string>>& radiuses);

    /// An empty list is treated as unset.
    [[nodiscard]] static std::optional<std::string> format_waypoint_names(
        const std::optional<Sequence<std::string>>& names);

    /// Comma separated.
    [[nodiscard]] static std::optional<std::string> format_annotations(
        const std::optional<Sequence<std::string>>& annotations);

    [[nodiscard]] static std::optional<std::string> format_waypoint_indices(
        const std::optional<Sequence<int>>& indices);

    [[nodiscard]] static std::optional<std::string> format_snapping_include_closures(
        const std::optional<Sequence<bool>>& closures);

    [[nodiscard]] static std::optional<std::string> format_layers(
        const std::optional<Sequence<int>>& layers);

    [[nodiscard]] static std::optional<std::string> format_doubles(
        const std::optional<Sequence<double>>& values, char delimiter = DEFAULT_DELIMITER);

    /// Every coordinate is present; there is no absent position here.
    [[nodiscard]] static std::string format_coordinates(const std::vector<Point>& coordinates);

    [[nodiscard]] static std::optional<std::string> format_waypoint_targets(
        const std::optional<Sequence<Point>>& targets);

    /// Criteria lists (exclude, include, payment methods...) joined by their
    /// wire names. E needs a to_string(E) overload.
    template <typename E>
    [[nodiscard]] static std::optional<std::string> format_criteria(
        const std::optional<Sequence<E>>& values, char delimiter = DEFAULT_INNER_DELIMITER);

    // ---- Elements ----

    [[nodiscard]] static std::string format_point(const Point& point,
                                                  char inner_delimiter = DEFAULT_INNER_DELIMITER);

    [[nodiscard]] static std::string format_boolean(bool value);
};

template <typename T, typename F>
std::string ListFormatter::join(const Sequence<T>& tokens, char delimiter, F to_token,
                                TrailingAbsences trailing) {
    std::size_t end = tokens.size();
    if (trailing == TrailingAbsences::Trim) {
        while (end > 0 && !tokens[end - 1].has_value()) --end;
    }

    std::string out;
    for (std::size_t i = 0; i < end; ++i) {
        if (i > 0) out += delimiter;
        if (tokens[i]) out += to_token(*tokens[i]);
    }
    return out;
}

template <typename T, typename F>
std::optional<std::string> ListFormatter::join(const std::optional<Sequence<T>>& tokens,
                                               char delimiter, F to_token,
                                               TrailingAbsences trailing) {
    if (!tokens) return std::nullopt;
    return join(*tokens, delimiter, to_token, trailing);
}

template <typename E>
std::optional<std::string> ListFormatter::format_criteria(const std::optional<Sequence<E>>& values,
                                                          char delimiter) {
    return join(values, delimiter, [](E v) { return to_string(v); }, TrailingAbsences::Keep);
}

} // namespace waycodec
