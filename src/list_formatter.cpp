#include "waycodec/list_formatter.hpp"
#include "waycodec/criteria.hpp"
#include "waycodec/error.hpp"
#include "waycodec/list_parser.hpp"
#include "waycodec/log.hpp"
#include "waycodec/number_format.hpp"
#include <cmath>

namespace waycodec {

namespace {

constexpr const char* LOGGER = "waycodec.formatter";
constexpr std::string_view UNLIMITED_RADIUS = "unlimited";

std::string describe(const char* field, std::size_t position, const std::string& msg) {
    return std::string(field) + "[" + std::to_string(position) + "]: " + msg;
}

[[noreturn]] void reject(const char* field, std::size_t position, const std::string& msg) {
    log(LogLevel::Warning, LOGGER, describe(field, position, msg));
    throw ValidationError(position, msg);
}

[[noreturn]] void reject_malformed(const char* field, std::size_t position, const std::string& msg) {
    log(LogLevel::Warning, LOGGER, describe(field, position, msg));
    throw MalformedElementError(position, msg);
}

std::string number_at(double value, const char* field, std::size_t position) {
    if (!std::isfinite(value)) reject(field, position, "Number must be finite");
    return format_number(value);
}

std::string point_at(const Point& point, const char* field, std::size_t position) {
    return number_at(point.longitude, field, position) + DEFAULT_INNER_DELIMITER
         + number_at(point.latitude, field, position);
}

// Map every present value to its wire text; render gets the value and its index.
template <typename T, typename F>
Sequence<std::string> render_each(const Sequence<T>& values, F render) {
    Sequence<std::string> out;
    out.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i]) {
            out.emplace_back(render(*values[i], i));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return out;
}

std::string pass_through(const std::string& token) {
    return token;
}

} // anonymous namespace

std::string ListFormatter::format_point(const Point& point, char inner_delimiter) {
    return format_number(point.longitude) + inner_delimiter + format_number(point.latitude);
}

std::string ListFormatter::format_boolean(bool value) {
    return value ? "true" : "false";
}

std::optional<std::string> ListFormatter::format_bearings(
    const std::optional<Sequence<Bearing>>& bearings) {
    if (!bearings) return std::nullopt;

    Sequence<std::string> rendered;
    rendered.reserve(bearings->size());
    for (std::size_t i = 0; i < bearings->size(); ++i) {
        const auto& bearing = (*bearings)[i];
        if (!bearing) {
            rendered.emplace_back(std::nullopt);
            continue;
        }
        if (bearing->size() != 2) {
            reject_malformed("bearings", i, "Bearing size should be 2");
        }

        const auto& angle = (*bearing)[0];
        const auto& tolerance = (*bearing)[1];
        if (!angle || !tolerance) {
            rendered.emplace_back(std::nullopt);
            continue;
        }
        // Negated so that NaN fails too
        if (!(*angle >= 0 && *angle <= 360 && *tolerance >= 0 && *tolerance <= 360)) {
            reject("bearings", i, "Angle and tolerance have to be from 0 to 360");
        }
        rendered.emplace_back(format_number(*angle) + DEFAULT_INNER_DELIMITER
                              + format_number(*tolerance));
    }
    return join(rendered, DEFAULT_DELIMITER, pass_through, TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_distributions(
    const std::optional<Sequence<Distribution>>& distributions) {
    if (!distributions || distributions->empty()) return std::nullopt;

    Sequence<std::string> rendered;
    rendered.reserve(distributions->size());
    for (std::size_t i = 0; i < distributions->size(); ++i) {
        const auto& pair = (*distributions)[i];
        if (!pair || pair->empty()) {
            rendered.emplace_back(std::nullopt);
            continue;
        }
        if (pair->size() < 2) {
            reject_malformed("distributions", i, "Distribution needs a pickup and a drop-off index");
        }
        // Elements past the second are not part of the wire format
        rendered.emplace_back(format_number((*pair)[0]) + DEFAULT_INNER_DELIMITER
                              + format_number((*pair)[1]));
    }
    return join(rendered, DEFAULT_DELIMITER, pass_through, TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_approaches(
    const std::optional<Sequence<std::string>>& approaches) {
    if (!approaches) return std::nullopt;

    for (std::size_t i = 0; i < approaches->size(); ++i) {
        const auto& approach = (*approaches)[i];
        if (approach && !is_valid_approach(*approach)) {
            reject("approaches", i, "Approach should be one of unrestricted or curb");
        }
    }
    return join(approaches, DEFAULT_DELIMITER, pass_through, TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_radiuses(
    const std::optional<Sequence<std::string>>& radiuses) {
    if (!radiuses) return std::nullopt;

    for (std::size_t i = 0; i < radiuses->size(); ++i) {
        const auto& radius = (*radiuses)[i];
        if (!radius || *radius == UNLIMITED_RADIUS) continue;

        double value = 0.0;
        try {
            value = ListParser::parse_double(*radius);
        } catch (const MalformedElementError& e) {
            reject_malformed("radiuses", i, e.what());
        }
        if (value < 0) {
            reject("radiuses", i, "Radiuses need to be greater than 0 or a string \"unlimited\"");
        }
    }
    return join(radiuses, DEFAULT_DELIMITER, pass_through, TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_waypoint_names(
    const std::optional<Sequence<std::string>>& names) {
    if (!names || names->empty()) return std::nullopt;
    return join(*names, DEFAULT_DELIMITER, pass_through, TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_annotations(
    const std::optional<Sequence<std::string>>& annotations) {
    return join(annotations, DEFAULT_INNER_DELIMITER, pass_through, TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_waypoint_indices(
    const std::optional<Sequence<int>>& indices) {
    return join(indices, DEFAULT_DELIMITER, [](int v) { return format_number(v); },
                TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_snapping_include_closures(
    const std::optional<Sequence<bool>>& closures) {
    return join(closures, DEFAULT_DELIMITER, &ListFormatter::format_boolean,
                TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_layers(const std::optional<Sequence<int>>& layers) {
    return join(layers, DEFAULT_DELIMITER, [](int v) { return format_number(v); },
                TrailingAbsences::Keep);
}

std::optional<std::string> ListFormatter::format_doubles(
    const std::optional<Sequence<double>>& values, char delimiter) {
    if (!values) return std::nullopt;
    auto rendered = render_each(*values, [](double v, std::size_t i) {
        return number_at(v, "numbers", i);
    });
    return join(rendered, delimiter, pass_through, TrailingAbsences::Keep);
}

std::string ListFormatter::format_coordinates(const std::vector<Point>& coordinates) {
    std::string out;
    for (std::size_t i = 0; i < coordinates.size(); ++i) {
        if (i > 0) out += DEFAULT_DELIMITER;
        out += point_at(coordinates[i], "coordinates", i);
    }
    return out;
}

std::optional<std::string> ListFormatter::format_waypoint_targets(
    const std::optional<Sequence<Point>>& targets) {
    if (!targets) return std::nullopt;
    auto rendered = render_each(*targets, [](const Point& p, std::size_t i) {
        return point_at(p, "waypoint_targets", i);
    });
    return join(rendered, DEFAULT_DELIMITER, pass_through, TrailingAbsences::Keep);
}

} // namespace waycodec
