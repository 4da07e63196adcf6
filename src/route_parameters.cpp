#include "waycodec/route_parameters.hpp"
#include "waycodec/error.hpp"
#include "waycodec/list_formatter.hpp"
#include "waycodec/list_parser.hpp"
#include "waycodec/log.hpp"
#include <simdjson.h>
#include <utility>

namespace waycodec {

namespace {

template <typename E>
std::optional<Sequence<std::string>> names_of(const std::optional<Sequence<E>>& values) {
    if (!values) return std::nullopt;
    Sequence<std::string> names;
    names.reserve(values->size());
    for (const auto& v : *values) {
        if (v) {
            names.emplace_back(to_string(*v));
        } else {
            names.emplace_back(std::nullopt);
        }
    }
    return names;
}

std::optional<std::string_view> lookup(const std::map<std::string, std::string>& query,
                                       const char* name) {
    auto it = query.find(name);
    if (it == query.end()) return std::nullopt;
    return std::string_view(it->second);
}

std::vector<Point> require_all(const Sequence<Point>& points) {
    std::vector<Point> out;
    out.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (!points[i]) {
            throw MalformedElementError(i, "Coordinates cannot contain an empty position");
        }
        out.push_back(*points[i]);
    }
    return out;
}

Sequence<Bearing> to_bearings(const Sequence<std::vector<double>>& lists) {
    Sequence<Bearing> bearings;
    bearings.reserve(lists.size());
    for (const auto& list : lists) {
        if (list) {
            bearings.emplace_back(Bearing(list->begin(), list->end()));
        } else {
            bearings.emplace_back(std::nullopt);
        }
    }
    return bearings;
}

} // anonymous namespace

std::map<std::string, std::string> to_query(const RouteParameters& p) {
    std::map<std::string, std::string> query;
    auto put = [&query](const char* name, std::optional<std::string> value) {
        if (value) query.emplace(name, std::move(*value));
    };

    if (p.coordinates) {
        query.emplace(param::Coordinates, ListFormatter::format_coordinates(*p.coordinates));
    }
    put(param::Bearings, ListFormatter::format_bearings(p.bearings));
    put(param::Radiuses, ListFormatter::format_radiuses(p.radiuses));
    put(param::Approaches, ListFormatter::format_approaches(names_of(p.approaches)));
    put(param::WaypointIndices, ListFormatter::format_waypoint_indices(p.waypoint_indices));
    put(param::WaypointNames, ListFormatter::format_waypoint_names(p.waypoint_names));
    put(param::WaypointTargets, ListFormatter::format_waypoint_targets(p.waypoint_targets));
    put(param::SnappingIncludeClosures,
        ListFormatter::format_snapping_include_closures(p.snapping_include_closures));
    put(param::Annotations, ListFormatter::format_annotations(names_of(p.annotations)));
    put(param::Exclude, ListFormatter::format_criteria(p.excludes));
    put(param::Include, ListFormatter::format_criteria(p.includes));
    put(param::PaymentMethods, ListFormatter::format_criteria(p.payment_methods));
    put(param::Layers, ListFormatter::format_layers(p.layers));
    return query;
}

RouteParameters from_query(const std::map<std::string, std::string>& query) {
    RouteParameters p;

    if (auto points = ListParser::parse_points(lookup(query, param::Coordinates))) {
        p.coordinates = require_all(*points);
    }
    if (auto lists = ListParser::parse_double_lists(lookup(query, param::Bearings))) {
        p.bearings = to_bearings(*lists);
    }
    p.radiuses = ListParser::parse_strings(lookup(query, param::Radiuses));
    p.approaches = ListParser::parse_strings_as<Approach>(
        lookup(query, param::Approaches), DEFAULT_DELIMITER, approach_from_string);
    p.waypoint_indices = ListParser::parse_integers(lookup(query, param::WaypointIndices));
    p.waypoint_names = ListParser::parse_strings(lookup(query, param::WaypointNames));
    p.waypoint_targets = ListParser::parse_points(lookup(query, param::WaypointTargets));
    p.snapping_include_closures =
        ListParser::parse_booleans(lookup(query, param::SnappingIncludeClosures));
    p.annotations = ListParser::parse_strings_as<Annotation>(
        lookup(query, param::Annotations), DEFAULT_INNER_DELIMITER, annotation_from_string);
    p.excludes = ListParser::parse_strings_as<Exclude>(
        lookup(query, param::Exclude), DEFAULT_INNER_DELIMITER, exclude_from_string);
    p.includes = ListParser::parse_strings_as<Include>(
        lookup(query, param::Include), DEFAULT_INNER_DELIMITER, include_from_string);
    p.payment_methods = ListParser::parse_strings_as<PaymentMethod>(
        lookup(query, param::PaymentMethods), DEFAULT_INNER_DELIMITER, payment_method_from_string);
    p.layers = ListParser::parse_integers(lookup(query, param::Layers));
    return p;
}

void to_json(nlohmann::json& j, const RouteParameters& t) {
    j = nlohmann::json::object();
    for (const auto& [name, value] : to_query(t)) {
        j[name] = value;
    }
}

void from_json(const nlohmann::json& j, RouteParameters& t) {
    std::map<std::string, std::string> query;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_null()) continue;
        query[it.key()] = it.value().get<std::string>();
    }
    t = from_query(query);
}

RouteParameters parse_route_parameters(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::object object;
    error = doc.get_object().get(object);
    if (error) {
        throw ParseError("Route parameters must be a JSON object");
    }

    std::map<std::string, std::string> query;
    for (auto member : object) {
        simdjson::ondemand::field field;
        error = std::move(member).get(field);
        if (error) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
        }

        std::string_view key_view;
        error = field.unescaped_key().get(key_view);
        if (error) {
            throw ParseError(std::string("Invalid member name: ") + simdjson::error_message(error));
        }
        std::string key(key_view);

        simdjson::ondemand::json_type type;
        error = field.value().type().get(type);
        if (error) {
            throw ParseError("Invalid value for '" + key + "': " + simdjson::error_message(error));
        }
        if (type == simdjson::ondemand::json_type::null) continue;
        if (type != simdjson::ondemand::json_type::string) {
            throw ParseError("Member '" + key + "' must be a string");
        }

        std::string_view text;
        error = field.value().get_string().get(text);
        if (error) {
            throw ParseError("Invalid string for '" + key + "': " + simdjson::error_message(error));
        }
        query[key] = std::string(text);
    }

    log(LogLevel::Debug, "waycodec.route_parameters",
        "Loaded " + std::to_string(query.size()) + " parameters from JSON");
    return from_query(query);
}

} // namespace waycodec
