#pragma once
#include "criteria.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace waycodec {

/// Query parameter names of the list-valued request fields.
namespace param {
    constexpr const char* Coordinates             = "coordinates";
    constexpr const char* Bearings                = "bearings";
    constexpr const char* Radiuses                = "radiuses";
    constexpr const char* Approaches              = "approaches";
    constexpr const char* WaypointIndices         = "waypoints";
    constexpr const char* WaypointNames           = "waypoint_names";
    constexpr const char* WaypointTargets         = "waypoint_targets";
    constexpr const char* SnappingIncludeClosures = "snapping_include_closures";
    constexpr const char* Annotations             = "annotations";
    constexpr const char* Exclude                 = "exclude";
    constexpr const char* Include                 = "include";
    constexpr const char* PaymentMethods          = "payment_methods";
    constexpr const char* Layers                  = "layers";
} // namespace param

/// The list-valued fields of a directions request. Unset fields are not sent.
struct RouteParameters {
    std::optional<std::vector<Point>> coordinates;
    std::optional<Sequence<Bearing>> bearings;
    std::optional<Sequence<std::string>> radiuses;       // number or "unlimited"
    std::optional<Sequence<Approach>> approaches;
    std::optional<Sequence<int>> waypoint_indices;
    std::optional<Sequence<std::string>> waypoint_names;
    std::optional<Sequence<Point>> waypoint_targets;
    std::optional<Sequence<bool>> snapping_include_closures;
    std::optional<Sequence<Annotation>> annotations;
    std::optional<Sequence<Exclude>> excludes;
    std::optional<Sequence<Include>> includes;
    std::optional<Sequence<PaymentMethod>> payment_methods;
    std::optional<Sequence<int>> layers;

    bool operator==(const RouteParameters& o) const {
        return coordinates == o.coordinates && bearings == o.bearings
               && radiuses == o.radiuses && approaches == o.approaches
               && waypoint_indices == o.waypoint_indices
               && waypoint_names == o.waypoint_names
               && waypoint_targets == o.waypoint_targets
               && snapping_include_closures == o.snapping_include_closures
               && annotations == o.annotations && excludes == o.excludes
               && includes == o.includes && payment_methods == o.payment_methods
               && layers == o.layers;
    }
};

/// Parameter name -> wire value for every set field. Throws
/// ValidationError / MalformedElementError from the field rules.
[[nodiscard]] std::map<std::string, std::string> to_query(const RouteParameters& params);

/// Inverse of to_query. Unknown names are ignored.
[[nodiscard]] RouteParameters from_query(const std::map<std::string, std::string>& query);

/// Fields are stored as their wire strings, e.g. {"bearings": "10,20;;45,90"}.
void to_json(nlohmann::json& j, const RouteParameters& t);
void from_json(const nlohmann::json& j, RouteParameters& t);

/// Read a JSON object of wire strings. Null members count as unset.
/// Throws ParseError on invalid JSON or a non-string member.
[[nodiscard]] RouteParameters parse_route_parameters(std::string_view raw);

} // namespace waycodec
