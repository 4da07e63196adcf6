#include <gtest/gtest.h>
#include "waycodec/route_parameters.hpp"
#include "waycodec/error.hpp"
#include <nlohmann/json.hpp>

using namespace waycodec;

namespace {

RouteParameters sample_parameters() {
    RouteParameters p;
    p.coordinates = std::vector<Point>{Point{-122.42, 37.78}, Point{-122.45, 37.91}};
    p.bearings = Sequence<Bearing>{Bearing{45.0, 90.0}, std::nullopt};
    p.radiuses = Sequence<std::string>{"unlimited", "20"};
    p.approaches = Sequence<Approach>{std::nullopt, Approach::Curb};
    p.waypoint_indices = Sequence<int>{0, 1};
    p.waypoint_names = Sequence<std::string>{"Home", "Work"};
    p.annotations = Sequence<Annotation>{Annotation::Distance, Annotation::Congestion};
    p.excludes = Sequence<Exclude>{Exclude::Toll, Exclude::Ferry};
    return p;
}

} // namespace

// ---- to_query ----

TEST(RouteQuery, FormatsSetFieldsOnly) {
    auto query = to_query(sample_parameters());
    EXPECT_EQ(query.size(), 8u);
    EXPECT_EQ(query.at("coordinates"), "-122.42,37.78;-122.45,37.91");
    EXPECT_EQ(query.at("bearings"), "45,90;");
    EXPECT_EQ(query.at("radiuses"), "unlimited;20");
    EXPECT_EQ(query.at("approaches"), ";curb");
    EXPECT_EQ(query.at("waypoints"), "0;1");
    EXPECT_EQ(query.at("waypoint_names"), "Home;Work");
    EXPECT_EQ(query.at("annotations"), "distance,congestion");
    EXPECT_EQ(query.at("exclude"), "toll,ferry");
    EXPECT_EQ(query.count("waypoint_targets"), 0u);
}

TEST(RouteQuery, EmptyParametersGiveEmptyQuery) {
    EXPECT_TRUE(to_query(RouteParameters{}).empty());
}

TEST(RouteQuery, ValidationFailurePropagates) {
    RouteParameters p;
    p.bearings = Sequence<Bearing>{Bearing{400.0, 10.0}};
    EXPECT_THROW((void)to_query(p), ValidationError);
}

TEST(RouteQuery, EmptyWaypointNamesOmitted) {
    RouteParameters p;
    p.waypoint_names = Sequence<std::string>{};
    EXPECT_EQ(to_query(p).count("waypoint_names"), 0u);
}

// ---- from_query ----

TEST(RouteQuery, ParsesBack) {
    auto p = from_query(to_query(sample_parameters()));
    EXPECT_EQ(p, sample_parameters());
}

TEST(RouteQuery, UnknownKeysIgnored) {
    auto p = from_query({{"alternatives", "true"}, {"waypoints", "0;;3"}});
    ASSERT_TRUE(p.waypoint_indices.has_value());
    EXPECT_EQ(*p.waypoint_indices, (Sequence<int>{0, std::nullopt, 3}));
    EXPECT_FALSE(p.coordinates.has_value());
}

TEST(RouteQuery, EmptyCoordinateRejected) {
    EXPECT_THROW((void)from_query({{"coordinates", "1,2;;3,4"}}), MalformedElementError);
}

TEST(RouteQuery, UnknownAnnotationRejected) {
    EXPECT_THROW((void)from_query({{"annotations", "distance,weather"}}), MalformedElementError);
}

TEST(RouteQuery, CriteriaAndTargets) {
    auto p = from_query({{"include", "hov2,hot"},
                         {"payment_methods", "cash,etc"},
                         {"waypoint_targets", ";1.5,2"},
                         {"snapping_include_closures", "true;"},
                         {"layers", "0;-1"}});
    EXPECT_EQ(*p.includes, (Sequence<Include>{Include::Hov2, Include::Hot}));
    EXPECT_EQ(*p.payment_methods, (Sequence<PaymentMethod>{PaymentMethod::Cash,
                                                           PaymentMethod::Etc}));
    EXPECT_EQ(*p.waypoint_targets, (Sequence<Point>{std::nullopt, Point{1.5, 2.0}}));
    EXPECT_EQ(*p.snapping_include_closures, (Sequence<bool>{true, std::nullopt}));
    EXPECT_EQ(*p.layers, (Sequence<int>{0, -1}));
}

// ---- JSON ----

TEST(RouteParametersJson, WireStrings) {
    nlohmann::json j = sample_parameters();
    EXPECT_EQ(j["bearings"], "45,90;");
    EXPECT_EQ(j["exclude"], "toll,ferry");
    EXPECT_FALSE(j.contains("layers"));

    auto back = j.get<RouteParameters>();
    EXPECT_EQ(back, sample_parameters());
}

TEST(RouteParametersJson, NullMeansUnset) {
    nlohmann::json j = {{"approaches", nullptr}, {"waypoints", "2"}};
    auto p = j.get<RouteParameters>();
    EXPECT_FALSE(p.approaches.has_value());
    EXPECT_EQ(*p.waypoint_indices, (Sequence<int>{2}));
}

// ---- parse_route_parameters ----

TEST(ParseRouteParameters, Valid) {
    auto p = parse_route_parameters(
        R"({"coordinates":"1,2;3,4","radiuses":";unlimited","approaches":null})");
    ASSERT_TRUE(p.coordinates.has_value());
    EXPECT_EQ(*p.coordinates, (std::vector<Point>{Point{1, 2}, Point{3, 4}}));
    EXPECT_EQ(*p.radiuses, (Sequence<std::string>{std::nullopt, "unlimited"}));
    EXPECT_FALSE(p.approaches.has_value());
}

TEST(ParseRouteParameters, EscapedStrings) {
    auto p = parse_route_parameters(R"({"waypoint_names":"Café;\"Home\""})");
    ASSERT_TRUE(p.waypoint_names.has_value());
    EXPECT_EQ(*p.waypoint_names, (Sequence<std::string>{"Caf\xc3\xa9", "\"Home\""}));
}

TEST(ParseRouteParameters, InvalidJson) {
    EXPECT_THROW((void)parse_route_parameters("{invalid json"), ParseError);
}

TEST(ParseRouteParameters, EmptyInput) {
    EXPECT_THROW((void)parse_route_parameters(""), ParseError);
}

TEST(ParseRouteParameters, NotAnObject) {
    EXPECT_THROW((void)parse_route_parameters(R"(["1,2"])"), ParseError);
}

TEST(ParseRouteParameters, NonStringMember) {
    EXPECT_THROW((void)parse_route_parameters(R"({"waypoints":[0,1]})"), ParseError);
}

TEST(ParseRouteParameters, MalformedValue) {
    EXPECT_THROW((void)parse_route_parameters(R"({"waypoints":"0;one"})"),
                 MalformedElementError);
}
