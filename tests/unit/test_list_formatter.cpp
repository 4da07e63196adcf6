#include <gtest/gtest.h>
#include "waycodec/list_formatter.hpp"
#include "waycodec/criteria.hpp"
#include "waycodec/error.hpp"
#include <limits>

using namespace waycodec;

namespace {

std::string identity(const std::string& s) { return s; }

} // namespace

// ---- join ----

TEST(Join, UnsetStaysUnset) {
    std::optional<Sequence<std::string>> none;
    EXPECT_FALSE(ListFormatter::join(none, ';', identity, TrailingAbsences::Keep).has_value());
}

TEST(Join, AbsencesRenderEmpty) {
    Sequence<std::string> tokens{"a", std::nullopt, std::nullopt, "b"};
    EXPECT_EQ(ListFormatter::join(tokens, ';', identity, TrailingAbsences::Keep), "a;;;b");
}

TEST(Join, KeepTrailingAbsences) {
    Sequence<std::string> tokens{"a", std::nullopt, std::nullopt};
    EXPECT_EQ(ListFormatter::join(tokens, ';', identity, TrailingAbsences::Keep), "a;;");
}

TEST(Join, TrimTrailingAbsences) {
    Sequence<std::string> tokens{std::nullopt, "a", std::nullopt, std::nullopt};
    EXPECT_EQ(ListFormatter::join(tokens, ';', identity, TrailingAbsences::Trim), ";a");
}

TEST(Join, TrimAllAbsent) {
    Sequence<std::string> tokens{std::nullopt, std::nullopt};
    EXPECT_EQ(ListFormatter::join(tokens, ';', identity, TrailingAbsences::Trim), "");
    EXPECT_EQ(ListFormatter::join(tokens, ';', identity, TrailingAbsences::Keep), ";");
}

TEST(Join, EmptySequence) {
    Sequence<std::string> tokens;
    EXPECT_EQ(ListFormatter::join(tokens, ';', identity, TrailingAbsences::Keep), "");
}

// ---- Bearings ----

TEST(FormatBearings, Unset) {
    EXPECT_FALSE(ListFormatter::format_bearings(std::nullopt).has_value());
}

TEST(FormatBearings, LeadingAbsence) {
    Sequence<Bearing> bearings{std::nullopt, Bearing{10.0, 20.0}};
    EXPECT_EQ(ListFormatter::format_bearings(bearings), ";10,20");
}

TEST(FormatBearings, Canonicalized) {
    Sequence<Bearing> bearings{Bearing{45.5, 90.0}, Bearing{0.0, 360.0}};
    EXPECT_EQ(ListFormatter::format_bearings(bearings), "45.5,90;0,360");
}

TEST(FormatBearings, AbsentComponentMakesPositionAbsent) {
    Sequence<Bearing> bearings{Bearing{std::nullopt, 20.0}, Bearing{10.0, std::nullopt},
                               Bearing{1.0, 2.0}};
    EXPECT_EQ(ListFormatter::format_bearings(bearings), ";;1,2");
}

TEST(FormatBearings, AngleOutOfRange) {
    Sequence<Bearing> bearings{Bearing{10.0, 20.0}, Bearing{370.0, 5.0}};
    try {
        (void)ListFormatter::format_bearings(bearings);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.position, 1u);
    }
}

TEST(FormatBearings, NegativeToleranceRejected) {
    Sequence<Bearing> bearings{Bearing{10.0, -1.0}};
    EXPECT_THROW((void)ListFormatter::format_bearings(bearings), ValidationError);
}

TEST(FormatBearings, NanRejected) {
    Sequence<Bearing> bearings{Bearing{std::numeric_limits<double>::quiet_NaN(), 1.0}};
    EXPECT_THROW((void)ListFormatter::format_bearings(bearings), ValidationError);
}

TEST(FormatBearings, WrongArity) {
    Sequence<Bearing> bearings{Bearing{10.0, 20.0, 30.0}};
    EXPECT_THROW((void)ListFormatter::format_bearings(bearings), MalformedElementError);
    Sequence<Bearing> single{Bearing{10.0}};
    EXPECT_THROW((void)ListFormatter::format_bearings(single), MalformedElementError);
}

TEST(FormatBearings, FirstViolationWins) {
    Sequence<Bearing> bearings{Bearing{1.0}, Bearing{400.0, 1.0}};
    EXPECT_THROW((void)ListFormatter::format_bearings(bearings), MalformedElementError);
}

// ---- Distributions ----

TEST(FormatDistributions, EmptyListIsUnset) {
    EXPECT_FALSE(ListFormatter::format_distributions(Sequence<Distribution>{}).has_value());
    EXPECT_FALSE(ListFormatter::format_distributions(std::nullopt).has_value());
}

TEST(FormatDistributions, Pairs) {
    Sequence<Distribution> distributions{Distribution{1, 2}, Distribution{}, Distribution{3, 4}};
    EXPECT_EQ(ListFormatter::format_distributions(distributions), "1,2;;3,4");
}

TEST(FormatDistributions, ExtraElementsIgnored) {
    Sequence<Distribution> distributions{Distribution{1, 2, 9}};
    EXPECT_EQ(ListFormatter::format_distributions(distributions), "1,2");
}

TEST(FormatDistributions, SingleElementRejected) {
    Sequence<Distribution> distributions{Distribution{1}};
    EXPECT_THROW((void)ListFormatter::format_distributions(distributions),
                 MalformedElementError);
}

// ---- Approaches ----

TEST(FormatApproaches, Accepted) {
    Sequence<std::string> approaches{"unrestricted", std::nullopt, "curb"};
    EXPECT_EQ(ListFormatter::format_approaches(approaches), "unrestricted;;curb");
}

TEST(FormatApproaches, Rejected) {
    Sequence<std::string> approaches{"curb", "Curb"};
    try {
        (void)ListFormatter::format_approaches(approaches);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.position, 1u);
    }
}

TEST(FormatApproaches, Unset) {
    EXPECT_FALSE(ListFormatter::format_approaches(std::nullopt).has_value());
}

// ---- Radiuses ----

TEST(FormatRadiuses, PassThrough) {
    Sequence<std::string> radiuses{"unlimited", "5.10", std::nullopt, "0"};
    EXPECT_EQ(ListFormatter::format_radiuses(radiuses), "unlimited;5.10;;0");
}

TEST(FormatRadiuses, NegativeRejected) {
    Sequence<std::string> radiuses{"10", "-1"};
    EXPECT_THROW((void)ListFormatter::format_radiuses(radiuses), ValidationError);
}

TEST(FormatRadiuses, NotANumber) {
    Sequence<std::string> radiuses{"far"};
    EXPECT_THROW((void)ListFormatter::format_radiuses(radiuses), MalformedElementError);
}

// ---- Plain lists ----

TEST(FormatWaypointNames, EmptyIsUnset) {
    EXPECT_FALSE(ListFormatter::format_waypoint_names(Sequence<std::string>{}).has_value());
    Sequence<std::string> names{"Home", std::nullopt, "Work"};
    EXPECT_EQ(ListFormatter::format_waypoint_names(names), "Home;;Work");
}

TEST(FormatAnnotations, CommaJoined) {
    Sequence<std::string> annotations{"distance", "congestion"};
    EXPECT_EQ(ListFormatter::format_annotations(annotations), "distance,congestion");
}

TEST(FormatWaypointIndices, UnsetAndEmpty) {
    EXPECT_FALSE(ListFormatter::format_waypoint_indices(std::nullopt).has_value());
    EXPECT_EQ(ListFormatter::format_waypoint_indices(Sequence<int>{}), "");
    EXPECT_EQ(ListFormatter::format_waypoint_indices(Sequence<int>{0, 2, 5}), "0;2;5");
}

TEST(FormatSnappingIncludeClosures, Booleans) {
    Sequence<bool> closures{true, std::nullopt, false};
    EXPECT_EQ(ListFormatter::format_snapping_include_closures(closures), "true;;false");
}

TEST(FormatLayers, Integers) {
    EXPECT_EQ(ListFormatter::format_layers(Sequence<int>{-1, std::nullopt, 0}), "-1;;0");
}

TEST(FormatDoubles, Canonical) {
    Sequence<double> values{1.0, std::nullopt, 2.1234567};
    EXPECT_EQ(ListFormatter::format_doubles(values), "1;;2.123457");
    EXPECT_EQ(ListFormatter::format_doubles(values, ','), "1,,2.123457");
}

TEST(FormatDoubles, NonFiniteReportsPosition) {
    Sequence<double> values{1.0, std::numeric_limits<double>::infinity()};
    try {
        (void)ListFormatter::format_doubles(values);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.position, 1u);
    }
}

TEST(FormatCriteria, EnumNames) {
    Sequence<Exclude> excludes{Exclude::Toll, Exclude::CashOnlyTolls};
    EXPECT_EQ(ListFormatter::format_criteria(std::optional<Sequence<Exclude>>(excludes)),
              "toll,cash_only_tolls");
}

// ---- Points ----

TEST(FormatCoordinates, LongitudeLatitude) {
    std::vector<Point> coordinates{Point::from_lng_lat(-122.42, 37.78),
                                   Point::from_lng_lat(-122.4194159, 37.7749299)};
    EXPECT_EQ(ListFormatter::format_coordinates(coordinates),
              "-122.42,37.78;-122.419416,37.77493");
}

TEST(FormatCoordinates, Empty) {
    EXPECT_EQ(ListFormatter::format_coordinates({}), "");
}

TEST(FormatWaypointTargets, AbsentTargets) {
    Sequence<Point> targets{std::nullopt, Point::from_lng_lat(1.5, 2.0), std::nullopt};
    EXPECT_EQ(ListFormatter::format_waypoint_targets(targets), ";1.5,2;");
}

TEST(FormatPoint, CustomInnerDelimiter) {
    EXPECT_EQ(ListFormatter::format_point(Point{1.25, -3.0}, ' '), "1.25 -3");
}
