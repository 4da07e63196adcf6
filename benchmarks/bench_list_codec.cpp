#include <benchmark/benchmark.h>
#include "waycodec/list_formatter.hpp"
#include "waycodec/list_parser.hpp"
#include "waycodec/number_format.hpp"
#include <string>

using namespace waycodec;

// Generate "lng,lat;;lng,lat;..." with every third position absent
static std::string make_points(int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        if (i > 0) out += ';';
        if (i % 3 == 1) continue;
        out += std::to_string(-122.0 + i * 0.001) + "," + std::to_string(37.0 + i * 0.001);
    }
    return out;
}

static const std::string kSmallPoints = make_points(3);
static const std::string kLargePoints = make_points(25);

// ---- Parse benchmarks ----

static void BM_ParseSmallPoints(benchmark::State& state) {
    for (auto _ : state) {
        auto points = ListParser::parse_points(kSmallPoints);
        benchmark::DoNotOptimize(points);
    }
    state.SetBytesProcessed(state.iterations() * kSmallPoints.size());
}
BENCHMARK(BM_ParseSmallPoints)->MinTime(1.0);

static void BM_ParseLargePoints(benchmark::State& state) {
    for (auto _ : state) {
        auto points = ListParser::parse_points(kLargePoints);
        benchmark::DoNotOptimize(points);
    }
    state.SetBytesProcessed(state.iterations() * kLargePoints.size());
}
BENCHMARK(BM_ParseLargePoints)->MinTime(1.0);

// ---- Format benchmarks ----

static void BM_FormatNumber(benchmark::State& state) {
    double value = -122.4194155;
    for (auto _ : state) {
        auto text = format_number(value);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_FormatNumber)->MinTime(1.0);

static void BM_FormatWaypointTargets(benchmark::State& state) {
    auto targets = ListParser::parse_points(kLargePoints);
    for (auto _ : state) {
        auto wire = ListFormatter::format_waypoint_targets(targets);
        benchmark::DoNotOptimize(wire);
    }
}
BENCHMARK(BM_FormatWaypointTargets)->MinTime(1.0);

static void BM_FormatBearings(benchmark::State& state) {
    Sequence<Bearing> bearings;
    for (int i = 0; i < 25; ++i) {
        if (i % 4 == 0) {
            bearings.emplace_back(std::nullopt);
        } else {
            bearings.emplace_back(Bearing{i * 14.4, 45.0});
        }
    }
    std::optional<Sequence<Bearing>> input(std::move(bearings));
    for (auto _ : state) {
        auto wire = ListFormatter::format_bearings(input);
        benchmark::DoNotOptimize(wire);
    }
}
BENCHMARK(BM_FormatBearings)->MinTime(1.0);
