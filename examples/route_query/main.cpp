/// Route query example: builds the list-valued query parameters of a
/// directions request and reads a response-style value back.
/// Usage: ./route_query [route-parameters.json]

#include <waycodec/waycodec.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

int main(int argc, char** argv) {
    waycodec::set_min_log_level(waycodec::LogLevel::Warning);
    waycodec::set_log_handler([](waycodec::LogLevel level, const std::string& logger,
                                 const std::string& message) {
        std::cerr << "[" << waycodec::log_level_to_string(level) << "] " << logger << ": "
                  << message << "\n";
    });

    waycodec::RouteParameters params;
    if (argc > 1) {
        std::ifstream in(argv[1]);
        if (!in) {
            std::cerr << "Cannot open " << argv[1] << "\n";
            return 1;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        try {
            params = waycodec::parse_route_parameters(buffer.str());
        } catch (const waycodec::WaycodecError& e) {
            std::cerr << "Invalid route parameters: " << e.what() << "\n";
            return 1;
        }
    } else {
        params.coordinates = std::vector<waycodec::Point>{
            waycodec::Point::from_lng_lat(-122.4194155, 37.7749295),
            waycodec::Point::from_lng_lat(-122.2711639, 37.8043514),
            waycodec::Point::from_lng_lat(-122.0838511, 37.3860517)};
        params.bearings = waycodec::Sequence<waycodec::Bearing>{
            waycodec::Bearing{45.0, 90.0}, std::nullopt, waycodec::Bearing{180.0, 20.0}};
        params.approaches = waycodec::Sequence<waycodec::Approach>{
            std::nullopt, waycodec::Approach::Curb, waycodec::Approach::Unrestricted};
        params.waypoint_names = waycodec::Sequence<std::string>{"Home", std::nullopt, "Work"};
        params.annotations = waycodec::Sequence<waycodec::Annotation>{
            waycodec::Annotation::Distance, waycodec::Annotation::Congestion};
    }

    try {
        for (const auto& [name, value] : waycodec::to_query(params)) {
            std::cout << name << "=" << value << "\n";
        }
    } catch (const waycodec::WaycodecError& e) {
        std::cerr << "Cannot build query: " << e.what() << "\n";
        return 1;
    }

    // Per-leg values as they come back from the API
    auto closures = waycodec::ListParser::parse_booleans(";true;;false");
    std::cout << "closures:";
    for (const auto& c : *closures) {
        std::cout << " " << (c ? (*c ? "true" : "false") : "-");
    }
    std::cout << "\n";
    return 0;
}
