#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace waycodec {

// Closed catalogs of the values the directions API accepts. Every category
// has to_string, <category>_from_string (throws std::invalid_argument for
// anything outside the catalog) and is_valid_<category>.

constexpr std::string_view PROFILE_DEFAULT_USER = "mapbox";
constexpr std::string_view BASE_API_URL         = "https://api.mapbox.com";

// ---------- Profile ----------

enum class Profile { DrivingTraffic, Driving, Walking, Cycling };

std::string to_string(Profile v);
Profile profile_from_string(const std::string& s);
bool is_valid_profile(std::string_view s);

// ---------- Geometry ----------

enum class Geometry { Polyline, Polyline6 };

std::string to_string(Geometry v);
Geometry geometry_from_string(const std::string& s);
bool is_valid_geometry(std::string_view s);

// ---------- Overview ----------

enum class Overview { Simplified, Full, False };

std::string to_string(Overview v);
Overview overview_from_string(const std::string& s);
bool is_valid_overview(std::string_view s);

// ---------- Annotation ----------

enum class Annotation {
    Duration, Distance, Speed, Congestion, CongestionNumeric,
    Maxspeed, Closure, TrafficTendency
};

std::string to_string(Annotation v);
Annotation annotation_from_string(const std::string& s);
bool is_valid_annotation(std::string_view s);

// ---------- Exclude ----------

enum class Exclude { Toll, Motorway, Ferry, Tunnel, Restricted, CashOnlyTolls, Unpaved };

std::string to_string(Exclude v);
Exclude exclude_from_string(const std::string& s);
bool is_valid_exclude(std::string_view s);

// ---------- Include ----------

enum class Include { Hov2, Hov3, Hot };

std::string to_string(Include v);
Include include_from_string(const std::string& s);
bool is_valid_include(std::string_view s);

// ---------- Voice units ----------

enum class VoiceUnits { Imperial, Metric };

std::string to_string(VoiceUnits v);
VoiceUnits voice_units_from_string(const std::string& s);
bool is_valid_voice_units(std::string_view s);

// ---------- Source / destination (optimization) ----------

enum class Source { First, Any };

std::string to_string(Source v);
Source source_from_string(const std::string& s);
bool is_valid_source(std::string_view s);

enum class Destination { Any, Last };

std::string to_string(Destination v);
Destination destination_from_string(const std::string& s);
bool is_valid_destination(std::string_view s);

// ---------- Approach ----------

enum class Approach { Unrestricted, Curb };

std::string to_string(Approach v);
Approach approach_from_string(const std::string& s);
bool is_valid_approach(std::string_view s);

// ---------- Payment method ----------

enum class PaymentMethod {
    General, Etc, Etcx, Cash, ExactCash, Coins, Notes, DebitCards,
    PassCard, CreditCards, Video, Cryptocurrencies, App
};

std::string to_string(PaymentMethod v);
PaymentMethod payment_method_from_string(const std::string& s);
bool is_valid_payment_method(std::string_view s);

// ---------- Amenity type ----------

enum class AmenityType {
    GasStation, ElectricChargingStation, Toilet, Coffee, Restaurant, Snack,
    Atm, Info, BabyCare, FacilitiesForDisabled, Shop, Telephone, Hotel,
    Hotspring, Shower, PicnicShelter, Post, Fax
};

std::string to_string(AmenityType v);
AmenityType amenity_type_from_string(const std::string& s);
bool is_valid_amenity_type(std::string_view s);

// ---------- Traffic tendency (numeric on the wire) ----------

enum class TrafficTendency {
    Unknown = 0,
    ConstantCongestion = 1,
    IncreasingCongestion = 2,
    DecreasingCongestion = 3,
    RapidlyIncreasingCongestion = 4,
    RapidlyDecreasingCongestion = 5
};

int to_int(TrafficTendency v);
TrafficTendency traffic_tendency_from_int(int code);
bool is_valid_traffic_tendency(int code);

// ---------- JSON ----------

void to_json(nlohmann::json& j, Profile v);
void from_json(const nlohmann::json& j, Profile& v);
void to_json(nlohmann::json& j, Geometry v);
void from_json(const nlohmann::json& j, Geometry& v);
void to_json(nlohmann::json& j, Overview v);
void from_json(const nlohmann::json& j, Overview& v);
void to_json(nlohmann::json& j, Annotation v);
void from_json(const nlohmann::json& j, Annotation& v);
void to_json(nlohmann::json& j, Exclude v);
void from_json(const nlohmann::json& j, Exclude& v);
void to_json(nlohmann::json& j, Include v);
void from_json(const nlohmann::json& j, Include& v);
void to_json(nlohmann::json& j, VoiceUnits v);
void from_json(const nlohmann::json& j, VoiceUnits& v);
void to_json(nlohmann::json& j, Source v);
void from_json(const nlohmann::json& j, Source& v);
void to_json(nlohmann::json& j, Destination v);
void from_json(const nlohmann::json& j, Destination& v);
void to_json(nlohmann::json& j, Approach v);
void from_json(const nlohmann::json& j, Approach& v);
void to_json(nlohmann::json& j, PaymentMethod v);
void from_json(const nlohmann::json& j, PaymentMethod& v);
void to_json(nlohmann::json& j, AmenityType v);
void from_json(const nlohmann::json& j, AmenityType& v);
void to_json(nlohmann::json& j, TrafficTendency v);
void from_json(const nlohmann::json& j, TrafficTendency& v);

} // namespace waycodec
