#include "waycodec/criteria.hpp"
#include <array>
#include <optional>
#include <stdexcept>

namespace waycodec {

namespace {

constexpr std::array<Profile, 4> ALL_PROFILES = {
    Profile::DrivingTraffic, Profile::Driving, Profile::Walking, Profile::Cycling};

constexpr std::array<Geometry, 2> ALL_GEOMETRIES = {Geometry::Polyline, Geometry::Polyline6};

constexpr std::array<Overview, 3> ALL_OVERVIEWS = {
    Overview::Simplified, Overview::Full, Overview::False};

constexpr std::array<Annotation, 8> ALL_ANNOTATIONS = {
    Annotation::Duration, Annotation::Distance, Annotation::Speed, Annotation::Congestion,
    Annotation::CongestionNumeric, Annotation::Maxspeed, Annotation::Closure,
    Annotation::TrafficTendency};

constexpr std::array<Exclude, 7> ALL_EXCLUDES = {
    Exclude::Toll, Exclude::Motorway, Exclude::Ferry, Exclude::Tunnel,
    Exclude::Restricted, Exclude::CashOnlyTolls, Exclude::Unpaved};

constexpr std::array<Include, 3> ALL_INCLUDES = {Include::Hov2, Include::Hov3, Include::Hot};

constexpr std::array<VoiceUnits, 2> ALL_VOICE_UNITS = {VoiceUnits::Imperial, VoiceUnits::Metric};

constexpr std::array<Source, 2> ALL_SOURCES = {Source::First, Source::Any};

constexpr std::array<Destination, 2> ALL_DESTINATIONS = {Destination::Any, Destination::Last};

constexpr std::array<Approach, 2> ALL_APPROACHES = {Approach::Unrestricted, Approach::Curb};

constexpr std::array<PaymentMethod, 13> ALL_PAYMENT_METHODS = {
    PaymentMethod::General, PaymentMethod::Etc, PaymentMethod::Etcx, PaymentMethod::Cash,
    PaymentMethod::ExactCash, PaymentMethod::Coins, PaymentMethod::Notes,
    PaymentMethod::DebitCards, PaymentMethod::PassCard, PaymentMethod::CreditCards,
    PaymentMethod::Video, PaymentMethod::Cryptocurrencies, PaymentMethod::App};

constexpr std::array<AmenityType, 18> ALL_AMENITY_TYPES = {
    AmenityType::GasStation, AmenityType::ElectricChargingStation, AmenityType::Toilet,
    AmenityType::Coffee, AmenityType::Restaurant, AmenityType::Snack, AmenityType::Atm,
    AmenityType::Info, AmenityType::BabyCare, AmenityType::FacilitiesForDisabled,
    AmenityType::Shop, AmenityType::Telephone, AmenityType::Hotel, AmenityType::Hotspring,
    AmenityType::Shower, AmenityType::PicnicShelter, AmenityType::Post, AmenityType::Fax};

template <typename E, std::size_t N>
std::optional<E> find_value(const std::array<E, N>& all, std::string_view s) {
    for (E v : all) {
        if (to_string(v) == s) return v;
    }
    return std::nullopt;
}

template <typename E, std::size_t N>
E value_or_throw(const std::array<E, N>& all, const std::string& s, const char* category) {
    if (auto v = find_value(all, s)) return *v;
    throw std::invalid_argument(std::string("Unknown ") + category + ": '" + s + "'");
}

} // anonymous namespace

// ---------- Profile ----------

std::string to_string(Profile v) {
    switch (v) {
        case Profile::DrivingTraffic: return "driving-traffic";
        case Profile::Driving:        return "driving";
        case Profile::Walking:        return "walking";
        case Profile::Cycling:        return "cycling";
    }
    throw std::invalid_argument("Invalid Profile value");
}

Profile profile_from_string(const std::string& s) {
    return value_or_throw(ALL_PROFILES, s, "profile");
}

bool is_valid_profile(std::string_view s) {
    return find_value(ALL_PROFILES, s).has_value();
}

// ---------- Geometry ----------

std::string to_string(Geometry v) {
    switch (v) {
        case Geometry::Polyline:  return "polyline";
        case Geometry::Polyline6: return "polyline6";
    }
    throw std::invalid_argument("Invalid Geometry value");
}

Geometry geometry_from_string(const std::string& s) {
    return value_or_throw(ALL_GEOMETRIES, s, "geometry");
}

bool is_valid_geometry(std::string_view s) {
    return find_value(ALL_GEOMETRIES, s).has_value();
}

// ---------- Overview ----------

std::string to_string(Overview v) {
    switch (v) {
        case Overview::Simplified: return "simplified";
        case Overview::Full:       return "full";
        case Overview::False:      return "false";
    }
    throw std::invalid_argument("Invalid Overview value");
}

Overview overview_from_string(const std::string& s) {
    return value_or_throw(ALL_OVERVIEWS, s, "overview");
}

bool is_valid_overview(std::string_view s) {
    return find_value(ALL_OVERVIEWS, s).has_value();
}

// ---------- Annotation ----------

std::string to_string(Annotation v) {
    switch (v) {
        case Annotation::Duration:          return "duration";
        case Annotation::Distance:          return "distance";
        case Annotation::Speed:             return "speed";
        case Annotation::Congestion:        return "congestion";
        case Annotation::CongestionNumeric: return "congestion_numeric";
        case Annotation::Maxspeed:          return "maxspeed";
        case Annotation::Closure:           return "closure";
        case Annotation::TrafficTendency:   return "traffic_tendency";
    }
    throw std::invalid_argument("Invalid Annotation value");
}

Annotation annotation_from_string(const std::string& s) {
    return value_or_throw(ALL_ANNOTATIONS, s, "annotation");
}

bool is_valid_annotation(std::string_view s) {
    return find_value(ALL_ANNOTATIONS, s).has_value();
}

// ---------- Exclude ----------

std::string to_string(Exclude v) {
    switch (v) {
        case Exclude::Toll:          return "toll";
        case Exclude::Motorway:      return "motorway";
        case Exclude::Ferry:         return "ferry";
        case Exclude::Tunnel:        return "tunnel";
        case Exclude::Restricted:    return "restricted";
        case Exclude::CashOnlyTolls: return "cash_only_tolls";
        case Exclude::Unpaved:       return "unpaved";
    }
    throw std::invalid_argument("Invalid Exclude value");
}

Exclude exclude_from_string(const std::string& s) {
    return value_or_throw(ALL_EXCLUDES, s, "exclude");
}

bool is_valid_exclude(std::string_view s) {
    return find_value(ALL_EXCLUDES, s).has_value();
}

// ---------- Include ----------

std::string to_string(Include v) {
    switch (v) {
        case Include::Hov2: return "hov2";
        case Include::Hov3: return "hov3";
        case Include::Hot:  return "hot";
    }
    throw std::invalid_argument("Invalid Include value");
}

Include include_from_string(const std::string& s) {
    return value_or_throw(ALL_INCLUDES, s, "include");
}

bool is_valid_include(std::string_view s) {
    return find_value(ALL_INCLUDES, s).has_value();
}

// ---------- Voice units ----------

std::string to_string(VoiceUnits v) {
    switch (v) {
        case VoiceUnits::Imperial: return "imperial";
        case VoiceUnits::Metric:   return "metric";
    }
    throw std::invalid_argument("Invalid VoiceUnits value");
}

VoiceUnits voice_units_from_string(const std::string& s) {
    return value_or_throw(ALL_VOICE_UNITS, s, "voice units");
}

bool is_valid_voice_units(std::string_view s) {
    return find_value(ALL_VOICE_UNITS, s).has_value();
}

// ---------- Source / destination ----------

std::string to_string(Source v) {
    switch (v) {
        case Source::First: return "first";
        case Source::Any:   return "any";
    }
    throw std::invalid_argument("Invalid Source value");
}

Source source_from_string(const std::string& s) {
    return value_or_throw(ALL_SOURCES, s, "source");
}

bool is_valid_source(std::string_view s) {
    return find_value(ALL_SOURCES, s).has_value();
}

std::string to_string(Destination v) {
    switch (v) {
        case Destination::Any:  return "any";
        case Destination::Last: return "last";
    }
    throw std::invalid_argument("Invalid Destination value");
}

Destination destination_from_string(const std::string& s) {
    return value_or_throw(ALL_DESTINATIONS, s, "destination");
}

bool is_valid_destination(std::string_view s) {
    return find_value(ALL_DESTINATIONS, s).has_value();
}

// ---------- Approach ----------

std::string to_string(Approach v) {
    switch (v) {
        case Approach::Unrestricted: return "unrestricted";
        case Approach::Curb:         return "curb";
    }
    throw std::invalid_argument("Invalid Approach value");
}

Approach approach_from_string(const std::string& s) {
    return value_or_throw(ALL_APPROACHES, s, "approach");
}

bool is_valid_approach(std::string_view s) {
    return find_value(ALL_APPROACHES, s).has_value();
}

// ---------- Payment method ----------

std::string to_string(PaymentMethod v) {
    switch (v) {
        case PaymentMethod::General:          return "general";
        case PaymentMethod::Etc:              return "etc";
        case PaymentMethod::Etcx:             return "etcx";
        case PaymentMethod::Cash:             return "cash";
        case PaymentMethod::ExactCash:        return "exact_cash";
        case PaymentMethod::Coins:            return "coins";
        case PaymentMethod::Notes:            return "notes";
        case PaymentMethod::DebitCards:       return "debit_cards";
        case PaymentMethod::PassCard:         return "pass_card";
        case PaymentMethod::CreditCards:      return "credit_cards";
        case PaymentMethod::Video:            return "video";
        case PaymentMethod::Cryptocurrencies: return "cryptocurrencies";
        case PaymentMethod::App:              return "app";
    }
    throw std::invalid_argument("Invalid PaymentMethod value");
}

PaymentMethod payment_method_from_string(const std::string& s) {
    return value_or_throw(ALL_PAYMENT_METHODS, s, "payment method");
}

bool is_valid_payment_method(std::string_view s) {
    return find_value(ALL_PAYMENT_METHODS, s).has_value();
}

// ---------- Amenity type ----------

std::string to_string(AmenityType v) {
    switch (v) {
        case AmenityType::GasStation:              return "gas_station";
        case AmenityType::ElectricChargingStation: return "electric_charging_station";
        case AmenityType::Toilet:                  return "toilet";
        case AmenityType::Coffee:                  return "coffee";
        case AmenityType::Restaurant:              return "restaurant";
        case AmenityType::Snack:                   return "snack";
        case AmenityType::Atm:                     return "ATM";
        case AmenityType::Info:                    return "info";
        case AmenityType::BabyCare:                return "baby_care";
        case AmenityType::FacilitiesForDisabled:   return "facilities_for_disabled";
        case AmenityType::Shop:                    return "shop";
        case AmenityType::Telephone:               return "telephone";
        case AmenityType::Hotel:                   return "hotel";
        case AmenityType::Hotspring:               return "hotspring";
        case AmenityType::Shower:                  return "shower";
        case AmenityType::PicnicShelter:           return "picnic_shelter";
        case AmenityType::Post:                    return "post";
        case AmenityType::Fax:                     return "FAX";
    }
    throw std::invalid_argument("Invalid AmenityType value");
}

AmenityType amenity_type_from_string(const std::string& s) {
    return value_or_throw(ALL_AMENITY_TYPES, s, "amenity type");
}

bool is_valid_amenity_type(std::string_view s) {
    return find_value(ALL_AMENITY_TYPES, s).has_value();
}

// ---------- Traffic tendency ----------

int to_int(TrafficTendency v) {
    return static_cast<int>(v);
}

TrafficTendency traffic_tendency_from_int(int code) {
    if (!is_valid_traffic_tendency(code)) {
        throw std::invalid_argument("Unknown traffic tendency: " + std::to_string(code));
    }
    return static_cast<TrafficTendency>(code);
}

bool is_valid_traffic_tendency(int code) {
    return code >= to_int(TrafficTendency::Unknown)
        && code <= to_int(TrafficTendency::RapidlyDecreasingCongestion);
}

// ---------- JSON ----------

void to_json(nlohmann::json& j, Profile v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Profile& v) { v = profile_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, Geometry v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Geometry& v) { v = geometry_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, Overview v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Overview& v) { v = overview_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, Annotation v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Annotation& v) {
    v = annotation_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, Exclude v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Exclude& v) { v = exclude_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, Include v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Include& v) { v = include_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, VoiceUnits v) { j = to_string(v); }
void from_json(const nlohmann::json& j, VoiceUnits& v) {
    v = voice_units_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, Source v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Source& v) { v = source_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, Destination v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Destination& v) {
    v = destination_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, Approach v) { j = to_string(v); }
void from_json(const nlohmann::json& j, Approach& v) { v = approach_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, PaymentMethod v) { j = to_string(v); }
void from_json(const nlohmann::json& j, PaymentMethod& v) {
    v = payment_method_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, AmenityType v) { j = to_string(v); }
void from_json(const nlohmann::json& j, AmenityType& v) {
    v = amenity_type_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, TrafficTendency v) { j = to_int(v); }
void from_json(const nlohmann::json& j, TrafficTendency& v) {
    v = traffic_tendency_from_int(j.get<int>());
}

} // namespace waycodec
