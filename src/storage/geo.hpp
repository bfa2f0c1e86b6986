#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tkv::storage::geo {

// ── Geohash scores ───────────────────────────────────────────────────────────
//
// A position is stored as a sorted set score: longitude and latitude are each
// quantised to 26 bits over their valid range and bit-interleaved into a
// 52-bit integer (latitude in the even bits, longitude in the odd bits).
// 52 bits fit a double mantissa exactly.

inline constexpr double kMinLongitude = -180.0;
inline constexpr double kMaxLongitude = 180.0;
inline constexpr double kMinLatitude  = -85.05112878;
inline constexpr double kMaxLatitude  = 85.05112878;
inline constexpr int    kStepBits     = 26;

// Earth radius in meters, as used by the haversine distance.
inline constexpr double kEarthRadiusMeters = 6372797.560856;

struct Coordinates {
    double longitude = 0.0;
    double latitude  = 0.0;
};

[[nodiscard]] bool valid(double longitude, double latitude) noexcept;

// Caller must pass coordinates for which valid() holds.
[[nodiscard]] uint64_t encode(double longitude, double latitude) noexcept;

// Returns the centre of the cell addressed by `bits`.
[[nodiscard]] Coordinates decode(uint64_t bits) noexcept;

// Decodes a sorted set score. nullopt unless the score is an integer in
// [0, 2^52), which any score written by GEOADD is.
[[nodiscard]] std::optional<Coordinates> decode_score(double score) noexcept;

// Great-circle distance in meters.
[[nodiscard]] double distance(const Coordinates& a, const Coordinates& b) noexcept;

// North-south component of the distance between two points, in meters.
[[nodiscard]] double latitude_distance(double lat1, double lat2) noexcept;

// True if `point` lies in the width x height (meters) box centred on `centre`.
// The east-west extent is measured along the point's own latitude.
[[nodiscard]] bool in_box(const Coordinates& centre, const Coordinates& point,
                          double width_m, double height_m) noexcept;

// Meters per unit for "m", "km", "mi" and "ft" (case-insensitive).
[[nodiscard]] std::optional<double> unit_to_meters(std::string_view unit) noexcept;

} // namespace tkv::storage::geo
