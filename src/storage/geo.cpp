#include "storage/geo.hpp"

#include <cctype>
#include <cmath>

namespace tkv::storage::geo {

namespace {

constexpr double kLongitudeRange = kMaxLongitude - kMinLongitude;
constexpr double kLatitudeRange  = kMaxLatitude - kMinLatitude;
constexpr double kCells          = static_cast<double>(1u << kStepBits);
constexpr uint32_t kMaxCell      = (1u << kStepBits) - 1;
constexpr double kMaxScore       = static_cast<double>(1ULL << (2 * kStepBits));

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

// Insert a zero bit above every bit of a 32-bit value.
uint64_t spread(uint32_t v) noexcept {
    uint64_t x = v;
    x = (x | (x << 16)) & 0x0000FFFF0000FFFFULL;
    x = (x | (x << 8))  & 0x00FF00FF00FF00FFULL;
    x = (x | (x << 4))  & 0x0F0F0F0F0F0F0F0FULL;
    x = (x | (x << 2))  & 0x3333333333333333ULL;
    x = (x | (x << 1))  & 0x5555555555555555ULL;
    return x;
}

// Inverse of spread(): keep the even bits and pack them together.
uint32_t squash(uint64_t x) noexcept {
    x &= 0x5555555555555555ULL;
    x = (x | (x >> 1))  & 0x3333333333333333ULL;
    x = (x | (x >> 2))  & 0x0F0F0F0F0F0F0F0FULL;
    x = (x | (x >> 4))  & 0x00FF00FF00FF00FFULL;
    x = (x | (x >> 8))  & 0x0000FFFF0000FFFFULL;
    x = (x | (x >> 16)) & 0x00000000FFFFFFFFULL;
    return static_cast<uint32_t>(x);
}

uint32_t quantise(double value, double min, double range) noexcept {
    const auto cell = static_cast<uint32_t>(kCells * (value - min) / range);
    // The upper bound of the range maps one past the last cell.
    return cell > kMaxCell ? kMaxCell : cell;
}

double cell_centre(uint32_t cell, double min, double range) noexcept {
    const double lo = min + range * (static_cast<double>(cell) / kCells);
    const double hi = min + range * ((static_cast<double>(cell) + 1.0) / kCells);
    return (lo + hi) / 2.0;
}

} // anonymous namespace

bool valid(double longitude, double latitude) noexcept {
    return longitude >= kMinLongitude && longitude <= kMaxLongitude &&
           latitude >= kMinLatitude && latitude <= kMaxLatitude;
}

uint64_t encode(double longitude, double latitude) noexcept {
    const uint32_t lon_cell = quantise(longitude, kMinLongitude, kLongitudeRange);
    const uint32_t lat_cell = quantise(latitude, kMinLatitude, kLatitudeRange);
    return spread(lat_cell) | (spread(lon_cell) << 1);
}

Coordinates decode(uint64_t bits) noexcept {
    Coordinates c;
    c.longitude = cell_centre(squash(bits >> 1), kMinLongitude, kLongitudeRange);
    c.latitude  = cell_centre(squash(bits), kMinLatitude, kLatitudeRange);
    return c;
}

std::optional<Coordinates> decode_score(double score) noexcept {
    if (!(score >= 0.0 && score < kMaxScore) || std::floor(score) != score) {
        return std::nullopt;
    }
    return decode(static_cast<uint64_t>(score));
}

double distance(const Coordinates& a, const Coordinates& b) noexcept {
    const double lat1 = a.latitude * kDegToRad;
    const double lat2 = b.latitude * kDegToRad;
    const double u = std::sin((lat2 - lat1) / 2.0);
    const double v = std::sin((b.longitude - a.longitude) * kDegToRad / 2.0);
    const double h = u * u + std::cos(lat1) * std::cos(lat2) * v * v;
    return 2.0 * kEarthRadiusMeters * std::asin(std::sqrt(h));
}

double latitude_distance(double lat1, double lat2) noexcept {
    return kEarthRadiusMeters * std::fabs((lat2 - lat1) * kDegToRad);
}

bool in_box(const Coordinates& centre, const Coordinates& point,
            double width_m, double height_m) noexcept {
    if (latitude_distance(centre.latitude, point.latitude) > height_m / 2.0) {
        return false;
    }
    const Coordinates same_lat{centre.longitude, point.latitude};
    return distance(same_lat, point) <= width_m / 2.0;
}

std::optional<double> unit_to_meters(std::string_view unit) noexcept {
    auto is = [unit](std::string_view name) {
        if (unit.size() != name.size()) return false;
        for (std::size_t i = 0; i < unit.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(unit[i])) != name[i]) return false;
        }
        return true;
    };
    if (is("m"))  return 1.0;
    if (is("km")) return 1000.0;
    if (is("mi")) return 1609.34;
    if (is("ft")) return 0.3048;
    return std::nullopt;
}

} // namespace tkv::storage::geo
