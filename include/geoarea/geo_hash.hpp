#pragma once

#include "geoarea/geo_point.hpp"

#include <optional>
#include <string>

namespace geoarea {

constexpr const char* GEOHASH_ALPHABET = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr int GEOHASH_BITS_PER_CHAR = 5;
constexpr int GEOHASH_MAX_BITS_PER_AXIS = 30;

// A geohash string together with the point it was made for. When built from
// a string, the point is the center of the cell.
class GeoHash {
public:
    // Throws std::invalid_argument if the hash is empty or malformed.
    explicit GeoHash(std::string hash);

    // Hash at the maximum resolution (12 characters).
    explicit GeoHash(const Point& point);

    const std::string& hash() const { return hash_; }
    const Point& point() const { return point_; }
    size_t length() const { return hash_.size(); }

    // A hash contains another if it is a prefix of it.
    bool contains(const GeoHash& other) const;

    // Removes characters from the end; nullopt if nothing would be left.
    std::optional<GeoHash> decrease_resolution(size_t chars = 1) const;

    // Truncates to at most length characters. Never adds characters.
    GeoHash set_resolution(size_t length) const;
    GeoHash use_resolution(const GeoHash& other) const { return set_resolution(other.length()); }

    // Hash of another point at the same resolution.
    GeoHash move_to(const Point& point) const;

    static bool is_valid(const std::string& hash);

    // Interleaves bits_per_axis bits of longitude and latitude, longitude
    // first, 5 bits per character. The last character is padded with zeros.
    static std::string encode(double lat, double lon, int bits_per_axis = GEOHASH_MAX_BITS_PER_AXIS);

    // Center of the cell described by the hash.
    static Point decode(const std::string& hash);

    bool operator==(const GeoHash& other) const;
    bool operator!=(const GeoHash& other) const { return !(*this == other); }
    size_t hash_value() const;

private:
    std::string hash_;
    Point point_;
};

std::ostream& operator<<(std::ostream& os, const GeoHash& geo_hash);

} // namespace geoarea

namespace std {
template <>
struct hash<geoarea::GeoHash> {
    size_t operator()(const geoarea::GeoHash& geo_hash) const { return geo_hash.hash_value(); }
};
} // namespace std
