#include "geoarea/geo_hash.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace geoarea {

namespace {
constexpr int NOT_IN_ALPHABET = -1;

const std::array<int, 256>& alphabet_lookup() {
    static const std::array<int, 256> lookup = [] {
        std::array<int, 256> table;
        table.fill(NOT_IN_ALPHABET);
        for (int i = 0; i < 32; i++) {
            table[static_cast<unsigned char>(GEOHASH_ALPHABET[i])] = i;
        }
        return table;
    }();
    return lookup;
}

int char_value(char c) {
    return alphabet_lookup()[static_cast<unsigned char>(c)];
}
}

GeoHash::GeoHash(std::string hash)
    : hash_(std::move(hash))
    , point_(decode(hash_)) {}

GeoHash::GeoHash(const Point& point)
    : hash_(encode(point.lat(), point.lon()))
    , point_(point) {}

bool GeoHash::contains(const GeoHash& other) const {
    return other.hash_.compare(0, hash_.size(), hash_) == 0;
}

std::optional<GeoHash> GeoHash::decrease_resolution(size_t chars) const {
    if (chars >= hash_.size()) return std::nullopt;
    return GeoHash(hash_.substr(0, hash_.size() - chars));
}

GeoHash GeoHash::set_resolution(size_t length) const {
    if (length == 0) {
        throw std::invalid_argument("GeoHash resolution must be > 0");
    }
    return GeoHash(hash_.substr(0, length));
}

GeoHash GeoHash::move_to(const Point& point) const {
    return GeoHash(encode(point.lat(), point.lon()).substr(0, hash_.size()));
}

bool GeoHash::is_valid(const std::string& hash) {
    if (hash.empty()) return false;
    for (char c : hash) {
        if (char_value(c) == NOT_IN_ALPHABET) return false;
    }
    return true;
}

std::string GeoHash::encode(double lat, double lon, int bits_per_axis) {
    if (bits_per_axis < 1 || bits_per_axis > GEOHASH_MAX_BITS_PER_AXIS) {
        throw std::invalid_argument("Bits per axis not in [1, 30]: " +
                                    std::to_string(bits_per_axis));
    }
    double lat_min = -90.0, lat_max = 90.0;
    double lon_min = -180.0, lon_max = 180.0;

    uint64_t bits = 0;
    int total_bits = bits_per_axis * 2;
    for (int i = 0; i < total_bits; i++) {
        bits <<= 1;
        if (i % 2 == 0) {
            double mid = (lon_min + lon_max) / 2.0;
            if (lon >= mid) {
                bits |= 1;
                lon_min = mid;
            } else {
                lon_max = mid;
            }
        } else {
            double mid = (lat_min + lat_max) / 2.0;
            if (lat >= mid) {
                bits |= 1;
                lat_min = mid;
            } else {
                lat_max = mid;
            }
        }
    }

    int chars = (total_bits + GEOHASH_BITS_PER_CHAR - 1) / GEOHASH_BITS_PER_CHAR;
    bits <<= (chars * GEOHASH_BITS_PER_CHAR - total_bits);

    std::string hash(chars, '0');
    for (int i = chars - 1; i >= 0; i--) {
        hash[i] = GEOHASH_ALPHABET[bits & 0x1f];
        bits >>= GEOHASH_BITS_PER_CHAR;
    }
    return hash;
}

Point GeoHash::decode(const std::string& hash) {
    if (hash.empty()) {
        throw std::invalid_argument("GeoHash must not be empty");
    }
    double lat_min = -90.0, lat_max = 90.0;
    double lon_min = -180.0, lon_max = 180.0;

    bool is_lon = true;
    for (char c : hash) {
        int value = char_value(c);
        if (value == NOT_IN_ALPHABET) {
            throw std::invalid_argument("Invalid GeoHash character '" + std::string(1, c) +
                                        "' in: " + hash);
        }
        for (int bit = GEOHASH_BITS_PER_CHAR - 1; bit >= 0; bit--) {
            bool set = (value >> bit) & 1;
            if (is_lon) {
                double mid = (lon_min + lon_max) / 2.0;
                (set ? lon_min : lon_max) = mid;
            } else {
                double mid = (lat_min + lat_max) / 2.0;
                (set ? lat_min : lat_max) = mid;
            }
            is_lon = !is_lon;
        }
    }
    return Point((lat_min + lat_max) / 2.0, (lon_min + lon_max) / 2.0);
}

bool GeoHash::operator==(const GeoHash& other) const {
    return hash_ == other.hash_ && point_ == other.point_;
}

size_t GeoHash::hash_value() const {
    size_t seed = std::hash<std::string>{}(hash_);
    detail::hash_combine(seed, point_.hash());
    return seed;
}

std::ostream& operator<<(std::ostream& os, const GeoHash& geo_hash) {
    return os << "GeoHash(" << geo_hash.hash() << ", " << geo_hash.point() << ")";
}

} // namespace geoarea
