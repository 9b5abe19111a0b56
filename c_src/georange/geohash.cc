
#include <cmath>

#include <sstream>

#include "base32.hh"
#include "exceptions.hh"
#include "geohash.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


Coordinate::Coordinate()
{
    this->latitude = 0.0;
    this->longitude = 0.0;
}


Coordinate::Coordinate(double latitude, double longitude)
{
    this->latitude = latitude;
    this->longitude = longitude;
}


bool
Coordinate::is_valid() const
{
    if(!std::isfinite(this->latitude) || !std::isfinite(this->longitude)) {
        return false;
    }

    if(this->latitude < -90.0 || this->latitude > 90.0) {
        return false;
    }

    if(this->longitude < -180.0 || this->longitude > 180.0) {
        return false;
    }

    return true;
}


bool
Coordinate::operator==(const Coordinate& other) const
{
    return this->latitude == other.latitude
            && this->longitude == other.longitude;
}


bool
Coordinate::operator!=(const Coordinate& other) const
{
    return !(*this == other);
}


std::string
encode(const Coordinate& coord, int precision)
{
    if(precision < 1) {
        std::stringstream ss;
        ss << "Invalid geohash precision: " << precision;
        throw GeorangeException(ss.str());
    }

    if(!coord.is_valid()) {
        std::stringstream ss;
        ss << "Invalid coordinate: ("
           << coord.latitude << ", " << coord.longitude << ")";
        throw GeorangeException(ss.str());
    }

    double lat_lower = -90.0;
    double lat_upper = 90.0;
    double lon_lower = -180.0;
    double lon_upper = 180.0;

    std::string hash;
    hash.reserve(precision);

    int bit = 1 << (GEORANGE_BITS_PER_CHAR - 1);
    int value = 0;
    bool even = true;

    while(hash.size() < (size_t) precision) {
        if(even) {
            double mid = (lon_lower + lon_upper) / 2;
            if(coord.longitude >= mid) {
                lon_lower = mid;
                value |= bit;
            } else {
                lon_upper = mid;
            }
        } else {
            double mid = (lat_lower + lat_upper) / 2;
            if(coord.latitude >= mid) {
                lat_lower = mid;
                value |= bit;
            } else {
                lat_upper = mid;
            }
        }

        bit >>= 1;
        even = !even;

        if(bit == 0) {
            hash.push_back(base32_value_to_char(value));
            bit = 1 << (GEORANGE_BITS_PER_CHAR - 1);
            value = 0;
        }
    }

    return hash;
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
