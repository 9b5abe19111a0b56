
#include <cmath>
#include <sstream>

#include "config.hh"
#include "exceptions.hh"
#include "geodesy.hh"
#include "region.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


Region
Region::around(const Coordinate& center, double radius)
{
    if(!center.is_valid()) {
        std::stringstream ss;
        ss << "Invalid search center: ("
           << center.latitude << ", " << center.longitude << ")";
        throw GeorangeException(ss.str());
    }

    if(!std::isfinite(radius) || radius < 0.0) {
        std::stringstream ss;
        ss << "Invalid search radius: " << radius;
        throw GeorangeException(ss.str());
    }

    double lat_delta = radius / GEORANGE_METERS_PER_DEGREE_LATITUDE;
    double lat_north = fmin(90.0, center.latitude + lat_delta);
    double lat_south = fmax(-90.0, center.latitude - lat_delta);

    // Meridians converge towards the poles so the wider of the
    // two edges decides the longitude span.
    double lon_delta_north = longitude_delta_at_latitude(radius, lat_north);
    double lon_delta_south = longitude_delta_at_latitude(radius, lat_south);
    double lon_delta = fmax(lon_delta_north, lon_delta_south);

    return Region(center, lat_delta * 2, lon_delta * 2);
}


Region::Region()
{
    this->lat_delta = 0.0;
    this->lon_delta = 0.0;
}


Region::Region(const Coordinate& center, double lat_delta, double lon_delta)
{
    this->center = center;
    this->lat_delta = lat_delta;
    this->lon_delta = lon_delta;
}


double
Region::north() const
{
    return fmin(90.0, this->center.latitude + this->lat_delta / 2);
}


double
Region::south() const
{
    return fmax(-90.0, this->center.latitude - this->lat_delta / 2);
}


double
Region::east() const
{
    // Spans the whole parallel
    if(this->lon_delta >= 360.0) {
        return 180.0;
    }

    return wrap_longitude(this->center.longitude + this->lon_delta / 2);
}


double
Region::west() const
{
    if(this->lon_delta >= 360.0) {
        return -180.0;
    }

    return wrap_longitude(this->center.longitude - this->lon_delta / 2);
}


bool
Region::crosses_antimeridian() const
{
    if(this->lon_delta >= 360.0) {
        return false;
    }

    return this->center.longitude - this->lon_delta / 2 < -180.0
            || this->center.longitude + this->lon_delta / 2 > 180.0;
}


uint32_t
bounding_bits(const Region& region)
{
    double max_bits = (double) GEORANGE_MAX_BITS;
    double bits_lat = max_bits;
    double bits_lon = max_bits;

    if(region.lat_delta > 0.0) {
        double steps = floor(log2(180.0 / (region.lat_delta / 2)));
        bits_lat = fmax(0.0, steps) * 2;
    }

    if(region.lon_delta > 0.0) {
        double steps = floor(log2(360.0 / (region.lon_delta / 2)));
        bits_lon = fmax(1.0, steps) * 2 - 1;
    }

    return (uint32_t) fmin(bits_lat, fmin(bits_lon, max_bits));
}


uint32_t
precision_for_bits(uint32_t bits)
{
    if(bits == 0) {
        return 1;
    }

    return ((bits - 1) / GEORANGE_BITS_PER_CHAR) + 1;
}


GeoHashRange::Vector
candidate_ranges(const Region& region)
{
    uint32_t bits = bounding_bits(region);
    int precision = (int) precision_for_bits(bits);

    double lats[3] = {
        region.center.latitude,
        region.north(),
        region.south()
    };

    double lons[3] = {
        region.center.longitude,
        region.east(),
        region.west()
    };

    GeoHashRange::Vector ret;
    for(int i = 0; i < 3; i++) {
        for(int j = 0; j < 3; j++) {
            std::string hash = encode(Coordinate(lats[i], lons[j]), precision);
            ret.push_back(range_from_hash(hash, bits));
        }
    }

    return ret;
}


GeoHashRange::Vector
queries_for_region(const Region& region)
{
    return merge(candidate_ranges(region));
}


GeoHashRange::Vector
query_bounds(const Coordinate& center, double radius)
{
    return queries_for_region(Region::around(center, radius));
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
