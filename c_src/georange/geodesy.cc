
#include <cmath>
#include <sstream>

#include <CsMap/cs_map.h>

#include "config.hh"
#include "exceptions.hh"
#include "geodesy.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


static void
check_coordinate(const Coordinate& c)
{
    if(!c.is_valid()) {
        std::stringstream ss;
        ss << "Invalid coordinate for distance: ("
           << c.latitude << ", " << c.longitude << ")";
        throw GeorangeException(ss.str());
    }
}


double
distance(const Coordinate& a, const Coordinate& b)
{
    check_coordinate(a);
    check_coordinate(b);

    if(a == b) {
        return 0.0;
    }

    // The inverse solution isn't bit-for-bit symmetric so
    // always solve from the smaller of the two points.
    const Coordinate* from = &a;
    const Coordinate* to = &b;
    if(b.latitude < a.latitude ||
            (b.latitude == a.latitude && b.longitude < a.longitude)) {
        from = &b;
        to = &a;
    }

    // CS-MAP takes [longitude, latitude, height]
    double ll_from[3];
    double ll_to[3];

    ll_from[0] = from->longitude;
    ll_from[1] = from->latitude;
    ll_from[2] = 0.0;

    ll_to[0] = to->longitude;
    ll_to[1] = to->latitude;
    ll_to[2] = 0.0;

    double dist = 0.0;
    CS_llazdd(GEORANGE_EARTH_EQ_RADIUS, GEORANGE_EARTH_E2, ll_from, ll_to, &dist);

    if(!std::isfinite(dist) || dist < 0.0) {
        throw GeoException("Error calculating the geodesic distance.");
    }

    return dist;
}


double
longitude_delta_at_latitude(double distance, double latitude)
{
    double radians = latitude * M_PI / 180.0;
    double sin_lat = sin(radians);

    // Length of one degree of longitude along this parallel.
    double numerator = cos(radians) * GEORANGE_EARTH_EQ_RADIUS * M_PI / 180.0;
    double denominator = 1.0 / sqrt(1.0 - GEORANGE_EARTH_E2 * sin_lat * sin_lat);
    double meters_per_degree = numerator * denominator;

    if(meters_per_degree < GEORANGE_EPSILON) {
        return distance > 0.0 ? 360.0 : 0.0;
    }

    return fmin(360.0, distance / meters_per_degree);
}


double
wrap_longitude(double longitude)
{
    if(longitude >= -180.0 && longitude <= 180.0) {
        return longitude;
    }

    double adjusted = longitude + 180.0;
    if(adjusted > 0.0) {
        return fmod(adjusted, 360.0) - 180.0;
    } else {
        return 180.0 - fmod(-adjusted, 360.0);
    }
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
