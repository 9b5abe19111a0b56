
#ifndef GEORANGE_GEODESY_HH
#define GEORANGE_GEODESY_HH


#include "georange.hh"
#include "geohash.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


// Geodesic surface distance in meters on the reference
// ellipsoid (equatorial radius 6378137m, e^2 0.00669447819799).
double distance(const Coordinate& a, const Coordinate& b);

// Degrees of longitude spanned by distance meters at the
// given latitude. Capped at 360.
double longitude_delta_at_latitude(double distance, double latitude);

// Brings any longitude back into [-180, 180].
double wrap_longitude(double longitude);


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
