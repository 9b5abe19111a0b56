
#ifndef GEORANGE_REGION_HH
#define GEORANGE_REGION_HH


#include "georange.hh"
#include "geohash.hh"
#include "range.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


// Rectangular search area. lat_delta and lon_delta are the full
// spans in degrees, centered on center.
class Region
{
    public:
        // Smallest region that encloses the circle of radius meters
        // around center. Throws GeorangeException for an invalid
        // center or a negative radius.
        static Region around(const Coordinate& center, double radius);

        Region();
        Region(const Coordinate& center, double lat_delta, double lon_delta);

        // Clamped to [-90, 90]
        double north() const;
        double south() const;

        // Wrapped into [-180, 180], or -180 and 180 when the span
        // covers the whole parallel.
        double east() const;
        double west() const;

        bool crosses_antimeridian() const;

        Coordinate center;
        double lat_delta;
        double lon_delta;
};


// Number of geohash bits whose cells are still at least as large
// as the region, capped at GEORANGE_MAX_BITS.
uint32_t bounding_bits(const Region& region);

// Characters needed to hold bits, never less than one.
uint32_t precision_for_bits(uint32_t bits);

// One range per center, edge and corner sample of the region.
GeoHashRange::Vector candidate_ranges(const Region& region);

GeoHashRange::Vector queries_for_region(const Region& region);

GeoHashRange::Vector query_bounds(const Coordinate& center, double radius);


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
