#define BOOST_TEST_MODULE geodesy
#include <boost/test/unit_test.hpp>

#include "exceptions.hh"
#include "geodesy.hh"

using namespace georange;


static const geo::Coordinate sf(37.774929, -122.419418);
static const geo::Coordinate ny(40.714268, -74.005974);


BOOST_AUTO_TEST_CASE(test_distance_known_cities) {
    BOOST_CHECK_CLOSE(geo::distance(sf, ny), 4139115.06, 0.01);
}

BOOST_AUTO_TEST_CASE(test_distance_one_degree) {
    geo::Coordinate origin(0.0, 0.0);
    BOOST_CHECK_CLOSE(geo::distance(origin, geo::Coordinate(1.0, 0.0)),
            110574.38, 0.01);
    BOOST_CHECK_CLOSE(geo::distance(origin, geo::Coordinate(0.0, 1.0)),
            111319.49, 0.01);
}

BOOST_AUTO_TEST_CASE(test_distance_is_symmetric) {
    BOOST_CHECK_EQUAL(geo::distance(sf, ny), geo::distance(ny, sf));

    geo::Coordinate a(-33.8671390, 151.2071140);
    geo::Coordinate b(51.5001524, -0.1262362);
    BOOST_CHECK_EQUAL(geo::distance(a, b), geo::distance(b, a));
}

BOOST_AUTO_TEST_CASE(test_distance_to_self) {
    BOOST_CHECK_EQUAL(geo::distance(sf, sf), 0.0);
    BOOST_CHECK(geo::distance(sf, geo::Coordinate(37.774930, -122.419418)) > 0.0);
}

BOOST_AUTO_TEST_CASE(test_distance_rejects_bad_coordinate) {
    BOOST_CHECK_THROW(geo::distance(sf, geo::Coordinate(95.0, 0.0)), GeorangeException);
    BOOST_CHECK_THROW(geo::distance(geo::Coordinate(0.0, 200.0), ny), GeorangeException);
}

BOOST_AUTO_TEST_CASE(test_longitude_delta_at_equator) {
    BOOST_CHECK_CLOSE(geo::longitude_delta_at_latitude(111319.4908, 0.0), 1.0, 0.001);
}

BOOST_AUTO_TEST_CASE(test_longitude_delta_widens_towards_poles) {
    double equator = geo::longitude_delta_at_latitude(10000.0, 0.0);
    double north = geo::longitude_delta_at_latitude(10000.0, 60.0);
    double south = geo::longitude_delta_at_latitude(10000.0, -60.0);

    BOOST_CHECK(north > equator);
    BOOST_CHECK_CLOSE(north, south, 1e-9);
}

BOOST_AUTO_TEST_CASE(test_longitude_delta_at_poles) {
    BOOST_CHECK_EQUAL(geo::longitude_delta_at_latitude(1000.0, 90.0), 360.0);
    BOOST_CHECK_EQUAL(geo::longitude_delta_at_latitude(1000.0, -90.0), 360.0);
    BOOST_CHECK_EQUAL(geo::longitude_delta_at_latitude(0.0, 90.0), 0.0);
}

BOOST_AUTO_TEST_CASE(test_longitude_delta_is_capped) {
    BOOST_CHECK_EQUAL(geo::longitude_delta_at_latitude(1e9, 0.0), 360.0);
    BOOST_CHECK_EQUAL(geo::longitude_delta_at_latitude(0.0, 45.0), 0.0);
}

BOOST_AUTO_TEST_CASE(test_wrap_longitude) {
    BOOST_CHECK_EQUAL(geo::wrap_longitude(45.0), 45.0);
    BOOST_CHECK_EQUAL(geo::wrap_longitude(180.0), 180.0);
    BOOST_CHECK_EQUAL(geo::wrap_longitude(-180.0), -180.0);
    BOOST_CHECK_CLOSE(geo::wrap_longitude(190.0), -170.0, 1e-9);
    BOOST_CHECK_CLOSE(geo::wrap_longitude(-190.0), 170.0, 1e-9);
    BOOST_CHECK_CLOSE(geo::wrap_longitude(370.0), 10.0, 1e-9);
    BOOST_CHECK_CLOSE(geo::wrap_longitude(-370.0), -10.0, 1e-9);
}
