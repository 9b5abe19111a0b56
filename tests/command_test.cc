#define BOOST_TEST_MODULE command
#include <boost/test/unit_test.hpp>

#include "command.hh"
#include "config.hh"
#include "exceptions.hh"
#include "io.hh"
#include "session.hh"

using namespace georange;


static io::Writer::Ptr
request(uint64_t op)
{
    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write(op);
    return writer;
}


static void
write_coordinate(io::Writer::Ptr writer, double lat, double lon)
{
    writer->start_tuple(2);
    writer->write(lat);
    writer->write(lon);
}


static io::Reader::Ptr
call(Session::Ptr session, io::Writer::Ptr req)
{
    io::Reader::Ptr reader = io::Reader::create(req->serialize());
    io::Writer::Ptr resp = cmd::handle(session, reader);
    return io::Reader::create(resp->serialize());
}


// Reads the {ok, _} wrapper of a reply.
static void
expect_ok(io::Reader::Ptr reply)
{
    std::string status;
    BOOST_REQUIRE(reply->read_tuple_n(2));
    BOOST_REQUIRE(reply->read(status));
    BOOST_REQUIRE_EQUAL(status, "ok");
}


static Session::Ptr
session_with(const char* name, const char* atom_value, int64_t int_value)
{
    io::Writer::Ptr opts = io::Writer::create();
    opts->start_list(1);
    opts->start_tuple(2);
    opts->write(name);
    if(atom_value != NULL) {
        opts->write(atom_value);
    } else {
        opts->write(int_value);
    }
    opts->end_list(1);

    return Session::create(io::Reader::create(opts->serialize()));
}


BOOST_AUTO_TEST_CASE(test_encode_default_precision) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
    write_coordinate(req, 40.56230175831099, -74.5975943979423);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    std::string hash;
    BOOST_REQUIRE(reply->read(hash));
    BOOST_CHECK_EQUAL(hash, "dr4yy2psw1");
}

BOOST_AUTO_TEST_CASE(test_encode_with_precision) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
    req->start_tuple(3);
    req->write(40.56230175831099);
    req->write(-74.5975943979423);
    req->write((int64_t) 3);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    std::string hash;
    BOOST_REQUIRE(reply->read(hash));
    BOOST_CHECK_EQUAL(hash, "dr4");
}

BOOST_AUTO_TEST_CASE(test_encode_session_precision) {
    Session::Ptr session = session_with("default_precision", NULL, 5);
    BOOST_CHECK_EQUAL(session->get_default_precision(), 5);

    io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
    write_coordinate(req, 40.56230175831099, -74.5975943979423);

    io::Reader::Ptr reply = call(session, req);
    expect_ok(reply);

    std::string hash;
    BOOST_REQUIRE(reply->read(hash));
    BOOST_CHECK_EQUAL(hash, "dr4yy");
}

BOOST_AUTO_TEST_CASE(test_encode_integer_coordinates) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
    req->start_tuple(3);
    req->write((int64_t) 0);
    req->write((int64_t) 0);
    req->write((int64_t) 4);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    std::string hash;
    BOOST_REQUIRE(reply->read(hash));
    BOOST_CHECK_EQUAL(hash, "s000");
}

BOOST_AUTO_TEST_CASE(test_encode_rejects_bad_precision) {
    Session::Ptr session = Session::create();
    const int64_t bad[3] = {0, -1, GEORANGE_MAX_PRECISION + 1};

    for(int i = 0; i < 3; i++) {
        io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
        req->start_tuple(3);
        req->write(10.0);
        req->write(20.0);
        req->write(bad[i]);

        BOOST_CHECK_THROW(call(session, req), GeorangeException);
    }
}

BOOST_AUTO_TEST_CASE(test_encode_rejects_precision_wider_than_int) {
    Session::Ptr session = Session::create();

    // Both truncate to 1 when narrowed to 32 bits.
    const int64_t bad[2] = {-4294967295LL, 4294967297LL};

    for(int i = 0; i < 2; i++) {
        io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
        req->start_tuple(3);
        req->write(10.0);
        req->write(20.0);
        req->write(bad[i]);

        BOOST_CHECK_THROW(call(session, req), GeorangeException);
    }
}

BOOST_AUTO_TEST_CASE(test_encode_rejects_bad_coordinate) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_ENCODE);
    write_coordinate(req, 100.0, 20.0);
    BOOST_CHECK_THROW(call(Session::create(), req), GeorangeException);

    req = request(GEORANGE_COMMAND_ENCODE);
    req->start_tuple(2);
    req->write("north");
    req->write(20.0);
    BOOST_CHECK_THROW(call(Session::create(), req), GeorangeException);
}

BOOST_AUTO_TEST_CASE(test_distance) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_DISTANCE);
    req->start_tuple(2);
    write_coordinate(req, 37.774929, -122.419418);
    write_coordinate(req, 40.714268, -74.005974);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    double meters;
    BOOST_REQUIRE(reply->read(meters));
    BOOST_CHECK_CLOSE(meters, 4139115.06, 0.01);
}

BOOST_AUTO_TEST_CASE(test_query_bounds) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_QUERY_BOUNDS);
    req->start_tuple(2);
    write_coordinate(req, 40.5623, -74.5976);
    req->write(4828.03);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    const char* expect[2][2] = {
        {"dr4ys", "dr4y~"},
        {"dr4zh", "dr4zs"}
    };

    int32_t count;
    BOOST_REQUIRE(reply->read_list(count));
    BOOST_REQUIRE_EQUAL(count, 2);
    for(int32_t i = 0; i < count; i++) {
        std::string start;
        std::string end;
        BOOST_REQUIRE(reply->read_tuple_n(2));
        BOOST_REQUIRE(reply->read(start));
        BOOST_REQUIRE(reply->read(end));
        BOOST_CHECK_EQUAL(start, expect[i][0]);
        BOOST_CHECK_EQUAL(end, expect[i][1]);
    }
    BOOST_REQUIRE(reply->read_list_end(count));
    BOOST_CHECK(reply->at_end());
}

BOOST_AUTO_TEST_CASE(test_query_bounds_integer_radius) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_QUERY_BOUNDS);
    req->start_tuple(2);
    write_coordinate(req, 0.0, 0.0);
    req->write((int64_t) 30000000);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    int32_t count;
    std::string start;
    std::string end;
    BOOST_REQUIRE(reply->read_list(count));
    BOOST_REQUIRE_EQUAL(count, 1);
    BOOST_REQUIRE(reply->read_tuple_n(2));
    BOOST_REQUIRE(reply->read(start));
    BOOST_REQUIRE(reply->read(end));
    BOOST_CHECK_EQUAL(start, "");
    BOOST_CHECK_EQUAL(end, "~");
}

BOOST_AUTO_TEST_CASE(test_query_bounds_rejects_negative_radius) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_QUERY_BOUNDS);
    req->start_tuple(2);
    write_coordinate(req, 0.0, 0.0);
    req->write(-1.0);

    BOOST_CHECK_THROW(call(Session::create(), req), GeorangeException);
}

BOOST_AUTO_TEST_CASE(test_region_envelope_wkb) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_REGION_ENVELOPE);
    req->start_tuple(2);
    write_coordinate(req, 40.5623, -74.5976);
    req->write(4828.03);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    io::Bytes::Ptr wkb = reply->read_bytes();
    BOOST_REQUIRE(wkb);
    BOOST_CHECK_EQUAL(wkb->size(), 93u);
}

BOOST_AUTO_TEST_CASE(test_region_envelope_wkt) {
    Session::Ptr session = session_with("envelope_format", "wkt", 0);
    BOOST_CHECK_EQUAL(session->get_envelope_format(), GEORANGE_ENVELOPE_WKT);

    io::Writer::Ptr req = request(GEORANGE_COMMAND_REGION_ENVELOPE);
    req->start_tuple(2);
    write_coordinate(req, 0.0, 179.99);
    req->write(5000.0);

    io::Reader::Ptr reply = call(session, req);
    expect_ok(reply);

    std::string wkt;
    BOOST_REQUIRE(reply->read(wkt));
    BOOST_CHECK_EQUAL(wkt.find("MULTIPOLYGON"), 0u);
}

BOOST_AUTO_TEST_CASE(test_filter_candidates) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_FILTER_CANDIDATES);
    req->start_tuple(3);
    write_coordinate(req, 40.5623, -74.5976);
    req->write(4828.03);
    req->start_list(4);

    req->start_tuple(2);
    req->write(io::Bytes::copy(std::string("middle")));
    write_coordinate(req, 40.57, -74.5976);

    req->start_tuple(2);
    req->write(io::Bytes::copy(std::string("outside")));
    write_coordinate(req, 40.62, -74.5976);

    req->start_tuple(2);
    req->write(io::Bytes::copy(std::string("near")));
    write_coordinate(req, 40.5624, -74.5976);

    req->start_tuple(2);
    req->write(io::Bytes::copy(std::string("middle")));
    write_coordinate(req, 40.5623, -74.5976);

    req->end_list(4);

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);

    int32_t count;
    BOOST_REQUIRE(reply->read_list(count));
    BOOST_REQUIRE_EQUAL(count, 2);

    const char* keys[2] = {"near", "middle"};
    double last = 0.0;
    for(int32_t i = 0; i < count; i++) {
        std::string key;
        double meters;
        BOOST_REQUIRE(reply->read_tuple_n(2));
        BOOST_REQUIRE(reply->read(key));
        BOOST_REQUIRE(reply->read(meters));
        BOOST_CHECK_EQUAL(key, keys[i]);
        BOOST_CHECK(meters >= last);
        last = meters;
    }
    BOOST_REQUIRE(reply->read_list_end(count));
}

BOOST_AUTO_TEST_CASE(test_filter_candidates_empty) {
    io::Writer::Ptr req = request(GEORANGE_COMMAND_FILTER_CANDIDATES);
    req->start_tuple(3);
    write_coordinate(req, 40.5623, -74.5976);
    req->write(4828.03);
    req->write_empty_list();

    io::Reader::Ptr reply = call(Session::create(), req);
    expect_ok(reply);
    BOOST_CHECK(reply->read_empty_list());
}

BOOST_AUTO_TEST_CASE(test_unknown_op) {
    io::Writer::Ptr req = request(99);
    req->write(true);
    BOOST_CHECK_THROW(call(Session::create(), req), GeorangeException);
}

BOOST_AUTO_TEST_CASE(test_bad_request_shape) {
    io::Writer::Ptr req = io::Writer::create();
    req->write("encode");
    BOOST_CHECK_THROW(call(Session::create(), req), GeorangeException);
}

BOOST_AUTO_TEST_CASE(test_session_options) {
    Session::Ptr session = Session::create();
    BOOST_CHECK_EQUAL(session->get_default_precision(), GEORANGE_DEFAULT_PRECISION);
    BOOST_CHECK_EQUAL(session->get_envelope_format(), GEORANGE_ENVELOPE_WKB);
    BOOST_CHECK(session->get_geo_ctx());

    io::Writer::Ptr opts = io::Writer::create();
    opts->write_empty_list();
    session = Session::create(io::Reader::create(opts->serialize()));
    BOOST_CHECK_EQUAL(session->get_default_precision(), GEORANGE_DEFAULT_PRECISION);

    BOOST_CHECK_THROW(session_with("bogus", "true", 0), GeorangeException);
    BOOST_CHECK_THROW(session_with("default_precision", NULL, 0), GeorangeException);
    BOOST_CHECK_THROW(session_with("default_precision", NULL, 30), GeorangeException);
    BOOST_CHECK_THROW(session_with("envelope_format", "geojson", 0), GeorangeException);
}
