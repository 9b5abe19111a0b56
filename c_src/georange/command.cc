
#include <stdio.h>

#include <sstream>

#include "georange.hh"
#include "command.hh"
#include "config.hh"
#include "exceptions.hh"
#include "geodesy.hh"
#include "geohash.hh"
#include "region.hh"
#include "search.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_CMD_BEGIN


static geo::Coordinate
read_coordinate(io::Reader::Ptr reader, const char* cmd)
{
    if(!reader->read_tuple_n(2)) {
        throw GeorangeException(std::string("Invalid coordinate for ") + cmd);
    }

    double lat;
    double lon;

    if(!reader->read_number(lat)) {
        throw GeorangeException(std::string("Invalid latitude for ") + cmd);
    }

    if(!reader->read_number(lon)) {
        throw GeorangeException(std::string("Invalid longitude for ") + cmd);
    }

    return geo::Coordinate(lat, lon);
}


static double
read_radius(io::Reader::Ptr reader, const char* cmd)
{
    double radius;
    if(!reader->read_number(radius)) {
        throw GeorangeException(std::string("Invalid radius for ") + cmd);
    }

    return radius;
}


io::Writer::Ptr
close_session(Session::Ptr session, io::Reader::Ptr reader)
{
    // Takes a boolean only to fit the two-tuple
    // protocol RPC style.
    bool v;
    if(!reader->read(v)) {
        throw GeorangeException("Invalid argument for close.");
    }

    if(!v) {
        throw GeorangeException("Invalid boolean for close.");
    }

    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->write(v);

    // Send here since we'll skip the normal send
    // with the exception handling.
    writer->send();
    throw GeorangeExit(GEORANGE_OK);
}


io::Writer::Ptr
encode(Session::Ptr session, io::Reader::Ptr reader)
{
    int32_t arity;
    if(!reader->read_tuple(arity)) {
        throw GeorangeException("Invalid argument for encode.");
    }

    if(arity != 2 && arity != 3) {
        throw GeorangeException("Invalid argument arity for encode.");
    }

    double lat;
    double lon;
    int64_t precision = session->get_default_precision();

    if(!reader->read_number(lat)) {
        throw GeorangeException("Invalid latitude for encode.");
    }

    if(!reader->read_number(lon)) {
        throw GeorangeException("Invalid longitude for encode.");
    }

    if(arity == 3 && !reader->read(precision)) {
        throw GeorangeException("Invalid precision for encode.");
    }

    // Checked before narrowing to int.
    if(precision < 1 || precision > GEORANGE_MAX_PRECISION) {
        std::stringstream ss;
        ss << "Invalid precision for encode: " << precision;
        throw GeorangeException(ss.str());
    }

    std::string hash = geo::encode(geo::Coordinate(lat, lon), (int) precision);

    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->write(io::Bytes::copy(hash));

    return writer;
}


io::Writer::Ptr
distance(Session::Ptr session, io::Reader::Ptr reader)
{
    if(!reader->read_tuple_n(2)) {
        throw GeorangeException("Invalid argument for distance.");
    }

    geo::Coordinate a = read_coordinate(reader, "distance");
    geo::Coordinate b = read_coordinate(reader, "distance");

    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->write(geo::distance(a, b));

    return writer;
}


io::Writer::Ptr
query_bounds(Session::Ptr session, io::Reader::Ptr reader)
{
    if(!reader->read_tuple_n(2)) {
        throw GeorangeException("Invalid argument for query_bounds.");
    }

    geo::Coordinate center = read_coordinate(reader, "query_bounds");
    double radius = read_radius(reader, "query_bounds");

    geo::GeoHashRange::Vector bounds = geo::query_bounds(center, radius);
    int32_t count = (int32_t) bounds.size();

    // This encodes {ok, [{Start, End} | ...]}
    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->start_list(count);
    for(int32_t i = 0; i < count; i++) {
        writer->start_tuple(2);
        writer->write(io::Bytes::copy(bounds[i].start.str()));
        writer->write(io::Bytes::copy(bounds[i].end.str()));
    }
    writer->end_list(count);

    return writer;
}


io::Writer::Ptr
region_envelope(Session::Ptr session, io::Reader::Ptr reader)
{
    if(!reader->read_tuple_n(2)) {
        throw GeorangeException("Invalid argument for region_envelope.");
    }

    geo::Coordinate center = read_coordinate(reader, "region_envelope");
    double radius = read_radius(reader, "region_envelope");

    geo::Region region = geo::Region::around(center, radius);
    geo::Geom::Ptr env = session->get_geo_ctx()->make_envelope(region);

    io::Bytes::Ptr data;
    if(session->get_envelope_format() == GEORANGE_ENVELOPE_WKT) {
        data = io::Bytes::copy(env->to_wkt());
    } else {
        data = env->to_wkb();
    }

    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->write(data);

    return writer;
}


io::Writer::Ptr
filter_candidates(Session::Ptr session, io::Reader::Ptr reader)
{
    if(!reader->read_tuple_n(3)) {
        throw GeorangeException("Invalid argument for filter_candidates.");
    }

    geo::Coordinate center = read_coordinate(reader, "filter_candidates");
    double radius = read_radius(reader, "filter_candidates");

    int32_t num_candidates;
    if(!reader->read_list(num_candidates)) {
        throw GeorangeException("Invalid candidate list for filter_candidates.");
    }

    geo::Candidate::Vector candidates;
    for(int32_t i = 0; i < num_candidates; i++) {
        if(!reader->read_tuple_n(2)) {
            throw GeorangeException("Invalid candidate for filter_candidates.");
        }

        io::Bytes::Ptr key = reader->read_bytes();
        if(!key) {
            throw GeorangeException("Invalid candidate key for filter_candidates.");
        }

        geo::Coordinate coord = read_coordinate(reader, "filter_candidates");
        candidates.push_back(geo::Candidate(key->str(), coord));
    }

    if(!reader->read_list_end(num_candidates)) {
        throw GeorangeException("Improper candidate list for filter_candidates.");
    }

    geo::Hit::Vector hits = geo::filter_candidates(center, radius, candidates);
    int32_t count = (int32_t) hits.size();

    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->start_list(count);
    for(int32_t i = 0; i < count; i++) {
        writer->start_tuple(2);
        writer->write(io::Bytes::copy(hits[i].key));
        writer->write(hits[i].distance);
    }
    writer->end_list(count);

    return writer;
}


static io::Writer::Ptr
dispatch(Session::Ptr session, uint64_t op, io::Reader::Ptr reader)
{
    switch(op) {
        case GEORANGE_COMMAND_CLOSE:
            return close_session(session, reader);
        case GEORANGE_COMMAND_ENCODE:
            return encode(session, reader);
        case GEORANGE_COMMAND_DISTANCE:
            return distance(session, reader);
        case GEORANGE_COMMAND_QUERY_BOUNDS:
            return query_bounds(session, reader);
        case GEORANGE_COMMAND_REGION_ENVELOPE:
            return region_envelope(session, reader);
        case GEORANGE_COMMAND_FILTER_CANDIDATES:
            return filter_candidates(session, reader);
        default:
            throw GeorangeException("Unknown command op.");
    }
}


io::Writer::Ptr
handle(Session::Ptr session, io::Reader::Ptr reader)
{
    uint64_t op;

    if(!reader->read_tuple_n(2)) {
        throw GeorangeException("Invalid command tuple.");
    }

    if(!reader->read(op)) {
        throw GeorangeException("Invalid command op.");
    }

    if(!session->is_tracing()) {
        return dispatch(session, op, reader);
    }

    io::Timer timer;
    timer.start();
    io::Writer::Ptr ret = dispatch(session, op, reader);
    fprintf(stderr, "georange: op %llu took %0.3fms\r\n",
            (unsigned long long) op, timer.elapsed_ms());

    return ret;
}


NS_GEORANGE_CMD_END
NS_GEORANGE_END
