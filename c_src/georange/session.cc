
#include <stdlib.h>

#include <sstream>

#include "config.hh"
#include "exceptions.hh"
#include "session.hh"


NS_GEORANGE_BEGIN


bool
env_flag(const char* name)
{
    const char* val = getenv(name);
    if(val == NULL) {
        return false;
    }

    std::string check(val);
    if(check == "" || check == "0" || check == "false") {
        return false;
    }

    return true;
}


Session::Ptr
Session::create()
{
    return Ptr(new Session(GEORANGE_DEFAULT_PRECISION, GEORANGE_ENVELOPE_WKB));
}


Session::Ptr
Session::create(io::Reader::Ptr reader)
{
    int32_t arity;
    if(!reader->read_list(arity)) {
        throw GeorangeException("Invalid session options.");
    }

    int64_t precision = GEORANGE_DEFAULT_PRECISION;
    int envelope_format = GEORANGE_ENVELOPE_WKB;

    for(int32_t i = 0; i < arity; i++) {
        if(!reader->read_tuple_n(2)) {
            throw GeorangeException("Invalid session option tuple.");
        }

        std::string optname;
        if(!reader->read(optname)) {
            throw GeorangeException("Invalid session option name.");
        }

        if(optname == "default_precision") {
            if(!reader->read(precision)) {
                throw GeorangeException("Invalid default precision value.");
            }
        } else if(optname == "envelope_format") {
            std::string fmt;
            if(!reader->read(fmt)) {
                throw GeorangeException("Invalid envelope format value.");
            }

            if(fmt == "wkb") {
                envelope_format = GEORANGE_ENVELOPE_WKB;
            } else if(fmt == "wkt") {
                envelope_format = GEORANGE_ENVELOPE_WKT;
            } else {
                throw GeorangeException("Unknown envelope format: " + fmt);
            }
        } else {
            throw GeorangeException("Unknown session option: " + optname);
        }
    }

    if(!reader->read_list_end(arity)) {
        throw GeorangeException("Improper session option list.");
    }

    if(precision < 1 || precision > GEORANGE_MAX_PRECISION) {
        std::stringstream ss;
        ss << "Default precision out of range: " << precision;
        throw GeorangeException(ss.str());
    }

    return Ptr(new Session(precision, envelope_format));
}


Session::Session(int64_t precision, int envelope_format)
{
    this->default_precision = (int) precision;
    this->envelope_format = envelope_format;
    this->tracing = env_flag("GEORANGE_TRACE");
    this->geo_ctx = geo::Ctx::create();
}


Session::~Session()
{
}


int
Session::get_default_precision()
{
    return this->default_precision;
}


int
Session::get_envelope_format()
{
    return this->envelope_format;
}


bool
Session::is_tracing()
{
    return this->tracing;
}


geo::Ctx::Ptr
Session::get_geo_ctx()
{
    return this->geo_ctx;
}


NS_GEORANGE_END
