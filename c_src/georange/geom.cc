
#include <string>
#include <sstream>

#include "exceptions.hh"
#include "geom.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


Geom::Geom(Ctx::Ptr ctx, GEOSGeometry* g)
{
    this->ctx = ctx;
    this->g = g;
}


Geom::~Geom()
{
    GEOSGeom_destroy_r(this->ctx->ctx, this->g);
}


std::string
Geom::to_wkt()
{
    char* data = GEOSGeomToWKT_r(this->ctx->ctx, this->g);
    this->ctx->check(data != NULL, "Error writing WKT");
    std::string ret(data);
    GEOSFree_r(this->ctx->ctx, data);
    return ret;
}


io::Bytes::Ptr
Geom::to_wkb()
{
    GEOSWKBWriter* writer = GEOSWKBWriter_create_r(this->ctx->ctx);
    this->ctx->check(writer != NULL, "Error creating WKB writer");

    GEOSWKBWriter_setOutputDimension_r(this->ctx->ctx, writer, 2);

    size_t wkblen = 0;
    unsigned char* wkb = GEOSWKBWriter_write_r(
            this->ctx->ctx, writer, this->g, &wkblen);
    GEOSWKBWriter_destroy_r(this->ctx->ctx, writer);

    this->ctx->check(wkb != NULL, "Error writing WKB");

    io::Bytes::Ptr ret = io::Bytes::copy(wkb, (uint32_t) wkblen);
    GEOSFree_r(this->ctx->ctx, wkb);

    return ret;
}


int
Geom::get_type()
{
    int type = GEOSGeomTypeId_r(this->ctx->ctx, this->g);
    this->ctx->check(type >= 0, "Error reading geometry type");
    return type;
}


int
Geom::get_num_geometries()
{
    int num = GEOSGetNumGeometries_r(this->ctx->ctx, this->g);
    this->ctx->check(num >= 0, "Error counting geometries");
    return num;
}


bool
Geom::is_valid()
{
    char ret = GEOSisValid_r(this->ctx->ctx, this->g);
    this->ctx->check(ret != 2, "Error checking geometry validity");
    return ret == 1;
}


bool
Geom::is_empty()
{
    char ret = GEOSisEmpty_r(this->ctx->ctx, this->g);
    this->ctx->check(ret != 2, "Error checking for an empty geometry");
    return ret == 1;
}


double
Geom::area()
{
    double area = 0.0;
    int ret = GEOSArea_r(this->ctx->ctx, this->g, &area);
    this->ctx->check(ret != 0, "Error calculating area");
    return area;
}


Ctx::Ptr
Ctx::create()
{
    return Ptr(new Ctx());
}


Ctx::Ctx()
{
    this->ctx = GEOS_init_r();
    if(this->ctx == NULL) {
        throw std::bad_alloc();
    }

    GEOSContext_setErrorMessageHandler_r(this->ctx, Ctx::on_error, this);
}


Ctx::~Ctx()
{
    GEOS_finish_r(this->ctx);
}


void
Ctx::on_error(const char* msg, void* userdata)
{
    Ctx* self = static_cast<Ctx*>(userdata);
    self->last_error = msg;
}


void
Ctx::check(bool ok, const char* what)
{
    if(ok) {
        this->last_error.clear();
        return;
    }

    std::stringstream ss;
    ss << what;
    if(!this->last_error.empty()) {
        ss << ": " << this->last_error;
        this->last_error.clear();
    }

    throw GeoException(ss.str());
}


Geom::Ptr
Ctx::make_rectangle(double west, double south, double east, double north)
{
    return this->wrap(this->make_rectangle_int(west, south, east, north));
}


Geom::Ptr
Ctx::make_envelope(const Region& region)
{
    double north = region.north();
    double south = region.south();

    if(!region.crosses_antimeridian()) {
        return this->make_rectangle(region.west(), south, region.east(), north);
    }

    GEOSGeometry* parts[2];
    parts[0] = this->make_rectangle_int(region.west(), south, 180.0, north);

    try {
        parts[1] = this->make_rectangle_int(-180.0, south, region.east(), north);
    } catch(GeoException&) {
        GEOSGeom_destroy_r(this->ctx, parts[0]);
        throw;
    }

    GEOSGeometry* multi = GEOSGeom_createCollection_r(
            this->ctx, GEOS_MULTIPOLYGON, parts, 2);

    if(multi == NULL) {
        // Only destroy the parts if the collection failed
        // to take ownership.
        GEOSGeom_destroy_r(this->ctx, parts[0]);
        GEOSGeom_destroy_r(this->ctx, parts[1]);
    }

    this->check(multi != NULL, "Error creating antimeridian envelope");

    return this->wrap(multi);
}


GEOSGeometry*
Ctx::make_rectangle_int(double west, double south, double east, double north)
{
    GEOSCoordSequence* cs = GEOSCoordSeq_create_r(this->ctx, 2, 2);
    this->check(cs != NULL, "Error creating rectangle coordinates");

    bool ok = GEOSCoordSeq_setOrdinate_r(this->ctx, cs, 0, 0, west)
            && GEOSCoordSeq_setOrdinate_r(this->ctx, cs, 0, 1, south)
            && GEOSCoordSeq_setOrdinate_r(this->ctx, cs, 1, 0, east)
            && GEOSCoordSeq_setOrdinate_r(this->ctx, cs, 1, 1, north);

    if(!ok) {
        GEOSCoordSeq_destroy_r(this->ctx, cs);
        this->check(false, "Error setting rectangle coordinates");
    }

    GEOSGeometry* ls = GEOSGeom_createLineString_r(this->ctx, cs);
    if(ls == NULL) {
        // Only destroy CS if the geometry constructor failed
        // to take ownership.
        GEOSCoordSeq_destroy_r(this->ctx, cs);
        this->check(false, "Error creating rectangle diagonal");
    }

    // The envelope of the diagonal is the rectangle itself, or a
    // point when the rectangle has no extent.
    GEOSGeometry* env = GEOSEnvelope_r(this->ctx, ls);
    GEOSGeom_destroy_r(this->ctx, ls);

    this->check(env != NULL, "Error creating rectangle");

    return env;
}


Geom::Ptr
Ctx::wrap(GEOSGeometry* g)
{
    return Geom::Ptr(new Geom(this->shared_from_this(), g));
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
