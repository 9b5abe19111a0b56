// Licensed under the Apache License, Version 2.0 (the "License"); you may not
// use this file except in compliance with the License. You may obtain a copy of
// the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef GEORANGE_GEOM_HH
#define GEORANGE_GEOM_HH


// Prevent the misuse of non thread-safe GEOS functions
#define GEOS_USE_ONLY_R_API


#include <geos_c.h>

#include "georange.hh"
#include "io.hh"
#include "region.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


typedef GEOSContextHandle_t GEOSCtx;


class Ctx;


class Geom
{
    public:
        typedef std::shared_ptr<Geom> Ptr;

        ~Geom();

        std::string to_wkt();
        io::Bytes::Ptr to_wkb();

        int get_type();
        int get_num_geometries();

        bool is_valid();
        bool is_empty();

        double area();

    private:
        Geom();
        Geom(std::shared_ptr<Ctx> ctx, GEOSGeometry* g);
        Geom(const Geom& other);

        std::shared_ptr<Ctx> ctx;
        GEOSGeometry* g;

        friend class Ctx;
};


class Ctx: public std::enable_shared_from_this<Ctx>
{
    public:
        typedef std::shared_ptr<Ctx> Ptr;

        static Ptr create();
        ~Ctx();

        // Axis aligned rectangle in longitude/latitude degrees.
        Geom::Ptr make_rectangle(double west, double south,
                double east, double north);

        // The region as a POLYGON, or a MULTIPOLYGON of the two
        // halves when it crosses the antimeridian.
        Geom::Ptr make_envelope(const Region& region);

    private:
        Ctx();
        Ctx(const Ctx& other);

        static void on_error(const char* msg, void* userdata);

        GEOSGeometry* make_rectangle_int(double west, double south,
                double east, double north);

        Geom::Ptr wrap(GEOSGeometry* g);
        void check(bool ok, const char* what);

        GEOSCtx ctx;
        std::string last_error;

        friend class Geom;
};


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
