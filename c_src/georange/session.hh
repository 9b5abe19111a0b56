
#ifndef GEORANGE_SESSION_HH
#define GEORANGE_SESSION_HH


#include "georange.hh"
#include "geom.hh"
#include "io.hh"


NS_GEORANGE_BEGIN


// Settings the host passes with {run, Options} plus the state
// shared by every command of a port.
class Session
{
    public:
        typedef std::shared_ptr<Session> Ptr;

        static Ptr create();
        static Ptr create(io::Reader::Ptr reader);
        ~Session();

        int get_default_precision();
        int get_envelope_format();
        bool is_tracing();

        geo::Ctx::Ptr get_geo_ctx();

    private:
        Session();
        Session(int64_t precision, int envelope_format);
        Session(const Session& other);

        int default_precision;
        int envelope_format;
        bool tracing;
        geo::Ctx::Ptr geo_ctx;
};


bool env_flag(const char* name);


NS_GEORANGE_END


#endif
