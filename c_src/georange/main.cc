#include <stdio.h>
#include <stdlib.h>

#include "command.hh"
#include "config.hh"
#include "exceptions.hh"
#include "init.hh"
#include "io.hh"
#include "session.hh"


using namespace georange;


void
run(io::Reader::Ptr opts)
{
    io::Reader::Ptr r;
    io::Writer::Ptr w;

    Session::Ptr session = Session::create(opts);

    w = io::Writer::create();
    w->write("ok");
    w->send();

    while((r = io::Reader::recv())) {
        try {
            w = cmd::handle(session, r);
            w->send();
        } catch(GeorangeExit&) {
            throw;
        } catch(std::exception& e) {
            if(session->is_tracing()) {
                fprintf(stderr, "georange: command failed: %s\r\n", e.what());
            }
            w = io::Writer::create();
            w->start_tuple(2);
            w->write("error");
            w->write(io::Bytes::proxy(e.what()));
            w->send();
        }
    }

    exit(GEORANGE_OK);
}


int
main(int argc, const char* argv[])
{
    try {

        init();

        io::Reader::Ptr reader = io::Reader::recv();

        if(reader == NULL) {
            throw GeorangeException("Error getting data from reader.");
        }

        if(!reader->read_tuple_n(2)) {
            throw GeorangeException("Invalid command tuple.");
        }

        std::string cmd;
        if(!reader->read(cmd)) {
            throw GeorangeException("Invalid port command.");
        }

        if(cmd == "run") {
            run(reader);
        } else {
            throw GeorangeException("Unknown port command: " + cmd);
        }
    } catch(GeorangeExit& e) {
        exit(e.code);
    } catch(std::exception& e) {
        fprintf(stderr, "ERROR: %s\r\n", e.what());
        show_stack(0);
        exit(GEORANGE_ERROR_FATAL);
    }

    return GEORANGE_OK;
}
