#include <execinfo.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include "config.hh"
#include "exceptions.hh"
#include "init.hh"
#include "io.hh"


using namespace georange;


NS_GEORANGE_BEGIN


void
show_stack(int sig)
{
    void* frames[64];
    int size;
    const char* dbg_info = getenv("GEORANGE_DEBUG_INFO");

    if(dbg_info == NULL) {
        fprintf(stderr, "Error: Signal %d\r\n", sig);
    } else {
        fprintf(stderr, "Error: Signal %d :: %s\r\n", sig, dbg_info);
    }

    size = backtrace(frames, 64);
    backtrace_symbols_fd(frames, size, STDERR_FILENO);

    if(sig == 0) {
        return;
    }

    exit(GEORANGE_ERROR_FATAL);
}


static void
init_signals()
{
    signal(SIGINT, show_stack);
    signal(SIGQUIT, show_stack);
    signal(SIGABRT, show_stack);
    signal(SIGBUS, show_stack);
    signal(SIGSEGV, show_stack);
}


static void
init_ei()
{
    if(ei_init() != 0) {
        throw GeorangeException("Error initializing erl_interface.");
    }
}


static void
report_pid()
{
    uint64_t p = (uint64_t) getpid();
    io::Writer::Ptr writer = io::Writer::create();
    writer->start_tuple(2);
    writer->write("ok");
    writer->write(p);
    writer->send();
}


void
init()
{
    init_signals();
    init_ei();
    report_pid();
}


NS_GEORANGE_END
