
#ifndef GEORANGE_COMMAND_HH
#define GEORANGE_COMMAND_HH

#include "georange.hh"
#include "io.hh"
#include "session.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_CMD_BEGIN


io::Writer::Ptr handle(Session::Ptr session, io::Reader::Ptr req);


NS_GEORANGE_CMD_END
NS_GEORANGE_END


#endif
