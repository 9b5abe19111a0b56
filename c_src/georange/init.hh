
#ifndef GEORANGE_INIT_HH
#define GEORANGE_INIT_HH


#include "georange.hh"


NS_GEORANGE_BEGIN


void show_stack(int sig);
void init();


NS_GEORANGE_END


#endif
