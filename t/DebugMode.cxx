#include "debug.h"

#ifndef NDEBUG
/* the tests never switch accounts */
bool debug_mode = true;
#endif
