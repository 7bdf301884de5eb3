#ifndef __SPATIAL_COL_H__
#define __SPATIAL_COL_H__

// ANSI terminal colours for the trace output and the inspection tool

#define C_RESET "\033[0m"

#define C_BOLD   "\033[1m"

#define C_YELLOW  "\033[33m"
#define C_BLUE    "\033[34m"

#define C_BR_RED     "\033[31;1m"
#define C_BR_CYAN    "\033[36;1m"

#endif
