#ifndef __SPATIAL_DEBUG
#define __SPATIAL_DEBUG

#include <cstdint>
#include <iostream>
#include "col.hpp"

// Call tracing for the geometry and parsing code.
// Build with -DDEBUG to get DEBUG_COUT messages on stderr, and additionally with
//   -DDEBUG_PRINT to get the indented enter/leave tree.

#ifdef DEBUG

void __debug_incr_stack();
void __debug_decr_stack();
int64_t __debug_stack();

#ifdef DEBUG_PRINT

#define DEBUG_ENTER(x) __debug_incr_stack(); for (int64_t ___it = 0; ___it < __debug_stack(); ___it++) { std::cerr << (___it+1 == __debug_stack() ? "   " C_BLUE "╭╴ " C_RESET : "   " C_BLUE "│" C_RESET); } { std::cerr << C_BOLD << C_BR_CYAN << x << C_RESET << "\n"; }
#define DEBUG_LEAVE for (int64_t ___it = 0; ___it < __debug_stack(); ___it++) { std::cerr << (___it+1 == __debug_stack() ? "   " C_BLUE "╰╴ " C_RESET : "   " C_BLUE "│" C_RESET); } std::cerr << "\n" << std::flush; __debug_decr_stack();
#define DEBUG_COUT(x) for (int64_t ___it = 0; ___it < __debug_stack(); ___it++) { std::cerr << "   " C_BLUE "│" C_RESET; } { std::cerr << x << "\n"; }

#else

#define DEBUG_ENTER(x)
#define DEBUG_LEAVE
#define DEBUG_COUT(x) std::cerr << C_YELLOW << x << C_RESET << std::endl;

#endif

#else

#define DEBUG_ENTER(x)
#define DEBUG_LEAVE
#define DEBUG_COUT(x)

#endif


#endif
