#include <execinfo.h>
#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>

#include "linesegment.hpp"
#include "errors.hpp"
#include "serialization.hpp"
#include "col.hpp"

namespace SD = Serialization;

using std::cerr;
using std::cout;


void sighandler(int sig) {
  void* stack[20];
  int size;

  size = backtrace(stack, 20);

  cerr << "\n\nReceived signal " << C_BOLD << sig << C_RESET << ". Stack trace:\n" << std::flush;
  backtrace_symbols_fd(stack, size, STDERR_FILENO);
  exit(1);
}


static void usage(const char* argv0) {
  cerr << "Usage: " << argv0 << " START END [POINT]\n"
       << "  START, END, POINT are coordinate triples such as \"1, 2, 3\" or \"(1,5; 2; 3)\".\n"
       << "  Prints the segment's derived properties and serialized form, and with POINT\n"
       << "  the closest points to POINT on the segment and on its supporting line.\n";
}


int main(int argc, char* argv[]) {
  signal(SIGSEGV, sighandler);

  if (argc != 3 && argc != 4) {
    usage(argv[0]);
    return 2;
  }

  try {
    auto line = LineSegment::parse(argv[1], argv[2]);

    cout << C_BOLD << line << C_RESET << "\n";
    cout << "  length:    " << line.length() << "\n";
    cout << "  direction: " << line.direction() << "\n";
    cout << "  record:    " << SD::serialize(line) << "\n";

    if (argc == 4) {
      auto p = Vec3::parse(argv[3]);
      cout << "  closest to " << p << ":\n";
      cout << "    on segment: " << line.closest_point_to(p, true) << "\n";
      cout << "    on line:    " << line.closest_point_to(p, false) << "\n";
    }
  } catch (const ParseError& e) {
    cerr << C_BR_RED << "Parse error: " << C_RESET << e.what() << "\n";
    return 1;
  } catch (const DegenerateGeometryError& e) {
    cerr << C_BR_RED << "Degenerate geometry: " << C_RESET << e.what() << "\n";
    return 1;
  }

  cout << std::flush;
  return 0;
}
