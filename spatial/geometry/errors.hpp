#ifndef __SPATIAL_ERRORS
#define __SPATIAL_ERRORS

#include <stdexcept>
#include <string>


// Thrown when the points defining a primitive coincide (or a normal is zero),
//   so that its length/direction would be undefined.
struct DegenerateGeometryError : public std::invalid_argument {
  explicit DegenerateGeometryError(const std::string& what)
  : std::invalid_argument(what) {}
};


// Thrown when coordinate text does not match the tuple grammar or a captured
//   coordinate does not convert. Carries no finer diagnosis.
struct ParseError : public std::invalid_argument {
  explicit ParseError(const std::string& what)
  : std::invalid_argument(what) {}
};


#endif
