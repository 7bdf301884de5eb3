#ifndef __PLANAR_SURFACE
#define __PLANAR_SURFACE

#include <boost/optional.hpp>

#include "linesegment.hpp"


// What a LineSegment needs from a plane. The segment never looks at how the
//   plane is represented; it hands itself to these two operations.
class PlanarSurface {
public:
  virtual ~PlanarSurface() {}

  // Orthogonal projection of both endpoints.
  virtual LineSegment project(const LineSegment& l) const = 0;

  // The point where l crosses the surface, or none if it doesn't (within tolerance).
  virtual boost::optional<Vec3> intersection_with(const LineSegment& l, double tolerance) const = 0;
};


#endif
