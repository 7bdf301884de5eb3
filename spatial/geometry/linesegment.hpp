#ifndef __LINE_SEGMENT
#define __LINE_SEGMENT

#include <boost/optional.hpp>

#include "vec3.hpp"
#include "unitvec3.hpp"


class PlanarSurface;


// A directed segment from start() to end(). start() != end() always holds;
//   length and direction are derived once, when the segment is constructed.
class LineSegment {
public:
  // Throws DegenerateGeometryError if start == end.
  LineSegment(const Vec3& start, const Vec3& end);

  // Parses both points with Vec3::parse, then constructs.
  // Throws ParseError if either text is unparsable, DegenerateGeometryError if the points coincide.
  static LineSegment parse(const std::string& start_text, const std::string& end_text);

  const Vec3& start() const { return start_point; }
  const Vec3& end() const { return end_point; }

  double          length() const { return derived.length; }
  const UnitVec3& direction() const { return derived.direction; }

  // Foot of the perpendicular from p onto the supporting line. With clamp_to_segment
  //   the result is limited to the closed segment [start, end].
  Vec3        closest_point_to(const Vec3& p, bool clamp_to_segment) const;
  // The segment from closest_point_to(p, clamp_to_segment) to p.
  // Throws DegenerateGeometryError if p is its own closest point.
  LineSegment segment_to(const Vec3& p, bool clamp_to_segment) const;

  LineSegment           project_on(const PlanarSurface& plane) const;
  boost::optional<Vec3> intersection_with(const PlanarSurface& plane,
                                          double tolerance = DEFAULT_INTERSECTION_TOL) const;

  // near-exact: directions may differ only by floating point rounding
  bool is_parallel_to(const LineSegment& other) const;
  bool is_parallel_to(const LineSegment& other, double angle_tolerance) const;  // radians

private:
  struct Derived {
    double   length;
    UnitVec3 direction;
  };

  // both values come from the same connecting vector
  static Derived derive(const Vec3& start, const Vec3& end);

  Vec3    start_point;
  Vec3    end_point;
  Derived derived;
};


bool operator==(const LineSegment& l1, const LineSegment& l2);
bool operator!=(const LineSegment& l1, const LineSegment& l2);

std::ostream &operator<<(std::ostream& os, const LineSegment& l);


namespace std {
  template <>
  struct hash<LineSegment> {
    size_t operator()(const LineSegment& l) const {
      hash<Vec3> h;
      return (h(l.start()) * 397) ^ h(l.end());
    }
  };
}


#endif
