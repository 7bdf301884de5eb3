#include "linesegment.hpp"
#include "planarsurface.hpp"
#include "errors.hpp"
#include "debug.hpp"

#include <sstream>


LineSegment::LineSegment(const Vec3& start, const Vec3& end)
: start_point(start), end_point(end), derived(derive(start, end)) {}


LineSegment::Derived LineSegment::derive(const Vec3& start, const Vec3& end) {
  if (start == end) {
    std::ostringstream msg;
    msg << "StartPoint == EndPoint (" << start << ")";
    throw DegenerateGeometryError(msg.str());
  }

  Vec3 v = end - start;
  // UnitVec3 rejects a vector whose norm overflows
  Derived d = { norm(v), UnitVec3(v) };
  return d;
}


LineSegment LineSegment::parse(const std::string& start_text, const std::string& end_text) {
  DEBUG_ENTER(__PRETTY_FUNCTION__);
  Vec3 start = Vec3::parse(start_text),
       end   = Vec3::parse(end_text);
  DEBUG_COUT("Parsed " << start << " -> " << end);
  DEBUG_LEAVE;
  return LineSegment(start, end);
}


Vec3 LineSegment::closest_point_to(const Vec3& p, bool clamp_to_segment) const {
  double t = dot(p - start_point, direction());

  if (clamp_to_segment) {
    if (t < 0)        t = 0;
    if (t > length()) t = length();
  }

  return start_point + t * direction();
}


LineSegment LineSegment::segment_to(const Vec3& p, bool clamp_to_segment) const {
  return LineSegment(closest_point_to(p, clamp_to_segment), p);
}


LineSegment LineSegment::project_on(const PlanarSurface& plane) const {
  return plane.project(*this);
}


boost::optional<Vec3> LineSegment::intersection_with(const PlanarSurface& plane, double tolerance) const {
  return plane.intersection_with(*this, tolerance);
}


bool LineSegment::is_parallel_to(const LineSegment& other) const {
  return direction().is_parallel_to(other.direction(), PARALLEL_DOT_TOL);
}


bool LineSegment::is_parallel_to(const LineSegment& other, double angle_tolerance) const {
  return direction().is_parallel_to_angle(other.direction(), angle_tolerance);
}


bool operator==(const LineSegment& l1, const LineSegment& l2) {
  return l1.start() == l2.start() && l1.end() == l2.end();
}


bool operator!=(const LineSegment& l1, const LineSegment& l2) {
  return !(l1 == l2);
}


std::ostream& operator<<(std::ostream &os, const LineSegment& l) {
  return os << "StartPoint: " << l.start() << ", EndPoint: " << l.end();
}
