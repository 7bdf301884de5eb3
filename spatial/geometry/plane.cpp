#include "plane.hpp"
#include "errors.hpp"
#include "debug.hpp"

#include <sstream>


Plane::Plane(const UnitVec3& normal, double _d)
: n(normal), d(_d) {}


Plane::Plane(const Vec3& root_point, const UnitVec3& normal)
: n(normal), d(-dot(root_point, normal)) {}


Plane Plane::from_points(const Vec3& p1, const Vec3& p2, const Vec3& p3) {
  Vec3 c = cross(p2 - p1, p3 - p1);
  if (c == Vec3::zero()) {
    std::ostringstream msg;
    msg << "Points are collinear: " << p1 << ", " << p2 << ", " << p3;
    throw DegenerateGeometryError(msg.str());
  }
  return Plane(p1, UnitVec3(c));
}


Vec3 Plane::root_point() const {
  return -d * n;
}


double Plane::signed_distance_to(const Vec3& p) const {
  return dot(p, n) + d;
}


Vec3 Plane::project(const Vec3& p) const {
  return p - signed_distance_to(p) * n;
}


LineSegment Plane::project(const LineSegment& l) const {
  return LineSegment(project(l.start()), project(l.end()));
}


boost::optional<Vec3> Plane::intersection_with(const LineSegment& l, double tolerance) const {
  DEBUG_ENTER(__PRETTY_FUNCTION__);
  if (fabs(dot(l.direction(), n)) <= tolerance) {
    DEBUG_COUT("Segment is parallel to the plane.");
    DEBUG_LEAVE;
    return boost::none;
  }

  Vec3   u = l.end() - l.start();
  double t = -signed_distance_to(l.start()) / dot(u, n);
  if (t < 0 || t > 1) {
    DEBUG_COUT("Crossing at t = " << t << " is outside the segment.");
    DEBUG_LEAVE;
    return boost::none;
  }

  DEBUG_LEAVE;
  return l.start() + t * u;
}


bool operator==(const Plane& p1, const Plane& p2) {
  return p1.normal() == p2.normal() && p1.offset() == p2.offset();
}


bool operator!=(const Plane& p1, const Plane& p2) {
  return !(p1 == p2);
}


std::ostream& operator<<(std::ostream &os, const Plane& p) {
  return os << "Plane{normal: " << p.normal() << ", d: " << p.offset() << "}";
}
