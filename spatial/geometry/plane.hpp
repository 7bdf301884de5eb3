#ifndef __PLANE
#define __PLANE

#include "planarsurface.hpp"


// The plane { p : normal . p + d = 0 }.
class Plane : public PlanarSurface {
public:
  Plane(const UnitVec3& normal, double d);
  Plane(const Vec3& root_point, const UnitVec3& normal);

  // The plane through three points, normal along (p2 - p1) x (p3 - p1).
  // Throws DegenerateGeometryError if the points are collinear.
  static Plane from_points(const Vec3& p1, const Vec3& p2, const Vec3& p3);

  const UnitVec3& normal() const { return n; }
  double          offset() const { return d; }
  Vec3            root_point() const;  // the point of the plane closest to the origin

  double signed_distance_to(const Vec3& p) const;
  Vec3   project(const Vec3& p) const;

  // Throws DegenerateGeometryError if l is perpendicular to the plane
  //   (both endpoints project onto the same point).
  LineSegment project(const LineSegment& l) const override;

  // None if l is parallel to the plane (|direction . normal| <= tolerance, including
  //   a segment lying in the plane) or if the crossing falls outside [start, end].
  boost::optional<Vec3> intersection_with(const LineSegment& l, double tolerance) const override;

private:
  UnitVec3 n;
  double   d;
};


bool operator==(const Plane& p1, const Plane& p2);
bool operator!=(const Plane& p1, const Plane& p2);

std::ostream &operator<<(std::ostream& os, const Plane& p);


#endif
