#ifndef __UNITVEC3
#define __UNITVEC3

#include "vec3.hpp"


// A direction: a Vec3 of length 1. Only obtainable by normalizing a nonzero vector.
class UnitVec3 {
public:
  // Throws DegenerateGeometryError if v is zero (or not finite).
  explicit UnitVec3(const Vec3& v);

  static UnitVec3 basis_x();
  static UnitVec3 basis_y();
  static UnitVec3 basis_z();

  const Vec3& vec() const { return v; }
  double x() const { return v.x; }
  double y() const { return v.y; }
  double z() const { return v.z; }

  double angle_to(const UnitVec3& other) const;  // radians, [0, PI]

  // parallel (or anti-parallel) if 1 - |a.b| <= tolerance
  bool is_parallel_to(const UnitVec3& other, double tolerance = 1e-10) const;
  // parallel (or anti-parallel) if the angle between them is within angle_tolerance [rad] of 0 or PI
  bool is_parallel_to_angle(const UnitVec3& other, double angle_tolerance) const;
  bool is_perpendicular_to(const UnitVec3& other, double tolerance = 1e-10) const;

private:
  struct normalized_tag {};
  UnitVec3(const Vec3& v, normalized_tag);

  Vec3 v;

  friend UnitVec3 operator-(const UnitVec3& u);
};


bool operator==(const UnitVec3& u1, const UnitVec3& u2);
bool operator!=(const UnitVec3& u1, const UnitVec3& u2);

UnitVec3 operator-(const UnitVec3& u);
Vec3     operator*(const double d, const UnitVec3& u);
Vec3     operator*(const UnitVec3& u, const double d);

double dot(const UnitVec3& u1, const UnitVec3& u2);
double dot(const Vec3& p, const UnitVec3& u);

std::ostream &operator<<(std::ostream& os, const UnitVec3& u);


#endif
