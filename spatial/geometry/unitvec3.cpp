#include "unitvec3.hpp"
#include "errors.hpp"

#include <algorithm>
#include <sstream>


UnitVec3::UnitVec3(const Vec3& _v) {
  double n = norm(_v);
  if (!(n > 0) || !std::isfinite(n)) {
    std::ostringstream msg;
    msg << "Cannot normalize " << _v;
    throw DegenerateGeometryError(msg.str());
  }
  v = _v / n;
}


UnitVec3::UnitVec3(const Vec3& _v, normalized_tag)
: v(_v) {}


UnitVec3 UnitVec3::basis_x() {
  return UnitVec3(Vec3::basis_x(), normalized_tag());
}

UnitVec3 UnitVec3::basis_y() {
  return UnitVec3(Vec3::basis_y(), normalized_tag());
}

UnitVec3 UnitVec3::basis_z() {
  return UnitVec3(Vec3::basis_z(), normalized_tag());
}


double UnitVec3::angle_to(const UnitVec3& other) const {
  double c = dot(*this, other);
  return acos(std::max(-1.0, std::min(1.0, c)));
}


bool UnitVec3::is_parallel_to(const UnitVec3& other, double tolerance) const {
  double dp = fabs(dot(*this, other));
  return fabs(1 - dp) <= tolerance;
}


bool UnitVec3::is_parallel_to_angle(const UnitVec3& other, double angle_tolerance) const {
  double a = angle_to(other);
  if (a < angle_tolerance) {
    return true;
  }
  return fabs(a - PI) < angle_tolerance;
}


bool UnitVec3::is_perpendicular_to(const UnitVec3& other, double tolerance) const {
  return fabs(dot(*this, other)) < tolerance;
}


bool operator==(const UnitVec3& u1, const UnitVec3& u2) {
  return u1.vec() == u2.vec();
}


bool operator!=(const UnitVec3& u1, const UnitVec3& u2) {
  return !(u1 == u2);
}


UnitVec3 operator-(const UnitVec3& u) {
  return UnitVec3(-u.v, UnitVec3::normalized_tag());
}


Vec3 operator*(const double d, const UnitVec3& u) {
  return d * u.vec();
}


Vec3 operator*(const UnitVec3& u, const double d) {
  return d * u.vec();
}


double dot(const UnitVec3& u1, const UnitVec3& u2) {
  return dot(u1.vec(), u2.vec());
}


double dot(const Vec3& p, const UnitVec3& u) {
  return dot(p, u.vec());
}


std::ostream& operator<<(std::ostream &os, const UnitVec3& u) {
  return os << "UnitVec3{" << u.x() << ", " << u.y() << ", " << u.z() << "}";
}
