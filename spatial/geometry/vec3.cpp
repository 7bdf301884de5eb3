#include "vec3.hpp"
#include "errors.hpp"
#include "tuple_parser.hpp"

#include <algorithm>
#include <cfloat>
#include <vector>


Vec3::Vec3() : x(0), y(0), z(0) {}


Vec3::Vec3(double _x, double _y, double _z)
: x(_x), y(_y), z(_z) {}


Vec3 Vec3::zero() {
  return Vec3(0, 0, 0);
}

Vec3 Vec3::basis_x() {
  return Vec3(1, 0, 0);
}

Vec3 Vec3::basis_y() {
  return Vec3(0, 1, 0);
}

Vec3 Vec3::basis_z() {
  return Vec3(0, 0, 1);
}


boost::optional<Vec3> Vec3::try_parse(const std::string& text) {
  auto res = Text::parse_tuple(text, 3);
  if (!res) {
    return boost::none;
  }
  const std::vector<double>& c = *res;
  return Vec3(c[0], c[1], c[2]);
}


Vec3 Vec3::parse(const std::string& text) {
  auto res = try_parse(text);
  if (!res) {
    throw ParseError("Could not parse a 3D point from '" + text + "'");
  }
  return *res;
}


// Operators


bool operator==(const Vec3& p1, const Vec3& p2) {
  return p1.x == p2.x && p1.y == p2.y && p1.z == p2.z;
}


bool operator!=(const Vec3& p1, const Vec3& p2) {
  return !(p1 == p2);
}


Vec3 operator+(const Vec3& p1, const Vec3& p2) {
  return Vec3(
      p1.x + p2.x,
      p1.y + p2.y,
      p1.z + p2.z
  );
}


Vec3 operator-(const Vec3& p1, const Vec3& p2) {
  return Vec3(
      p1.x - p2.x,
      p1.y - p2.y,
      p1.z - p2.z
  );
}


Vec3 operator-(const Vec3& p) {
  return Vec3(-p.x, -p.y, -p.z);
}

// dot product
double operator*(const Vec3& p1, const Vec3& p2) {
  return (p1.x * p2.x) + (p1.y * p2.y) + (p1.z * p2.z);
}


Vec3 operator*(const double d, const Vec3& p) {
  return Vec3(
      d * p.x,
      d * p.y,
      d * p.z
  );
}


Vec3 operator*(const Vec3& p, const double d) {
  return d * p;
}


Vec3 operator/(const Vec3& p, const double d) {
  return Vec3(p.x / d, p.y / d, p.z / d);
}


double dot(const Vec3& p1, const Vec3& p2) {
  return p1 * p2;
}


Vec3 cross(const Vec3 p1, const Vec3 p2) {
  return Vec3(
      (p1.y * p2.z) - (p1.z * p2.y),
      (p1.z * p2.x) - (p1.x * p2.z),
      (p1.x * p2.y) - (p1.y * p2.x)
  );
}


double norm(const Vec3 p) {
  double s = norm2(p);
  if (s >= DBL_MIN && s <= DBL_MAX) {
    return sqrt(s);
  }
  if (std::isnan(s)) {
    return s;
  }

  // the squares under- or overflowed, so scale by the largest component first
  double m = std::max(fabs(p.x), std::max(fabs(p.y), fabs(p.z)));
  if (m == 0 || std::isinf(m)) {
    return m;
  }
  return m * sqrt(norm2(p / m));
}


double norm2(const Vec3 p) {
  return (p.x*p.x) + (p.y*p.y) + (p.z*p.z);
}


// clamped so rounding in the dot product can't push acos out of its domain
double angle(const Vec3 p1, const Vec3 p2) {
  double c = dot(p1, p2) / norm(p1) / norm(p2);
  return acos(std::max(-1.0, std::min(1.0, c)));
}


double distance(const Vec3& p1, const Vec3& p2) {
  return norm(p2 - p1);
}


bool approxeq(const Vec3& p1, const Vec3& p2) {
  return approxeq(p1, p2, APPROX);
}


bool approxeq(const Vec3& p1, const Vec3& p2, double tolerance) {
  return
    (fabs(p1.x - p2.x) < tolerance) &&
    (fabs(p1.y - p2.y) < tolerance) &&
    (fabs(p1.z - p2.z) < tolerance);
}


std::ostream& operator<<(std::ostream &os, const Vec3& p) {
  return os << "Vec3{" << p.x << ", " << p.y << ", " << p.z << "}";
}
