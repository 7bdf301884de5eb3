#ifndef __VEC3
#define __VEC3

#include <stdexcept>
#include <boost/optional.hpp>

#include "common.hpp"


// represents positions as well (for convenience, even though not all operations make sense).
// A point is a Vec3 measured from the origin; point - point gives the connecting vector.
typedef struct Vec3 {
  Vec3();
  Vec3(double _x, double _y, double _z);

  double x;
  double y;
  double z;

  static Vec3 zero();
  static Vec3 basis_x();
  static Vec3 basis_y();
  static Vec3 basis_z();

  // Parses "x, y, z" (or "(x; y; z)", "x y z", decimal commas, ...) using the tuple grammar.
  // Throws ParseError if the text is not exactly one 3-tuple.
  static Vec3 parse(const std::string& text);
  static boost::optional<Vec3> try_parse(const std::string& text);

  template <typename T>
  static Vec3 basis(T i) {
    static_assert(std::is_integral<T>::value, "Cannot index with a nonintegral type.");
    switch (i) {
      case 0:
        return basis_x();
      case 1:
        return basis_y();
      case 2:
        return basis_z();
      default:
        throw std::out_of_range("Invalid index.");
    }
  }

  template <typename T>
  double operator[](T i) const {
    static_assert(std::is_integral<T>::value, "Cannot index with a nonintegral type.");
    switch (i) {
      case 0:
        return this->x;
      case 1:
        return this->y;
      case 2:
        return this->z;
      default:
        throw std::out_of_range("Invalid index.");
    }
  }
} Vec3;

typedef Vec3 Point3D;


// exact, component-wise
bool operator==(const Vec3& p1, const Vec3& p2);
bool operator!=(const Vec3& p1, const Vec3& p2);
Vec3 operator+(const Vec3& p1, const Vec3& p2);
Vec3 operator-(const Vec3& p1, const Vec3& p2);

// '*' between two Vec3 is the dot product
double operator*(const Vec3& p1, const Vec3& p2);
double dot(const Vec3& p1, const Vec3& p2);
Vec3   cross(const Vec3 p1, const Vec3 p2);
double angle(const Vec3 p1, const Vec3 p2);  // radians

Vec3 operator-(const Vec3& p);
Vec3 operator*(const double d, const Vec3& p);
Vec3 operator*(const Vec3& p, const double d);
Vec3 operator/(const Vec3& p, const double d);

// does not under- or overflow for representable results
double norm(const Vec3 p);
double norm2(const Vec3 p);  // norm squared
double distance(const Vec3& p1, const Vec3& p2);

bool approxeq(const Vec3& p1, const Vec3& p2);
bool approxeq(const Vec3& p1, const Vec3& p2, double tolerance);

std::ostream &operator<<(std::ostream& os, const Vec3& p);


namespace std {
  template <>
  struct hash<Vec3> {
    size_t operator()(const Vec3& v) const {
      hash<double> h;
      size_t ret = h(v.x);
      ret = (ret * 397) ^ h(v.y);
      ret = (ret * 397) ^ h(v.z);
      return ret;
    }
  };
}


#endif
