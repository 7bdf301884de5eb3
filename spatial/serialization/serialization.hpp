#ifndef __SERIALIZE__
#define __SERIALIZE__


#include <string>
#include <unordered_map>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "vec3.hpp"
#include "linesegment.hpp"
#include "plane.hpp"


namespace GeomTypes {
  enum GeomType {
    Point3D,
    LineSegment,
    Plane,
    Scalar, // not geometry type but used for parsing

    Invalid // invalid geometry
  };

  // names are matched after the input has been lowercased
  static const std::unordered_map<std::string, GeomType> GEOM_MAP ({
    {"point3d",     Point3D},
    {"vector3d",    Point3D},
    {"vec3",        Point3D},
    {"linesegment", LineSegment},
    {"line3d",      LineSegment},
    {"plane",       Plane}
  });
}


namespace Serialization {


enum ErrorType {
  NoError,
  Commented,
  SyntaxError,
  InvalidName,
  MissingProperty,
  ExtraProperty,
  DuplicateProperty,
  OutOfOrder,
  DegenerateGeometry,
  UnknownError,
  NoParser
};


typedef ::GeomTypes::GeomType GeomType;


// result of parsing geometry text
typedef boost::variant<Vec3, LineSegment, Plane, double, ErrorType> GeomResult;


// Serialization format:
// GeomType[prop:val, prop:val, ...]
// It is not whitespace or case sensitive
// Val may be another datatype
// For example, a serialized point could be:
// "Point3D[x: 1, y: 2, z: 3]"
// A line segment is:
// "LineSegment[StartPoint: Point3D[x: 1, y: 2, z: 3], EndPoint: Point3D[x: 0, y: 0, z: 0]]"
// and its two children must appear in exactly that order.
// A plane is:
// "Plane[Normal: Vector3D[x: 0, y: 0, z: 1], D: -2]"
//
// Lines starting with '#' or '!' are comments.
//
// A segment may be wrapped in other nodes that hold exactly one child, for
//   example "Scene[line: LineSegment[...]]"; the wrappers are skipped.

// To serialize a geometry object, simply call `serialize` on it.

/* To deserialize a stored string, call `deserialize` on the string.
   It will return a `GeomResult` object, which is a Boost tagged union (boost::variant) of the following types:
   - Vec3
   - LineSegment
   - Plane
   - double (this is used internally and should not be returned)
   - ErrorType (in case of a parse error)
 */


GeomResult deserialize(const std::string& s);


std::string serialize(const Vec3& v);
std::string serialize(const LineSegment& ls);
std::string serialize(const Plane& p);


// Returns an error message for the error type
std::string error_message(ErrorType e);

// Is this GeomResult an error type?
bool is_error(const GeomResult& r);


// Each overload checks that the geometry type name matches the output type
//   (InvalidName otherwise); the segment and plane readers also skip wrapper nodes.
// The segment and plane overloads leave the output untouched on error.
ErrorType deserialize(const std::string& s, Vec3& v);
ErrorType deserialize(const std::string& s, boost::optional<LineSegment>& ls);
ErrorType deserialize(const std::string& s, boost::optional<Plane>& p);


}


#endif // __SERIALIZE__
