#include "serialization.hpp"
#include "serialization_internal.hpp"
#include "errors.hpp"
#include "has.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <boost/regex.hpp>


using namespace std;


namespace Serialization {


/*
 * Error handling
 */


string error_message(ErrorType e) {
  switch (e) {
    case NoError:
      return "";

    case Commented:
      return "Line is commented out";

    case SyntaxError:
      return "Syntax error";

    case InvalidName:
      return "Unknown geometry type";

    case MissingProperty:
      return "Required property missing";

    case ExtraProperty:
      return "Extraneous property";

    case DuplicateProperty:
      return "Duplicate property";

    case OutOfOrder:
      return "Properties out of order";

    case DegenerateGeometry:
      return "Geometry is degenerate";

    case NoParser:
      return "No parser exists for that datatype";

    default:
    case UnknownError:
      return "Unknown error";
  }
}


bool is_error(const GeomResult& r) {
  return has<ErrorType>(r);
}


// Remove whitespace and make lowercase
static string reduce(const string& s) {
  static const boost::regex ws("\\s+");
  auto reduced = boost::regex_replace(s, ws, "");
  transform(reduced.begin(), reduced.end(), reduced.begin(), ::tolower);
  return reduced;
}


GeomResult deserialize(const string& s) {
  DEBUG_ENTER(__PRETTY_FUNCTION__);
  auto reduced = reduce(s);

  // check if it's commented out
  if (reduced.size() && (reduced[0] == '#' || reduced[0] == '!')) {
    DEBUG_LEAVE;
    return GeomResult { Commented };
  }

  // skip any wrapper nodes around the geometry
  auto node = Internal::unwrap(reduced);
  if (node.second != NoError) {
    DEBUG_LEAVE;
    return GeomResult { node.second };
  }

  auto type = Internal::find_geom_type(node.first).first;
  ErrorType err;

  if (type == GeomTypes::Point3D) {
    Vec3 v;
    err = deserialize(node.first, v);
    DEBUG_LEAVE;
    if (err != NoError) return GeomResult { err };
    return GeomResult { v };
  }
  else if (type == GeomTypes::LineSegment) {
    boost::optional<LineSegment> l;
    err = deserialize(node.first, l);
    DEBUG_LEAVE;
    if (err != NoError) return GeomResult { err };
    return GeomResult { *l };
  }
  else {
    // unwrap only stops at names in GEOM_MAP, so this is a plane
    boost::optional<Plane> p;
    err = deserialize(node.first, p);
    DEBUG_LEAVE;
    if (err != NoError) return GeomResult { err };
    return GeomResult { *p };
  }
}


// Point3D

static string serialize_vector(const char* name, const Vec3& v) {
  ostringstream ret;
  ret.imbue(std::locale::classic());
  ret << name << "[x: " << setprecision(SERIALIZE_PREC) << v.x << ", y: " << v.y << ", z: " << v.z << "]";
  return ret.str();
}


string serialize(const Vec3& v) {
  return serialize_vector("Point3D", v);
}


ErrorType deserialize(const string& s, Vec3& v) {
  static const Internal::PropSpec required_props({
    {"x", GeomTypes::Scalar},
    {"y", GeomTypes::Scalar},
    {"z", GeomTypes::Scalar}
  });

  auto reduced = reduce(s);
  auto type = Internal::find_geom_type(reduced);
  if (type.second != NoError) {
    return type.second;
  }
  if (type.first != GeomTypes::Point3D) {
    DEBUG_COUT("Expected a point, got '" << reduced.substr(0, reduced.find('[')) << "'");
    return InvalidName;
  }

  auto res = Internal::parse_geometry(reduced, required_props);

  if (res.find("*") != res.end()) {
    return boost::get<ErrorType>(res["*"]);
  }

  v.x = boost::get<double>(res["x"]);
  v.y = boost::get<double>(res["y"]);
  v.z = boost::get<double>(res["z"]);

  return ErrorType::NoError;
}


// LineSegment

string serialize(const LineSegment& ls) {
  auto a = serialize(ls.start()),
       b = serialize(ls.end());

  ostringstream ret;
  ret << "LineSegment[StartPoint: " << a << ", EndPoint: " << b << "]";
  return ret.str();
}


ErrorType deserialize(const string& s, boost::optional<LineSegment>& ls) {
  static const Internal::PropSpec required_props({
    {"startpoint", GeomTypes::Point3D},
    {"endpoint",   GeomTypes::Point3D}
  });

  auto node = Internal::unwrap(reduce(s), GeomTypes::LineSegment);
  if (node.second != NoError) {
    return node.second;
  }

  auto res = Internal::parse_geometry(node.first, required_props, true);

  if (res.find("*") != res.end()) {
    return boost::get<ErrorType>(res["*"]);
  }

  try {
    ls = LineSegment(boost::get<Vec3>(res["startpoint"]), boost::get<Vec3>(res["endpoint"]));
  } catch (const DegenerateGeometryError& e) {
    DEBUG_COUT(e.what());
    return DegenerateGeometry;
  }

  return ErrorType::NoError;
}


// Plane

string serialize(const Plane& p) {
  ostringstream ret;
  ret.imbue(std::locale::classic());
  ret << "Plane[Normal: " << serialize_vector("Vector3D", p.normal().vec())
      << ", D: " << setprecision(SERIALIZE_PREC) << p.offset() << "]";
  return ret.str();
}


ErrorType deserialize(const string& s, boost::optional<Plane>& p) {
  static const Internal::PropSpec required_props({
    {"normal", GeomTypes::Point3D},
    {"d",      GeomTypes::Scalar}
  });

  auto node = Internal::unwrap(reduce(s), GeomTypes::Plane);
  if (node.second != NoError) {
    return node.second;
  }

  auto res = Internal::parse_geometry(node.first, required_props);

  if (res.find("*") != res.end()) {
    return boost::get<ErrorType>(res["*"]);
  }

  try {
    p = Plane(UnitVec3(boost::get<Vec3>(res["normal"])), boost::get<double>(res["d"]));
  } catch (const DegenerateGeometryError& e) {
    DEBUG_COUT(e.what());
    return DegenerateGeometry;
  }

  return ErrorType::NoError;
}


}
