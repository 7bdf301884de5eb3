#include <cstdio>
#include <string>
#include <iostream>
#include <ostream>
#include <cstdint>
#include <cmath>
#include <random>
#include <unordered_set>
#include "boost/variant.hpp"

#define BOOST_TEST_MODULE Spatial Tests
#define BOOST_TEST_MAIN
#include <boost/test/included/unit_test.hpp>

#include "vec3.hpp"
#include "unitvec3.hpp"
#include "linesegment.hpp"
#include "plane.hpp"
#include "errors.hpp"
#include "tuple_parser.hpp"
#include "serialization.hpp"
#include "serialization_internal.hpp"
#include "has.hpp"


using namespace std;
using boost::get;

namespace SD = Serialization;
namespace TX = Text;


#define _TOL , ut::tolerance(1e-9)


namespace ut = boost::test_tools;


// Records what a segment hands to its plane
struct RecordingSurface : public PlanarSurface {
  RecordingSurface() : calls(0), last_tolerance(-1) {}

  LineSegment project(const LineSegment& l) const override {
    calls++;
    return LineSegment(l.end(), l.start());
  }

  boost::optional<Vec3> intersection_with(const LineSegment& l, double tolerance) const override {
    calls++;
    last_tolerance = tolerance;
    return l.start();
  }

  mutable int    calls;
  mutable double last_tolerance;
};


/*
 * Vector Tests
 */


BOOST_AUTO_TEST_SUITE(vectors);


BOOST_AUTO_TEST_CASE(testVec3Arithmetic) {
  Vec3 a = {1.0, 2.0, 3.0};
  Vec3 b = {-4.0, 0.5, 2.0};

  BOOST_TEST((a + b == Vec3(-3.0, 2.5, 5.0)));
  BOOST_TEST((a - b == Vec3(5.0, 1.5, 1.0)));
  BOOST_TEST(a * b == 3.0);
  BOOST_TEST(dot(a, b) == a * b);
  BOOST_TEST((cross(Vec3::basis_x(), Vec3::basis_y()) == Vec3::basis_z()));
  BOOST_TEST((2.0 * a == Vec3(2.0, 4.0, 6.0)));
  BOOST_TEST((a / 2.0 == Vec3(0.5, 1.0, 1.5)));
  BOOST_TEST((-a == Vec3(-1.0, -2.0, -3.0)));
  BOOST_TEST(norm(Vec3(3.0, 4.0, 12.0)) == 13.0);
  BOOST_TEST(distance(Vec3(1, 1, 1), Vec3(4, 5, 1)) == 5.0);
}


BOOST_AUTO_TEST_CASE(testVec3Index) {
  Vec3 a = {7.0, 8.0, 9.0};

  BOOST_TEST(a[0] == 7.0);
  BOOST_TEST(a[1] == 8.0);
  BOOST_TEST(a[2] == 9.0);
  BOOST_CHECK_THROW(a[3], std::out_of_range);
  BOOST_CHECK_THROW(Vec3::basis(5), std::out_of_range);
}


BOOST_AUTO_TEST_CASE(testVec3Parse) {
  auto v = Vec3::parse("1, 2, 3");
  BOOST_TEST((v == Vec3(1, 2, 3)));

  v = Vec3::parse(" (1,5; -2; 3e2) ");
  BOOST_TEST((v == Vec3(1.5, -2, 300)));

  v = Vec3::parse("1,5 2,5 3,5");
  BOOST_TEST((v == Vec3(1.5, 2.5, 3.5)));

  BOOST_CHECK_THROW(Vec3::parse("1, 2"), ParseError);
  BOOST_CHECK_THROW(Vec3::parse("x, y, z"), ParseError);
  BOOST_TEST(!Vec3::try_parse(""));
}


BOOST_AUTO_TEST_CASE(testVec3Hash) {
  std::hash<Vec3> h;
  BOOST_TEST(h(Vec3(1, 2, 3)) == h(Vec3(1, 2, 3)));

  std::unordered_set<Vec3> s = {Vec3(1, 2, 3), Vec3(1, 2, 3), Vec3(3, 2, 1)};
  BOOST_TEST(s.size() == 2u);
}


BOOST_AUTO_TEST_CASE(testUnitVec3Normalizes) {
  UnitVec3 u(Vec3(0.0, 3.0, 4.0));

  BOOST_TEST(u.x() == 0.0);
  BOOST_TEST(u.y() == 0.6 _TOL);
  BOOST_TEST(u.z() == 0.8 _TOL);
  BOOST_TEST(norm(u.vec()) == 1.0 _TOL);

  BOOST_CHECK_THROW(UnitVec3{Vec3::zero()}, DegenerateGeometryError);
}


BOOST_AUTO_TEST_CASE(testUnitVec3Parallel) {
  UnitVec3 x = UnitVec3::basis_x(),
           y = UnitVec3::basis_y();

  BOOST_TEST(x.is_parallel_to(x));
  BOOST_TEST(x.is_parallel_to(-x));
  BOOST_TEST(!x.is_parallel_to(y));
  BOOST_TEST(x.is_perpendicular_to(y));

  BOOST_TEST(x.angle_to(y) == PI/2 _TOL);
  BOOST_TEST(x.angle_to(-x) == PI _TOL);

  UnitVec3 tilted(Vec3(cos(0.01), sin(0.01), 0));
  BOOST_TEST(x.is_parallel_to_angle(tilted, 0.02));
  BOOST_TEST(x.is_parallel_to_angle(-tilted, 0.02));
  BOOST_TEST(!x.is_parallel_to_angle(tilted, 0.005));
}


BOOST_AUTO_TEST_SUITE_END()


/*
 * Tuple Parser Tests
 */


BOOST_AUTO_TEST_SUITE(tuple_parser);


BOOST_AUTO_TEST_CASE(testIsCoordinate) {
  BOOST_TEST(TX::Internal::is_coordinate("1"));
  BOOST_TEST(TX::Internal::is_coordinate("-1.5"));
  BOOST_TEST(TX::Internal::is_coordinate("+1,5"));
  BOOST_TEST(TX::Internal::is_coordinate(".5"));
  BOOST_TEST(TX::Internal::is_coordinate("1e-3"));
  BOOST_TEST(TX::Internal::is_coordinate("2.5E+10"));

  BOOST_TEST(!TX::Internal::is_coordinate(""));
  BOOST_TEST(!TX::Internal::is_coordinate("-"));
  BOOST_TEST(!TX::Internal::is_coordinate("e5"));
  BOOST_TEST(!TX::Internal::is_coordinate("1."));
  BOOST_TEST(!TX::Internal::is_coordinate("1.2.3"));
  BOOST_TEST(!TX::Internal::is_coordinate("abc"));
}


BOOST_AUTO_TEST_CASE(testIsSeparator) {
  BOOST_TEST(TX::Internal::is_separator(","));
  BOOST_TEST(TX::Internal::is_separator(" ; "));
  BOOST_TEST(TX::Internal::is_separator(" "));
  BOOST_TEST(TX::Internal::is_separator("   "));

  BOOST_TEST(!TX::Internal::is_separator(""));
  BOOST_TEST(!TX::Internal::is_separator(",,"));
  BOOST_TEST(!TX::Internal::is_separator(":"));
}


BOOST_AUTO_TEST_CASE(testFindSplitsUnique) {
  auto splits = TX::Internal::find_splits("1,5,2,5", 2);

  BOOST_TEST(splits.size() == 1u);
  if (splits.size() != 1) return;
  BOOST_TEST(splits[0][0] == "1,5");
  BOOST_TEST(splits[0][1] == "2,5");
}


BOOST_AUTO_TEST_CASE(testFindSplitsAmbiguous) {
  // either "1,2" and "3", or "1" and "2,3"
  auto splits = TX::Internal::find_splits("1,2,3", 2);
  BOOST_TEST(splits.size() == 2u);

  splits = TX::Internal::find_splits("1,2,3", 3);
  BOOST_TEST(splits.size() == 1u);
}


BOOST_AUTO_TEST_CASE(testFindSplitsSameCapturesCountOnce) {
  // the space can be the separator character or padding, the coordinates are the same
  auto splits = TX::Internal::find_splits("1  2", 2);
  BOOST_TEST(splits.size() == 1u);
}


BOOST_AUTO_TEST_CASE(testParsePairAccepted) {
  auto p = TX::parse_pair("1,2");
  BOOST_TEST(!!p);
  if (p) {
    BOOST_TEST(p->first == 1.0);
    BOOST_TEST(p->second == 2.0);
  }

  p = TX::parse_pair("(1; 2)");
  BOOST_TEST(!!p);
  if (p) {
    BOOST_TEST(p->first == 1.0);
    BOOST_TEST(p->second == 2.0);
  }

  p = TX::parse_pair("1 2");
  BOOST_TEST(!!p);
  if (p) {
    BOOST_TEST(p->first == 1.0);
    BOOST_TEST(p->second == 2.0);
  }

  p = TX::parse_pair("1,5,2,5");
  BOOST_TEST(!!p);
  if (p) {
    BOOST_TEST(p->first == 1.5);
    BOOST_TEST(p->second == 2.5);
  }
}


BOOST_AUTO_TEST_CASE(testParsePairRejected) {
  BOOST_TEST(!TX::parse_pair("1,2,3"));
  BOOST_TEST(!TX::parse_pair(""));
  BOOST_TEST(!TX::parse_pair("   "));
  BOOST_TEST(!TX::parse_pair("abc"));
  BOOST_TEST(!TX::parse_pair("(1,2"));
  BOOST_TEST(!TX::parse_pair("1,2)"));
  BOOST_TEST(!TX::parse_pair("()"));
  BOOST_TEST(!TX::parse_pair("1;"));
  BOOST_TEST(!TX::parse_pair("1"));
  BOOST_TEST(!TX::parse_pair("1;2;3"));
  BOOST_TEST(!TX::parse_pair("1,2 garbage"));
}


BOOST_AUTO_TEST_CASE(testParsePairSurroundingWhitespace) {
  auto p = TX::parse_pair("\t  -1.25e2 ;  +.5 \n");
  BOOST_TEST(!!p);
  if (p) {
    BOOST_TEST(p->first == -125.0);
    BOOST_TEST(p->second == 0.5);
  }
}


BOOST_AUTO_TEST_CASE(testParsePairOverflow) {
  BOOST_TEST(!TX::parse_pair("1e999, 1"));
}


BOOST_AUTO_TEST_CASE(testToDouble) {
  auto d = TX::to_double("2,5");
  BOOST_TEST(!!d);
  if (d) BOOST_TEST(*d == 2.5);

  d = TX::to_double("1.25");
  BOOST_TEST(!!d);
  if (d) BOOST_TEST(*d == 1.25);

  BOOST_TEST(!TX::to_double("1.25x"));
  BOOST_TEST(!TX::to_double(""));
}


BOOST_AUTO_TEST_CASE(testParseTuple) {
  auto t = TX::parse_tuple("(1,5; 2; -3)", 3);
  BOOST_TEST(!!t);
  if (!t) return;
  BOOST_TEST(t->size() == 3u);
  BOOST_TEST((*t)[0] == 1.5);
  BOOST_TEST((*t)[1] == 2.0);
  BOOST_TEST((*t)[2] == -3.0);

  BOOST_TEST(!TX::parse_tuple("1", 0));
}


BOOST_AUTO_TEST_SUITE_END()


/*
 * Line Segment Tests
 */


BOOST_AUTO_TEST_SUITE(line_segment);


BOOST_AUTO_TEST_CASE(testConstruction) {
  LineSegment l(Vec3(1, 2, 3), Vec3(4, 6, 3));

  BOOST_TEST((l.start() == Vec3(1, 2, 3)));
  BOOST_TEST((l.end() == Vec3(4, 6, 3)));
}


BOOST_AUTO_TEST_CASE(testDegenerateConstruction) {
  Vec3 points[5] = {
    {0, 0, 0},
    {1, 2, 3},
    {-1, -1, -1},
    {PI, -PI/2, 2*PI},
    {1e300, -1e-300, 0}
  };

  for (int i = 0; i < 5; i++) {
    BOOST_CHECK_THROW(LineSegment(points[i], points[i]), DegenerateGeometryError);
  }
}


BOOST_AUTO_TEST_CASE(testTinySegment) {
  LineSegment l(Vec3(0, 0, 0), Vec3(1e-170, 0, 0));

  BOOST_TEST(l.length() == 1e-170);
  BOOST_TEST((l.direction() == UnitVec3::basis_x()));
  BOOST_TEST(distance(l.start(), l.end()) == 1e-170);

  LineSegment m(Vec3(1e-200, 2e-200, 0), Vec3(4e-200, 6e-200, 0));
  BOOST_TEST(m.length() == 5e-200 _TOL);
  BOOST_TEST(m.direction().x() == 0.6 _TOL);
  BOOST_TEST(m.direction().y() == 0.8 _TOL);
}


BOOST_AUTO_TEST_CASE(testHugeSegment) {
  LineSegment l(Vec3(-1e200, 0, 0), Vec3(1e200, 0, 0));

  BOOST_TEST(l.length() == 2e200);
  BOOST_TEST((l.direction() == UnitVec3::basis_x()));
}


BOOST_AUTO_TEST_CASE(testLengthAndDirection) {
  LineSegment l(Vec3(1, 2, 3), Vec3(4, 6, 3));

  BOOST_TEST(l.length() == 5.0);
  BOOST_TEST(l.direction().x() == 0.6 _TOL);
  BOOST_TEST(l.direction().y() == 0.8 _TOL);
  BOOST_TEST(l.direction().z() == 0.0);
}


BOOST_AUTO_TEST_CASE(testLengthAndDirectionRandom) {
  std::mt19937 engine;
  engine.seed(12345);

  auto gen_vec = [&]() -> Vec3 {
    return Vec3(
      ((double) engine()) / ((double) UINT32_MAX) * 20 - 10,
      ((double) engine()) / ((double) UINT32_MAX) * 20 - 10,
      ((double) engine()) / ((double) UINT32_MAX) * 20 - 10
    );
  };

  for (int i = 0; i < 50; i++) {
    Vec3 a = gen_vec(),
         b = gen_vec();
    LineSegment l(a, b);

    BOOST_TEST(l.length() == distance(a, b) _TOL);
    BOOST_TEST(norm(l.direction().vec()) == 1.0 _TOL);
    BOOST_TEST(approxeq(l.direction().vec(), (b - a) / distance(a, b)));
    BOOST_TEST(approxeq(l.start() + l.length() * l.direction(), b));
  }
}


BOOST_AUTO_TEST_CASE(testClosestPoint) {
  LineSegment l(Vec3(0, 0, 0), Vec3(10, 0, 0));

  BOOST_TEST((l.closest_point_to(Vec3(5, 5, 0), true) == Vec3(5, 0, 0)));
  BOOST_TEST((l.closest_point_to(Vec3(15, 0, 0), true) == Vec3(10, 0, 0)));
  BOOST_TEST((l.closest_point_to(Vec3(15, 0, 0), false) == Vec3(15, 0, 0)));
  BOOST_TEST((l.closest_point_to(Vec3(-3, 2, 1), true) == Vec3(0, 0, 0)));
  BOOST_TEST((l.closest_point_to(Vec3(-3, 2, 1), false) == Vec3(-3, 0, 0)));
}


BOOST_AUTO_TEST_CASE(testClosestPointIdempotent) {
  LineSegment l(Vec3(1, 2, 3), Vec3(4, 6, 3));

  Vec3 queries[4] = {
    {2, 5, 7},
    {3, 3, -1},
    {1.5, 2.5, 0},
    {4, 6, 10}
  };

  for (int i = 0; i < 4; i++) {
    auto on_line = l.closest_point_to(queries[i], false);
    auto again   = l.closest_point_to(on_line, true);
    BOOST_TEST(approxeq(on_line, again));
  }
}


BOOST_AUTO_TEST_CASE(testSegmentTo) {
  LineSegment l(Vec3(0, 0, 0), Vec3(10, 0, 0));

  auto s = l.segment_to(Vec3(5, 5, 0), true);
  BOOST_TEST((s.start() == Vec3(5, 0, 0)));
  BOOST_TEST((s.end() == Vec3(5, 5, 0)));
  BOOST_TEST(s.length() == 5.0);

  s = l.segment_to(Vec3(20, 3, 0), true);
  BOOST_TEST((s.start() == Vec3(10, 0, 0)));

  s = l.segment_to(Vec3(20, 3, 0), false);
  BOOST_TEST((s.start() == Vec3(20, 0, 0)));

  // a point on the line is its own closest point
  BOOST_CHECK_THROW(l.segment_to(Vec3(3, 0, 0), true), DegenerateGeometryError);
}


BOOST_AUTO_TEST_CASE(testParallel) {
  LineSegment a(Vec3(0, 0, 0), Vec3(1, 0, 0)),
              b(Vec3(0, 1, 0), Vec3(5, 1, 0)),
              c(Vec3(5, 1, 0), Vec3(0, 1, 0)),
              d(Vec3(0, 0, 0), Vec3(1, 1, 0));

  BOOST_TEST(a.is_parallel_to(b));
  BOOST_TEST(a.is_parallel_to(c));  // anti-parallel
  BOOST_TEST(!a.is_parallel_to(d));

  LineSegment tilted(Vec3(0, 0, 0), Vec3(cos(0.01), sin(0.01), 0));
  BOOST_TEST(!a.is_parallel_to(tilted));
  BOOST_TEST(a.is_parallel_to(tilted, 0.02));
  BOOST_TEST(!a.is_parallel_to(tilted, 0.005));
  BOOST_TEST(a.is_parallel_to(d, PI/4 + 0.001));
}


BOOST_AUTO_TEST_CASE(testParallelSymmetric) {
  LineSegment lines[5] = {
    LineSegment(Vec3(0, 0, 0), Vec3(1, 0, 0)),
    LineSegment(Vec3(0, 1, 0), Vec3(-3, 1, 0)),
    LineSegment(Vec3(1, 2, 3), Vec3(4, 6, 3)),
    LineSegment(Vec3(0, 0, 0), Vec3(cos(1e-4), sin(1e-4), 0)),
    LineSegment(Vec3(-1, -1, -1), Vec3(1, 1, 1))
  };
  double tolerances[4] = {0, 1e-6, 1e-3, PI/3};

  for (int i = 0; i < 5; i++) {
    for (int j = 0; j < 5; j++) {
      BOOST_TEST(lines[i].is_parallel_to(lines[j]) == lines[j].is_parallel_to(lines[i]));
      for (int k = 0; k < 4; k++) {
        BOOST_TEST(lines[i].is_parallel_to(lines[j], tolerances[k]) ==
                   lines[j].is_parallel_to(lines[i], tolerances[k]));
      }
    }
  }
}


BOOST_AUTO_TEST_CASE(testEquality) {
  Vec3 A(1, 2, 3), B(4, 5, 6), C(7, 8, 9);
  LineSegment ab(A, B), ab2(A, B), ab3(A, B), ba(B, A), ac(A, C);

  BOOST_TEST((ab == ab));
  BOOST_TEST((ab == ab2));
  BOOST_TEST((ab2 == ab));
  BOOST_TEST((ab2 == ab3));
  BOOST_TEST((ab == ab3));
  BOOST_TEST((ab != ba));
  BOOST_TEST((ab != ac));

  std::hash<LineSegment> h;
  BOOST_TEST(h(ab) == h(ab2));

  std::unordered_set<LineSegment> s = {ab, ab2, ba};
  BOOST_TEST(s.size() == 2u);
}


BOOST_AUTO_TEST_CASE(testParse) {
  auto l = LineSegment::parse("1, 2, 3", "(4; 5; 6)");
  BOOST_TEST((l.start() == Vec3(1, 2, 3)));
  BOOST_TEST((l.end() == Vec3(4, 5, 6)));

  l = LineSegment::parse("0,5 0 0", "1,5 0 0");
  BOOST_TEST((l.start() == Vec3(0.5, 0, 0)));
  BOOST_TEST(l.length() == 1.0);

  BOOST_CHECK_THROW(LineSegment::parse("1, 2", "3, 4, 5"), ParseError);
  BOOST_CHECK_THROW(LineSegment::parse("1, 2, 3", "(4, 5, 6"), ParseError);
  BOOST_CHECK_THROW(LineSegment::parse("1, 2, 3", "1 2 3"), DegenerateGeometryError);
}


BOOST_AUTO_TEST_CASE(testDelegatesToSurface) {
  LineSegment l(Vec3(1, 2, 3), Vec3(4, 5, 6));
  RecordingSurface surface;

  auto projected = l.project_on(surface);
  BOOST_TEST((projected == LineSegment(l.end(), l.start())));

  auto p = l.intersection_with(surface);
  BOOST_TEST(!!p);
  BOOST_TEST(surface.last_tolerance == DEFAULT_INTERSECTION_TOL);

  l.intersection_with(surface, 0.25);
  BOOST_TEST(surface.last_tolerance == 0.25);
  BOOST_TEST(surface.calls == 3);
}


BOOST_AUTO_TEST_SUITE_END()


/*
 * Plane Tests
 */


BOOST_AUTO_TEST_SUITE(plane);


BOOST_AUTO_TEST_CASE(testPlaneBasics) {
  Plane p(Vec3(0, 0, 2), UnitVec3::basis_z());

  BOOST_TEST(p.offset() == -2.0);
  BOOST_TEST((p.root_point() == Vec3(0, 0, 2)));
  BOOST_TEST(p.signed_distance_to(Vec3(5, 5, 5)) == 3.0);
  BOOST_TEST(p.signed_distance_to(Vec3(5, 5, 0)) == -2.0);
  BOOST_TEST((p.project(Vec3(1, 2, 5)) == Vec3(1, 2, 2)));
}


BOOST_AUTO_TEST_CASE(testPlaneFromPoints) {
  auto p = Plane::from_points(Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0));
  BOOST_TEST((p.normal() == UnitVec3::basis_z()));
  BOOST_TEST(p.offset() == 0.0);

  BOOST_CHECK_THROW(Plane::from_points(Vec3(0, 0, 0), Vec3(1, 1, 1), Vec3(2, 2, 2)), DegenerateGeometryError);
}


BOOST_AUTO_TEST_CASE(testProjectSegment) {
  Plane p(Vec3(0, 0, 2), UnitVec3::basis_z());
  LineSegment l(Vec3(0, 0, 5), Vec3(1, 1, 7));

  auto projected = l.project_on(p);
  BOOST_TEST((projected.start() == Vec3(0, 0, 2)));
  BOOST_TEST((projected.end() == Vec3(1, 1, 2)));

  LineSegment perpendicular(Vec3(3, 3, 1), Vec3(3, 3, 5));
  BOOST_CHECK_THROW(perpendicular.project_on(p), DegenerateGeometryError);
}


BOOST_AUTO_TEST_CASE(testIntersection) {
  Plane p(Vec3(0, 0, 2), UnitVec3::basis_z());

  auto x = LineSegment(Vec3(1, 1, 0), Vec3(1, 1, 4)).intersection_with(p);
  BOOST_TEST(!!x);
  if (x) BOOST_TEST((*x == Vec3(1, 1, 2)));

  // doesn't reach the plane
  x = LineSegment(Vec3(1, 1, 3), Vec3(1, 1, 4)).intersection_with(p);
  BOOST_TEST(!x);

  // parallel, and lying in the plane
  x = LineSegment(Vec3(0, 0, 1), Vec3(1, 0, 1)).intersection_with(p);
  BOOST_TEST(!x);
  x = LineSegment(Vec3(0, 0, 2), Vec3(1, 0, 2)).intersection_with(p);
  BOOST_TEST(!x);
}


BOOST_AUTO_TEST_CASE(testIntersectionTolerance) {
  Plane p(Vec3(0, 0, 2), UnitVec3::basis_z());
  LineSegment shallow(Vec3(-1000, 0, 1), Vec3(1000, 0, 3));

  auto x = shallow.intersection_with(p);
  BOOST_TEST(!!x);
  if (x) BOOST_TEST((*x == Vec3(0, 0, 2)));

  BOOST_TEST(!shallow.intersection_with(p, 5.0));
  BOOST_TEST(!shallow.intersection_with(p, 0.5));
  BOOST_TEST(!shallow.intersection_with(p, 0.002));

  x = shallow.intersection_with(p, 0.0005);
  BOOST_TEST(!!x);
  if (x) BOOST_TEST((*x == Vec3(0, 0, 2)));
}


BOOST_AUTO_TEST_CASE(testIntersectionToleranceIndependentOfLength) {
  Plane p(Vec3(0, 0, 2), UnitVec3::basis_z());
  // both cross the plane at an angle of about 0.001 rad
  LineSegment longer(Vec3(-1000, 0, 1), Vec3(1000, 0, 3)),
              shorter(Vec3(-10, 0, 1.99), Vec3(10, 0, 2.01));

  BOOST_TEST(!longer.intersection_with(p, 0.002));
  BOOST_TEST(!shorter.intersection_with(p, 0.002));

  auto x = longer.intersection_with(p, 0.0005);
  auto y = shorter.intersection_with(p, 0.0005);
  BOOST_TEST(!!x);
  BOOST_TEST(!!y);
  if (x) BOOST_TEST(approxeq(*x, Vec3(0, 0, 2)));
  if (y) BOOST_TEST(approxeq(*y, Vec3(0, 0, 2)));
}


BOOST_AUTO_TEST_SUITE_END()


/*
 * Serialization Tests
 */


BOOST_AUTO_TEST_SUITE(serialization);


// Find data bounds

BOOST_AUTO_TEST_SUITE(find_data_bounds);

BOOST_AUTO_TEST_CASE(find_data_boundsFailure) {
  string str = "NoDataExistsHere";
  auto res = SD::Internal::find_data_bounds(str);

  BOOST_TEST(res.first == -1);
  BOOST_TEST(res.second == -1);
}


BOOST_AUTO_TEST_CASE(find_data_boundsFailureCloseBracketNoOpen) {
  string str = "NoDataExistsHere]";
  auto res = SD::Internal::find_data_bounds(str);

  BOOST_TEST(res.first == -1);
  BOOST_TEST(res.second == -1);
}


BOOST_AUTO_TEST_CASE(find_data_boundsFailureUnclosed) {
  string str = "Point3D[x:1,y:2,z:3";
  auto res = SD::Internal::find_data_bounds(str);

  BOOST_TEST(res.first == -1);
  BOOST_TEST(res.second == -1);
}


BOOST_AUTO_TEST_CASE(find_data_boundsSimple) {
  string str = "Point3D[x:1,y:2,z:3]";
  auto res = SD::Internal::find_data_bounds(str);

  BOOST_TEST(res.first == 7);
  BOOST_TEST(res.second == 19);
}


BOOST_AUTO_TEST_CASE(find_data_boundsComplex) {
  string str = "Plane[d:1,normal:Vec3[1,2,3]]";
  auto res = SD::Internal::find_data_bounds(str);

  BOOST_TEST(res.first == 5);
  BOOST_TEST(res.second == 28);
}


BOOST_AUTO_TEST_CASE(find_data_boundsNested) {
  string str = "Plane[d:1,normal:Vec3[1,2,3]]";
  auto res = SD::Internal::find_data_bounds(str, 17);

  BOOST_TEST(res.first == 21);
  BOOST_TEST(res.second == 27);
}

BOOST_AUTO_TEST_SUITE_END();


// Find geometry type

BOOST_AUTO_TEST_SUITE(find_geom_type);

BOOST_AUTO_TEST_CASE(find_geom_typeNoneExists) {
  string str = "[]";
  auto res = SD::Internal::find_geom_type(str);

  BOOST_TEST(res.first == GeomTypes::Invalid);
}


BOOST_AUTO_TEST_CASE(find_geom_typeUnknownType) {
  string str = "awefji1o23awejfk5lsd[]";
  auto res = SD::Internal::find_geom_type(str);

  BOOST_TEST(res.first == GeomTypes::Invalid);
  BOOST_TEST(res.second == SD::ErrorType::InvalidName);
}


BOOST_AUTO_TEST_CASE(find_geom_typePoint) {
  string str = "point3d[x:1,y:2,z:3]";
  auto res = SD::Internal::find_geom_type(str);

  BOOST_TEST(res.first == GeomTypes::Point3D);
  BOOST_TEST(res.second == SD::ErrorType::NoError);
}


BOOST_AUTO_TEST_CASE(find_geom_typeAlias) {
  string str = "line3d[startpoint:vec3[x:1,y:2,z:3]]";
  auto res = SD::Internal::find_geom_type(str);

  BOOST_TEST(res.first == GeomTypes::LineSegment);
  BOOST_TEST(res.second == SD::ErrorType::NoError);
}

BOOST_AUTO_TEST_SUITE_END();


// Find next pair

BOOST_AUTO_TEST_SUITE(find_next_pair);

BOOST_AUTO_TEST_CASE(find_next_pairSyntaxError) {
  string str = ":";
  auto res = SD::Internal::find_next_pair(str,0,1);

  BOOST_TEST(res.first == -1);
}


BOOST_AUTO_TEST_CASE(find_next_pairEndOfString) {
  string str = "]";
  auto res = SD::Internal::find_next_pair(str);

  BOOST_TEST(res.first == -2);
}


BOOST_AUTO_TEST_CASE(find_next_pairMiddle) {
  string str = "key:value,";
  auto res = SD::Internal::find_next_pair(str);

  BOOST_TEST(res.first == 9);
  BOOST_TEST(res.second == "key:value");
}


BOOST_AUTO_TEST_CASE(find_next_pairEnd) {
  string str = "key:value]";
  auto res = SD::Internal::find_next_pair(str);

  BOOST_TEST(res.first == 9);
  BOOST_TEST(res.second == "key:value");
}


BOOST_AUTO_TEST_CASE(find_next_pairBracketInKey) {
  string str = "ke]y:value,";
  auto res = SD::Internal::find_next_pair(str);

  BOOST_TEST(res.first == -1);
}


BOOST_AUTO_TEST_SUITE_END();


// Find all pairs

BOOST_AUTO_TEST_SUITE(find_pairs);

BOOST_AUTO_TEST_CASE(find_pairsNormal) {
  string str = "Point3D[x:1,y:2,z:3]";
  auto res = SD::Internal::find_pairs(str);
  auto props = res.first;

  BOOST_TEST(!res.second);
  if (res.second) return;
  BOOST_TEST(props.size() == 3u);
  if (props.size() != 3) return;
  BOOST_TEST(props[0].first == "x");
  BOOST_TEST(props[0].second == "1");
  BOOST_TEST(props[2].first == "z");
}


BOOST_AUTO_TEST_CASE(find_pairsKeepsOrder) {
  string str = "n[b:1,a:2]";
  auto res = SD::Internal::find_pairs(str);
  auto props = res.first;

  BOOST_TEST(!res.second);
  BOOST_TEST(props.size() == 2u);
  if (props.size() != 2) return;
  BOOST_TEST(props[0].first == "b");
  BOOST_TEST(props[1].first == "a");
}


BOOST_AUTO_TEST_CASE(find_pairsNone) {
  string str = "Spoofy[]";
  auto res = SD::Internal::find_pairs(str);

  BOOST_TEST(!res.second);
  if (res.second) return;
  BOOST_TEST(res.first.empty());
}


BOOST_AUTO_TEST_CASE(find_pairsErr) {
  string str = "]]]]]";
  auto res = SD::Internal::find_pairs(str);

  BOOST_TEST(res.second);
}


BOOST_AUTO_TEST_CASE(find_pairsNested) {
  string str = "Foo[x: Vec3[x: 1, y: 2, z: 3], y: 2]";

  auto res = SD::Internal::find_pairs(str);

  BOOST_TEST(!res.second);
  BOOST_TEST(res.first.size() == 2u);
}


BOOST_AUTO_TEST_CASE(find_pairsIgnoresTrailing) {
  string str = "Foo[x:1]bar:2]";

  auto res = SD::Internal::find_pairs(str);

  BOOST_TEST(!res.second);
  BOOST_TEST(res.first.size() == 1u);
}


BOOST_AUTO_TEST_SUITE_END();


// Parse double

BOOST_AUTO_TEST_SUITE(parse_double);


BOOST_AUTO_TEST_CASE(parse_doubleNormal) {
  string str = "12345";
  auto res = SD::Internal::parse_double(str);
  BOOST_TEST(res.first == 4);
  BOOST_TEST(res.second == 12345.0);
}

BOOST_AUTO_TEST_CASE(parse_doubleEnded) {
  string str = "12.345,";
  auto res = SD::Internal::parse_double(str);
  BOOST_TEST(res.first == 5);
  BOOST_TEST(res.second == 12.345);
}

BOOST_AUTO_TEST_CASE(parse_doubleTwoDecimal) {
  string str = "12.345.123";
  auto res = SD::Internal::parse_double(str);
  BOOST_TEST(res.first == -1);
}

BOOST_AUTO_TEST_CASE(parse_doubleNegative) {
  string str = "-12345";
  auto res = SD::Internal::parse_double(str);
  BOOST_TEST(res.first == 5);
  BOOST_TEST(res.second == -12345.0);
}

BOOST_AUTO_TEST_CASE(parse_doubleHyphenMiddle) {
  string str = "12345-123";
  auto res = SD::Internal::parse_double(str);
  BOOST_TEST(res.first == -1);
}

BOOST_AUTO_TEST_CASE(parse_doubleExponent) {
  string str = "1.5e-3]";
  auto res = SD::Internal::parse_double(str);
  BOOST_TEST(res.first == 5);
  BOOST_TEST(res.second == 1.5e-3);
}

BOOST_AUTO_TEST_CASE(parse_doubleOffset) {
  string str = "x:-0.25,";
  auto res = SD::Internal::parse_double(str, 2);
  BOOST_TEST(res.first == 6);
  BOOST_TEST(res.second == -0.25);
}

BOOST_AUTO_TEST_SUITE_END();


// (De-)serialization tests

BOOST_AUTO_TEST_SUITE(reSerialization);


BOOST_AUTO_TEST_CASE(testPointReserialize) {
  Vec3 test = {1.0, 2.0, 3.0};
  auto serialized   = SD::serialize(test);
  auto deserialized = SD::deserialize(serialized);

  BOOST_TEST(serialized == "Point3D[x: 1, y: 2, z: 3]");
  BOOST_TEST(has<Vec3>(deserialized));

  if (has<SD::ErrorType>(deserialized)) {
    cerr << SD::error_message(get<SD::ErrorType>(deserialized)) << endl;
    return;
  } else if (!has<Vec3>(deserialized)) {
    cerr << "Deserialized holds wrong type!" << endl;
    return;
  }

  BOOST_TEST((get<Vec3>(deserialized) == test));
}


BOOST_AUTO_TEST_CASE(testLineSegmentReserialize) {
  Vec3 testv1 = {1.5, -2.0, 3.5};
  Vec3 testv2 = {0.0, 0.0, 12345};
  LineSegment test(testv1, testv2);
  auto serialized   = SD::serialize(test);
  auto deserialized = SD::deserialize(serialized);

  BOOST_TEST(has<LineSegment>(deserialized));

  if (has<SD::ErrorType>(deserialized)) {
    cerr << SD::error_message(get<SD::ErrorType>(deserialized)) << endl;
    return;
  }
  else if (!has<LineSegment>(deserialized)) {
    cerr << "Deserialized holds wrong type!" << endl;
    return;
  }

  auto l = get<LineSegment>(deserialized);

  BOOST_TEST((l == test));
  BOOST_TEST(l.length() == test.length());
}


BOOST_AUTO_TEST_CASE(testLineSegmentReserializeExact) {
  LineSegment test(Vec3(0.1, 1.0/3, -1e-7), Vec3(PI, 2.0/3, 6.02214076e23));

  boost::optional<LineSegment> l;
  auto err = SD::deserialize(SD::serialize(test), l);

  BOOST_TEST(err == SD::NoError);
  BOOST_TEST(!!l);
  if (l) BOOST_TEST((*l == test));
}


BOOST_AUTO_TEST_CASE(testLineSegmentFormat) {
  LineSegment test(Vec3(1, 2, 3), Vec3(4, 5, 6));

  BOOST_TEST(SD::serialize(test) ==
    "LineSegment[StartPoint: Point3D[x: 1, y: 2, z: 3], EndPoint: Point3D[x: 4, y: 5, z: 6]]");
}


BOOST_AUTO_TEST_CASE(testPlaneReserialize) {
  Plane test(Vec3(0, 0, 2), UnitVec3::basis_z());

  auto deserialized = SD::deserialize(SD::serialize(test));

  BOOST_TEST(has<Plane>(deserialized));
  if (!has<Plane>(deserialized)) return;
  BOOST_TEST((get<Plane>(deserialized) == test));
}


BOOST_AUTO_TEST_SUITE_END();


// Reading segments

BOOST_AUTO_TEST_SUITE(readSegment);


BOOST_AUTO_TEST_CASE(testCaseAndWhitespace) {
  string str = "  linesegment[ startpoint : vec3[x:1, y:2, z:3],\n\tENDPOINT: VEC3[X:4,Y:5,Z:6] ] ";

  boost::optional<LineSegment> l;
  auto err = SD::deserialize(str, l);

  BOOST_TEST(err == SD::NoError);
  if (!l) return;
  BOOST_TEST((l->start() == Vec3(1, 2, 3)));
  BOOST_TEST((l->end() == Vec3(4, 5, 6)));
}


BOOST_AUTO_TEST_CASE(testOutOfOrder) {
  string str = "LineSegment[EndPoint: Point3D[x:4,y:5,z:6], StartPoint: Point3D[x:1,y:2,z:3]]";

  boost::optional<LineSegment> l;
  auto err = SD::deserialize(str, l);

  BOOST_TEST(err == SD::OutOfOrder);
  BOOST_TEST(!l);
}


BOOST_AUTO_TEST_CASE(testMissingChild) {
  string str = "LineSegment[StartPoint: Point3D[x:1,y:2,z:3]]";

  auto res = SD::deserialize(str);

  BOOST_TEST(has<SD::ErrorType>(res));
  if (!has<SD::ErrorType>(res)) return;
  BOOST_TEST(get<SD::ErrorType>(res) == SD::MissingProperty);
}


BOOST_AUTO_TEST_CASE(testExtraChild) {
  string str = "LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6], Mid: Point3D[x:0,y:0,z:0]]";

  auto res = SD::deserialize(str);

  BOOST_TEST(SD::is_error(res));
  BOOST_TEST((held<SD::ErrorType>(res) == SD::ExtraProperty));
}


BOOST_AUTO_TEST_CASE(testDuplicateChild) {
  string str = "LineSegment[StartPoint: Point3D[x:1,y:2,z:3], StartPoint: Point3D[x:4,y:5,z:6]]";

  auto res = SD::deserialize(str);

  BOOST_TEST((held<SD::ErrorType>(res) == SD::DuplicateProperty));
}


BOOST_AUTO_TEST_CASE(testDegenerate) {
  string str = "LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:1,y:2,z:3]]";

  auto res = SD::deserialize(str);

  BOOST_TEST((held<SD::ErrorType>(res) == SD::DegenerateGeometry));
}


BOOST_AUTO_TEST_CASE(testBadCoordinate) {
  string str = "LineSegment[StartPoint: Point3D[x:1,y:2,z:3q], EndPoint: Point3D[x:4,y:5,z:6]]";

  auto res = SD::deserialize(str);

  BOOST_TEST((held<SD::ErrorType>(res) == SD::SyntaxError));
}


BOOST_AUTO_TEST_CASE(testWrapped) {
  string str = "Scene[ layer: Layer[ item: LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6]] ] ]";

  auto res = SD::deserialize(str);
  BOOST_TEST(has<LineSegment>(res));

  boost::optional<LineSegment> l;
  auto err = SD::deserialize(str, l);
  BOOST_TEST(err == SD::NoError);
  if (l) BOOST_TEST((l->end() == Vec3(4, 5, 6)));
}


BOOST_AUTO_TEST_CASE(testWrapperWithTwoChildren) {
  string str = "Scene[a: LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6]], "
               "b: LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:7]]]";

  auto res = SD::deserialize(str);
  BOOST_TEST((held<SD::ErrorType>(res) == SD::InvalidName));

  boost::optional<LineSegment> l;
  BOOST_TEST(SD::deserialize(str, l) == SD::InvalidName);
}


BOOST_AUTO_TEST_CASE(testCommented) {
  auto res = SD::deserialize("# LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6]]");

  BOOST_TEST((held<SD::ErrorType>(res) == SD::Commented));
}


BOOST_AUTO_TEST_CASE(testUnknownType) {
  auto res = SD::deserialize("Sphere[r: 1]");

  BOOST_TEST((held<SD::ErrorType>(res) == SD::InvalidName));
  BOOST_TEST(SD::error_message(SD::InvalidName) == "Unknown geometry type");
}


BOOST_AUTO_TEST_CASE(testChildNotAPoint) {
  string str = "LineSegment[StartPoint: Plane[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6]]";

  boost::optional<LineSegment> l;
  BOOST_TEST(SD::deserialize(str, l) == SD::InvalidName);
  BOOST_TEST(!l);

  Vec3 v;
  BOOST_TEST(SD::deserialize("Plane[x:1,y:2,z:3]", v) == SD::InvalidName);
  BOOST_TEST(SD::deserialize("Vec3[x:1,y:2,z:3]", v) == SD::NoError);
}


BOOST_AUTO_TEST_CASE(testDeeplyWrapped) {
  string str = "LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6]]";
  for (int i = 0; i < 2000; i++) {
    str = "w[c:" + str + "]";
  }

  auto res = SD::deserialize(str);
  BOOST_TEST(has<LineSegment>(res));

  boost::optional<LineSegment> l;
  BOOST_TEST(SD::deserialize(str, l) == SD::NoError);
  if (l) BOOST_TEST((l->start() == Vec3(1, 2, 3)));
}


BOOST_AUTO_TEST_CASE(testWrappedInOtherGeometry) {
  // a plane holding one child is not a wrapper
  string str = "Plane[n: LineSegment[StartPoint: Point3D[x:1,y:2,z:3], EndPoint: Point3D[x:4,y:5,z:6]]]";

  boost::optional<LineSegment> l;
  BOOST_TEST(SD::deserialize(str, l) == SD::InvalidName);
}


BOOST_AUTO_TEST_CASE(testDegeneratePlane) {
  auto res = SD::deserialize("Plane[Normal: Vector3D[x:0,y:0,z:0], D: 1]");

  BOOST_TEST((held<SD::ErrorType>(res) == SD::DegenerateGeometry));
}


BOOST_AUTO_TEST_SUITE_END();


BOOST_AUTO_TEST_SUITE_END();
