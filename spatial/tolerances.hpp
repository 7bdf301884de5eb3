#ifndef __SPATIAL_TOLERANCES
#define __SPATIAL_TOLERANCES

// component-wise tolerance used by approxeq
#define APPROX 1e-9

// default tolerance on 1 - |a.b| for LineSegment::is_parallel_to,
//   twice the double precision unit roundoff (2^-53)
#define PARALLEL_DOT_TOL (2 * 1.1102230246251565e-16)

// default for LineSegment::intersection_with: the smallest positive (subnormal) double,
//   so only an exactly parallel segment is rejected
#define DEFAULT_INTERSECTION_TOL 4.9406564584124654e-324

// significant digits written by the serializer (17 is enough to read back the same double)
#define SERIALIZE_PREC 17

#endif
