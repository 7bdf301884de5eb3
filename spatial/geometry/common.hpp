#ifndef __SPATIAL_COMMON
#define __SPATIAL_COMMON

#include <cmath>
#include <cstddef>
#include <functional>
#include <iostream>
#include <ostream>
#include <string>
#include <type_traits>

#include "tolerances.hpp"

#ifndef PI
#define PI 3.14159265358979323846
#endif

#endif
