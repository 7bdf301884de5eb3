#ifndef __SPATIAL_HAS_H
#define __SPATIAL_HAS_H

#include <boost/optional.hpp>
#include <boost/variant.hpp>

// Does the variant currently hold a T?
template <typename T, typename Ts>
bool has(const Ts& _variant) {
  return boost::get<T>(&_variant) != nullptr;
}

// The held T, or none if the variant holds another alternative.
template <typename T, typename Ts>
boost::optional<T> held(const Ts& _variant) {
  const T* p = boost::get<T>(&_variant);
  if (p) {
    return *p;
  }
  return boost::none;
}

#endif
