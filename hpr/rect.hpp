#pragma once

#include "./hpr_inc.hpp"

#include <algorithm>
#include <limits>
#include <ostream>

namespace hpr {

/// Sentinel values of a coordinate type. Integers use their full range,
/// floating point types use -max..max (not the infinities)
template <class ELEMTYPE> struct coord_limits {
  static_assert(std::numeric_limits<ELEMTYPE>::is_specialized,
                "'ELEMTYPE' needs a std::numeric_limits specialization");
  static constexpr ELEMTYPE lowest() {
    return std::numeric_limits<ELEMTYPE>::lowest();
  }
  static constexpr ELEMTYPE max() { return std::numeric_limits<ELEMTYPE>::max(); }
};

template <class ELEMTYPE> struct Rect {
  ELEMTYPE min_x;
  ELEMTYPE min_y;
  ELEMTYPE max_x;
  ELEMTYPE max_y;

  /// The neutral element of combine(): combining any rect into it yields
  /// that rect
  static Rect inverted() {
    return Rect{coord_limits<ELEMTYPE>::max(), coord_limits<ELEMTYPE>::max(),
                coord_limits<ELEMTYPE>::lowest(),
                coord_limits<ELEMTYPE>::lowest()};
  }

  void combine(const Rect &other) {
    min_x = std::min(min_x, other.min_x);
    min_y = std::min(min_y, other.min_y);
    max_x = std::max(max_x, other.max_x);
    max_y = std::max(max_y, other.max_y);
  }

  friend bool operator==(const Rect &a, const Rect &b) {
    return a.min_x == b.min_x && a.min_y == b.min_y && a.max_x == b.max_x &&
           a.max_y == b.max_y;
  }
  friend bool operator!=(const Rect &a, const Rect &b) { return !(a == b); }
};

/// Separating axis rejection. Touching edges count as overlap
template <class ELEMTYPE>
inline bool rects_overlap(const Rect<ELEMTYPE> &query,
                          const Rect<ELEMTYPE> &rect) {
  if (query.max_x < rect.min_x || query.max_y < rect.min_y ||
      query.min_x > rect.max_x || query.min_y > rect.max_y) {
    return false;
  }
  return true;
}

template <class ELEMTYPE>
inline bool rect_contains(const Rect<ELEMTYPE> &bigger,
                          const Rect<ELEMTYPE> &smaller) {
  return bigger.min_x <= smaller.min_x && bigger.min_y <= smaller.min_y &&
         bigger.max_x >= smaller.max_x && bigger.max_y >= smaller.max_y;
}

// unary plus so that int8_t prints as a number
template <class ELEMTYPE>
std::ostream &operator<<(std::ostream &os, const Rect<ELEMTYPE> &r) {
  os << "{" << +r.min_x << ", " << +r.min_y << "}...{" << +r.max_x << ", "
     << +r.max_y << "}";
  return os;
}

} // namespace hpr
