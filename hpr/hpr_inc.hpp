#pragma once

#include <assert.h>
#include <cstddef>
#include <cstdint>
#include <limits>

#define HPR_ASSERT assert // hpr uses HPR_ASSERT( condition )

namespace hpr {

using id_t = uint32_t;

struct Id {
  static const id_t nullid = std::numeric_limits<id_t>::max();
  id_t id = nullid;
  operator bool() const { return id != nullid; }
  Id() : Id(nullid){};
  Id(const Id &other) : Id(other.id){};
  Id(id_t id) : id{id} {}
  Id &operator=(const Id &other) {
    id = other.id;
    return *this;
  }
  friend bool operator==(const Id &lhs, const Id &rhs) {
    return lhs.id == rhs.id;
  }
  friend bool operator!=(const Id &lhs, const Id &rhs) {
    return lhs.id != rhs.id;
  }
};

/// Item id: the insertion index returned by add()
struct Did : Id {};
/// Node id: a position in the flat node array
struct Nid : Id {};

} // namespace hpr
