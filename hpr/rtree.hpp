#pragma once

#include "./hilbert.hpp"
#include "./hpr_inc.hpp"
#include "./rect.hpp"
#include "./sort.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>
#include <easyprint.hpp>
#define pp(x) easyprint::stringify(x)

namespace hpr {

using std::endl;

/// Static R-tree over 2D boxes, bulk loaded in Hilbert order.
///
/// Boxes are add()ed, then finish() sorts them along a Hilbert curve over
/// their centers and packs parent nodes bottom-up into the same flat array,
/// node_size children per parent. After finish() the tree only answers
/// overlap queries.
///
/// ELEMTYPE is the coordinate type (any integer or floating point type).
/// ELEMTYPEREAL is used for centers and normalization onto the curve.
template <class ELEMTYPE = double, class ELEMTYPEREAL = double> class rtree {
  static_assert(std::numeric_limits<ELEMTYPE>::is_specialized,
                "'ELEMTYPE' accepts arithmetic types only");
  static_assert(std::numeric_limits<ELEMTYPEREAL>::is_iec559,
                "'ELEMTYPEREAL' accepts floating-point types only");

public:
  using Rect = hpr::Rect<ELEMTYPE>;
  using SearchCb = std::function<bool(id_t)>;

  enum {
    DEFAULT_NODE_SIZE = 16, ///< Children per node unless configured
    MIN_NODE_SIZE = 2,      ///< Smaller node sizes are raised to this
  };

  /// One entry of the flat node array. Leaves (the first size() entries)
  /// set item, internal nodes set child0. Which one is read is decided by
  /// the level the traversal is on
  struct Node {
    Rect rect;
    Did item;   ///< leaf: insertion index of the box
    Nid child0; ///< internal: array position of the first child
  };

  struct Xml {
    const rtree *tree;
    int spaces = 4;
    Xml() = delete;
    Xml(const rtree *tree) : tree{tree} {}
    friend std::ostream &operator<<(std::ostream &os, const Xml &o) {
      os << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\" ?>"
         << endl;
      o.tree->to_string(o.spaces, os);
      return os;
    }
  };

private:
  /// Pending window on the search stack
  struct Visit {
    size_t node;  ///< array position of the window's first node
    size_t level; ///< level the window lives on, 0 for leaves
  };

  int m_node_size = DEFAULT_NODE_SIZE;
  size_t m_num_items = 0;
  Rect m_bounds = Rect::inverted();

  std::vector<Node> m_nodes;
  std::vector<uint32_t> m_hilbert_values;
  /// exclusive end of each level in m_nodes, leaves first. Empty until
  /// finish()
  std::vector<size_t> m_level_bounds;

  static std::vector<size_t> compute_level_bounds(size_t num_items,
                                                  int node_size);
  static uint32_t curve_coord(ELEMTYPEREAL normalized);
  void compute_hilbert_values();
  void pack_levels();

  template <class Visitor>
  size_t search_tree(const Rect &query, Visitor &&visit) const;

  void node_to_string(size_t pos, size_t level, int depth, int spaces,
                      std::ostream &) const;

public:
  rtree();
  explicit rtree(int node_size);

  /// Adds a box and returns its index: zero based, in insertion order.
  /// Only valid before finish(). min <= max is not checked
  id_t add(ELEMTYPE min_x, ELEMTYPE min_y, ELEMTYPE max_x, ELEMTYPE max_y);

  /// Capacity hint for count boxes plus the parents finish() will add
  void reserve(size_t count);

  /// Builds the tree. Calling it again has no effect
  void finish();

  /// All boxes overlapping the query. Empty before finish()
  std::vector<id_t> search(ELEMTYPE min_x, ELEMTYPE min_y, ELEMTYPE max_x,
                           ELEMTYPE max_y) const;
  /// Same, but clears and refills results, which is returned. Reusing one
  /// buffer avoids an allocation per query
  std::vector<id_t> &search(ELEMTYPE min_x, ELEMTYPE min_y, ELEMTYPE max_x,
                            ELEMTYPE max_y, std::vector<id_t> &results) const;
  /// Calls cb for every hit until it returns false. Returns the number of
  /// hits passed to cb
  size_t search(ELEMTYPE min_x, ELEMTYPE min_y, ELEMTYPE max_x,
                ELEMTYPE max_y, const SearchCb &cb) const;

  size_t size() const { return finished() ? m_num_items : m_nodes.size(); }
  size_t num_nodes() const { return m_nodes.size(); }
  bool finished() const { return !m_level_bounds.empty(); }
  int node_size() const { return m_node_size; }
  void set_node_size(int node_size);
  const Rect &bounds() const { return m_bounds; }
  const std::vector<size_t> &level_bounds() const { return m_level_bounds; }
  const Node &node(size_t pos) const { return m_nodes[pos]; }

  std::string to_string() const;
  void to_string(int spaces, std::ostream &) const;
  Xml to_xml() const { return Xml(this); }
};

#define PRE template <class ELEMTYPE, class ELEMTYPEREAL>
#define QUAL rtree<ELEMTYPE, ELEMTYPEREAL>

PRE QUAL::rtree() : rtree(DEFAULT_NODE_SIZE) {}

PRE QUAL::rtree(int node_size) : m_node_size(node_size) {}

PRE void QUAL::set_node_size(int node_size) {
  HPR_ASSERT(!finished());
  m_node_size = node_size;
}

PRE std::vector<size_t> QUAL::compute_level_bounds(size_t num_items,
                                                   int node_size) {
  const size_t fanout = std::max<int>(node_size, MIN_NODE_SIZE);
  std::vector<size_t> bounds;
  size_t n = num_items;
  size_t num_nodes = n;
  bounds.push_back(num_nodes);
  if (n == 0)
    return bounds;
  // a single item still gets a parent: the root is always internal
  do {
    n = (n + fanout - 1) / fanout;
    num_nodes += n;
    bounds.push_back(num_nodes);
  } while (n > 1);
  return bounds;
}

PRE void QUAL::reserve(size_t count) {
  m_nodes.reserve(compute_level_bounds(count, m_node_size).back());
}

PRE id_t QUAL::add(ELEMTYPE min_x, ELEMTYPE min_y, ELEMTYPE max_x,
                   ELEMTYPE max_y) {
  HPR_ASSERT(!finished());
  const id_t index = static_cast<id_t>(m_nodes.size());
  Node node;
  node.rect = Rect{min_x, min_y, max_x, max_y};
  node.item = Did{index};
  m_nodes.push_back(node);
  m_bounds.combine(node.rect);
  return index;
}

PRE void QUAL::finish() {
  if (finished())
    return;
  if (m_node_size < MIN_NODE_SIZE) {
    m_node_size = MIN_NODE_SIZE;
  }
  m_num_items = m_nodes.size();
  m_level_bounds = compute_level_bounds(m_num_items, m_node_size);
  if (m_num_items == 0)
    return;

  m_nodes.reserve(m_level_bounds.back());

  // everything fits under one parent: the order of the leaves can not
  // change any query result
  if (m_num_items > static_cast<size_t>(m_node_size)) {
    compute_hilbert_values();
    sort_values_and_items(m_hilbert_values.data(), m_nodes.data(),
                          m_num_items);
  }

  pack_levels();
  HPR_ASSERT(m_nodes.size() == m_level_bounds.back());
}

// An axis without extent gives 0/0 and an axis spanning the whole
// coordinate range gives inf/inf: both map to 0. Centers of min > max boxes
// can fall outside the bounds and are clamped onto the curve
PRE uint32_t QUAL::curve_coord(ELEMTYPEREAL normalized) {
  if (!std::isfinite(normalized))
    return 0;
  const ELEMTYPEREAL max = static_cast<ELEMTYPEREAL>(HILBERT_MAX);
  normalized = std::round(normalized);
  if (normalized <= 0)
    return 0;
  if (normalized >= max)
    return HILBERT_MAX;
  return static_cast<uint32_t>(normalized);
}

PRE void QUAL::compute_hilbert_values() {
  const ELEMTYPEREAL min_x = static_cast<ELEMTYPEREAL>(m_bounds.min_x);
  const ELEMTYPEREAL min_y = static_cast<ELEMTYPEREAL>(m_bounds.min_y);
  const ELEMTYPEREAL width = static_cast<ELEMTYPEREAL>(m_bounds.max_x) - min_x;
  const ELEMTYPEREAL height =
      static_cast<ELEMTYPEREAL>(m_bounds.max_y) - min_y;
  const ELEMTYPEREAL hilbert_max = static_cast<ELEMTYPEREAL>(HILBERT_MAX);

  m_hilbert_values.resize(m_num_items);
  for (size_t i = 0; i < m_num_items; ++i) {
    const Rect &r = m_nodes[i].rect;
    const ELEMTYPEREAL center_x = (static_cast<ELEMTYPEREAL>(r.min_x) +
                                   static_cast<ELEMTYPEREAL>(r.max_x)) /
                                  2;
    const ELEMTYPEREAL center_y = (static_cast<ELEMTYPEREAL>(r.min_y) +
                                   static_cast<ELEMTYPEREAL>(r.max_y)) /
                                  2;
    const uint32_t x = curve_coord(hilbert_max * (center_x - min_x) / width);
    const uint32_t y = curve_coord(hilbert_max * (center_y - min_y) / height);
    HPR_ASSERT(x <= HILBERT_MAX && y <= HILBERT_MAX);
    m_hilbert_values[i] = hilbert_xy_to_index(HILBERT_ORDER, x, y);
  }
}

PRE void QUAL::pack_levels() {
  size_t pos = 0;
  for (size_t level = 0; level + 1 < m_level_bounds.size(); ++level) {
    const size_t end = m_level_bounds[level];
    while (pos < end) {
      Node parent;
      parent.rect = Rect::inverted();
      parent.child0 = Nid{static_cast<id_t>(pos)};
      for (int i = 0; i < m_node_size && pos < end; ++i, ++pos) {
        parent.rect.combine(m_nodes[pos].rect);
      }
      m_nodes.push_back(parent);
    }
  }
}

PRE template <class Visitor>
size_t QUAL::search_tree(const Rect &query, Visitor &&visit) const {
  if (!finished() || m_nodes.empty())
    return 0;

  size_t found_count = 0;
  std::vector<Visit> stack;
  stack.reserve(32);
  // the root is the last node, alone on the top level
  stack.push_back(Visit{m_nodes.size() - 1, m_level_bounds.size() - 1});

  while (!stack.empty()) {
    const Visit cur = stack.back();
    stack.pop_back();

    const size_t end = std::min(cur.node + static_cast<size_t>(m_node_size),
                                m_level_bounds[cur.level]);
    for (size_t pos = cur.node; pos < end; ++pos) {
      const Node &node = m_nodes[pos];
      if (!rects_overlap(query, node.rect))
        continue;
      if (cur.node < m_num_items) {
        // leaf window
        ++found_count;
        if (!visit(node.item.id)) {
          return found_count; // stop searching
        }
      } else {
        HPR_ASSERT(node.child0);
        stack.push_back(Visit{node.child0.id, cur.level - 1});
      }
    }
  }
  return found_count;
}

PRE std::vector<id_t> QUAL::search(ELEMTYPE min_x, ELEMTYPE min_y,
                                   ELEMTYPE max_x, ELEMTYPE max_y) const {
  std::vector<id_t> results;
  search(min_x, min_y, max_x, max_y, results);
  return results;
}

PRE std::vector<id_t> &QUAL::search(ELEMTYPE min_x, ELEMTYPE min_y,
                                    ELEMTYPE max_x, ELEMTYPE max_y,
                                    std::vector<id_t> &results) const {
  results.clear();
  search_tree(Rect{min_x, min_y, max_x, max_y}, [&results](id_t id) {
    results.push_back(id);
    return true;
  });
  return results;
}

PRE size_t QUAL::search(ELEMTYPE min_x, ELEMTYPE min_y, ELEMTYPE max_x,
                        ELEMTYPE max_y, const SearchCb &cb) const {
  return search_tree(Rect{min_x, min_y, max_x, max_y}, cb);
}

PRE std::string QUAL::to_string() const {
  std::ostringstream os;
  to_string(4, os);
  return os.str();
}

PRE void QUAL::to_string(int spaces, std::ostream &os) const {
  os << "<Tree items=\"" << size() << "\" node_size=\"" << m_node_size
     << "\" bounds=\"" << m_bounds << "\"";
  if (!finished()) {
    os << " finished=\"false\" />" << endl;
    return;
  }
  os << " levels=\"" << pp(m_level_bounds) << "\"";
  if (m_nodes.empty()) {
    os << " />" << endl;
    return;
  }
  os << " >" << endl;
  node_to_string(m_nodes.size() - 1, m_level_bounds.size() - 1, 1, spaces, os);
  os << "</Tree>" << endl;
}

PRE void QUAL::node_to_string(size_t pos, size_t level, int depth, int spaces,
                              std::ostream &os) const {
  const Node &node = m_nodes[pos];
  auto indent = [&]() {
    for (int i = 0; i < depth * spaces; ++i) {
      os << " ";
    }
  };
  indent();
  if (level == 0) {
    os << "<Item id=\"" << node.item.id << "\" pos=\"" << pos << "\" mbr=\""
       << node.rect << "\" />" << endl;
    return;
  }
  const size_t first = node.child0.id;
  const size_t end = std::min(first + static_cast<size_t>(m_node_size),
                              m_level_bounds[level - 1]);
  os << "<Node pos=\"" << pos << "\" level=\"" << level << "\" children=\""
     << end - first << "\" mbr=\"" << node.rect << "\" >" << endl;
  for (size_t child = first; child < end; ++child) {
    node_to_string(child, level - 1, depth + 1, spaces, os);
  }
  indent();
  os << "</Node>" << endl;
}

} // namespace hpr
#undef pp
#undef PRE
#undef QUAL
