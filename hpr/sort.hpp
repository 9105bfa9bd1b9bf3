#pragma once

#include "./hpr_inc.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace hpr {

/// Sorts values ascending and applies every swap to items as well, so
/// items[i] keeps travelling with values[i]. Not stable.
///
/// Hoare partition around the middle element's value. The recursion of the
/// classic pairwise quicksort is replaced by an explicit stack of ranges;
/// the larger half is pushed first so the stack stays logarithmic in size
template <class VALUE, class ITEM>
void sort_values_and_items(VALUE *values, ITEM *items, size_t count) {
  if (count < 2)
    return;

  struct Range {
    std::ptrdiff_t left;
    std::ptrdiff_t right; // inclusive
  };
  std::vector<Range> stack;
  stack.push_back(Range{0, static_cast<std::ptrdiff_t>(count) - 1});

  while (!stack.empty()) {
    const Range range = stack.back();
    stack.pop_back();
    if (range.left >= range.right)
      continue;

    const VALUE pivot = values[(range.left + range.right) >> 1];
    std::ptrdiff_t i = range.left - 1;
    std::ptrdiff_t j = range.right + 1;

    while (true) {
      do {
        i++;
      } while (values[i] < pivot);
      do {
        j--;
      } while (values[j] > pivot);
      if (i >= j)
        break;
      std::swap(values[i], values[j]);
      std::swap(items[i], items[j]);
    }

    const Range lower{range.left, j};
    const Range upper{j + 1, range.right};
    if (lower.right - lower.left > upper.right - upper.left) {
      stack.push_back(lower);
      stack.push_back(upper);
    } else {
      stack.push_back(upper);
      stack.push_back(lower);
    }
  }
}

template <class VALUE, class ITEM>
void sort_values_and_items(std::vector<VALUE> &values,
                           std::vector<ITEM> &items) {
  HPR_ASSERT(values.size() <= items.size());
  sort_values_and_items(values.data(), items.data(), values.size());
}

} // namespace hpr
