#pragma once

#include <cstdint>

namespace hpr {

/// Order of the curve used to rank box centers
const uint32_t HILBERT_ORDER = 16;
/// Largest coordinate on either axis of the order 16 curve (2^16 - 1)
const uint32_t HILBERT_MAX = (1u << HILBERT_ORDER) - 1;

/// Rank of the cell (x, y) along a Hilbert curve of order n.
/// x and y must be in [0, 2^n), n in [1, 16]. The result is in [0, 2^(2n)).
/// Branch free: a prefix scan over the bits of both coordinates
uint32_t hilbert_xy_to_index(uint32_t n, uint32_t x, uint32_t y);

/// Spreads the low 16 bits of x to the even bit positions
uint32_t hilbert_interleave(uint32_t x);

} // namespace hpr
