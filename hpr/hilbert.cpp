#include "./hilbert.hpp"
#include "./hpr_inc.hpp"

namespace hpr {

// Bit interleave and the prefix scan below follow the public domain
// hilbert_curves by rawrunprotected
uint32_t hilbert_interleave(uint32_t x) {
  x = (x | (x << 8)) & 0x00FF00FF;
  x = (x | (x << 4)) & 0x0F0F0F0F;
  x = (x | (x << 2)) & 0x33333333;
  x = (x | (x << 1)) & 0x55555555;
  return x;
}

uint32_t hilbert_xy_to_index(uint32_t n, uint32_t x, uint32_t y) {
  HPR_ASSERT(n >= 1 && n <= HILBERT_ORDER);
  HPR_ASSERT(x < (1u << n) && y < (1u << n));

  x = x << (16 - n);
  y = y << (16 - n);

  uint32_t A, B, C, D;

  // initial round, primed with x and y
  {
    const uint32_t a = x ^ y;
    const uint32_t b = 0xFFFF ^ a;
    const uint32_t c = 0xFFFF ^ (x | y);
    const uint32_t d = x & (y ^ 0xFFFF);

    A = a | (b >> 1);
    B = (a >> 1) ^ a;

    C = ((c >> 1) ^ (b & (d >> 1))) ^ c;
    D = ((a & (c >> 1)) ^ (d >> 1)) ^ d;
  }

  // two doubling rounds, shifts 2 and 4
  for (uint32_t shift = 2; shift <= 4; shift <<= 1) {
    const uint32_t a = A;
    const uint32_t b = B;
    const uint32_t c = C;
    const uint32_t d = D;

    A = ((a & (a >> shift)) ^ (b & (b >> shift)));
    B = ((a & (b >> shift)) ^ (b & ((a ^ b) >> shift)));

    C ^= ((a & (c >> shift)) ^ (b & (d >> shift)));
    D ^= ((b & (c >> shift)) ^ ((a ^ b) & (d >> shift)));
  }

  // final round, only C and D are needed from here on
  {
    const uint32_t a = A;
    const uint32_t b = B;
    const uint32_t c = C;
    const uint32_t d = D;

    C ^= ((a & (c >> 8)) ^ (b & (d >> 8)));
    D ^= ((b & (c >> 8)) ^ ((a ^ b) & (d >> 8)));
  }

  // undo the prefix scan
  const uint32_t a = C ^ (C >> 1);
  const uint32_t b = D ^ (D >> 1);

  // recover the index bits
  const uint32_t i0 = x ^ y;
  const uint32_t i1 = b | (0xFFFF ^ (i0 | a));

  return ((hilbert_interleave(i1) << 1) | hilbert_interleave(i0)) >>
         (32 - 2 * n);
}

} // namespace hpr
