// Byte-compare masks and quote parity with Google Highway.
//
// Compiled once per SIMD target through foreach_target.h; the best target for
// the running CPU is picked at runtime by HWY_DYNAMIC_DISPATCH.

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "src/backends/separator_masks.cpp"
#include "hwy/foreach_target.h"
#include "hwy/highway.h"

#include "csv_toolbox/separator_indexer.hpp"

#include <cstddef>
#include <cstdint>

HWY_BEFORE_NAMESPACE();
namespace ctb {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// One 64-bit mask per lead byte (delimiter, quotation) and one for CR|LF, for
// `words` full 64-byte words starting at `data`.
HWY_NOINLINE void ClassifyWordsImpl(const char* data, std::size_t words, std::uint8_t delim,
                                    std::uint8_t quote, WordMasks* out) {
  const hn::CappedTag<std::uint8_t, 64> d;
  const std::size_t N = hn::Lanes(d);

  const auto delim_vec = hn::Set(d, delim);
  const auto quote_vec = hn::Set(d, quote);
  const auto lf_vec = hn::Set(d, static_cast<std::uint8_t>('\n'));
  const auto cr_vec = hn::Set(d, static_cast<std::uint8_t>('\r'));

  for (std::size_t w = 0; w < words; ++w) {
    const auto* base = reinterpret_cast<const std::uint8_t*>(data + w * 64);
    WordMasks m;
    for (std::size_t off = 0; off < 64; off += N) {
      const auto v = hn::LoadU(d, base + off);

      std::uint8_t d_bytes[HWY_MAX_BYTES / 8] = {0};
      std::uint8_t q_bytes[HWY_MAX_BYTES / 8] = {0};
      std::uint8_t e_bytes[HWY_MAX_BYTES / 8] = {0};
      hn::StoreMaskBits(d, hn::Eq(v, delim_vec), d_bytes);
      hn::StoreMaskBits(d, hn::Eq(v, quote_vec), q_bytes);
      hn::StoreMaskBits(d, hn::Or(hn::Eq(v, lf_vec), hn::Eq(v, cr_vec)), e_bytes);

      const std::size_t mask_bytes = (N + 7) / 8;
      for (std::size_t b = 0; b < mask_bytes && off + b * 8 < 64; ++b) {
        const std::size_t shift = off + b * 8;
        m.delimiters |= static_cast<std::uint64_t>(d_bytes[b]) << shift;
        m.quotes |= static_cast<std::uint64_t>(q_bytes[b]) << shift;
        m.line_ends |= static_cast<std::uint64_t>(e_bytes[b]) << shift;
      }
    }
    out[w] = m;
  }
}

HWY_INLINE std::uint64_t PortablePrefixXor(std::uint64_t x) {
  for (int i = 0; i < 6; ++i) x ^= x << (1 << i);
  return x;
}

// clmul(x, ~0) is the inclusive prefix XOR of x.
HWY_NOINLINE std::uint64_t PrefixXorImpl(std::uint64_t bits) {
#if HWY_TARGET == HWY_EMU128 || HWY_TARGET == HWY_SCALAR
  return PortablePrefixXor(bits);
#else
  const hn::FixedTag<std::uint64_t, 2> d;
  const auto v = hn::Set(d, bits);
  const auto ones = hn::Set(d, ~std::uint64_t{0});
  return hn::GetLane(hn::CLMulLower(v, ones));
#endif
}

}
}
HWY_AFTER_NAMESPACE();

#if HWY_ONCE

namespace ctb {

HWY_EXPORT(ClassifyWordsImpl);
HWY_EXPORT(PrefixXorImpl);

void classify_words(const char* data, std::size_t words, char delim_lead, char quote_lead, WordMasks* out) {
  HWY_DYNAMIC_DISPATCH(ClassifyWordsImpl)(data, words, static_cast<std::uint8_t>(delim_lead),
                                          static_cast<std::uint8_t>(quote_lead), out);
}

std::uint64_t prefix_xor(std::uint64_t bits) {
  return HWY_DYNAMIC_DISPATCH(PrefixXorImpl)(bits);
}

}

#endif
