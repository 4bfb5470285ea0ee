#pragma once
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/execution_plan.hpp"
#include <cstddef>
#include <cstdint>
#include <future>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctb {

struct Separator {
  std::uint64_t offset = 0;
  char kind = ',';   // delimiter lead byte, '\r' or '\n'
};

// Bit i set when byte i of a 64-byte word matches.
struct WordMasks {
  std::uint64_t delimiters = 0;  // delimiter lead byte
  std::uint64_t quotes = 0;      // quotation lead byte
  std::uint64_t line_ends = 0;   // CR or LF
};

// SIMD byte compares over `words` full 64-byte words (Highway, runtime dispatch).
void classify_words(const char* data, std::size_t words, char delim_lead, char quote_lead, WordMasks* out);

// Inclusive prefix XOR of a 64-bit word: bit i = XOR of bits 0..i. CLMUL where
// the target has it.
std::uint64_t prefix_xor(std::uint64_t bits);

// Finds every delimiter / CR / LF outside quotes in a whole buffer.
// Pass 1 computes per-block quote parity, a prefix XOR over blocks gives each
// block its starting quote state, pass 2 keeps the separators whose in-quote
// bit is clear. Blocks run on parallel threads for the high-performance
// preference.
//
// Parity only matches the lexer while every opening quotation sits at a field
// start. When one does not (`a"b`, `"a"b"c`), the buffer is indexed again by a
// scalar walk of the lexer's state machine.
class SeparatorIndexer {
public:
  struct Config {
    std::string delimiter = ",";
    std::string quote     = "\"";
    AcceleratedTuning tuning;
  };

  struct Stats {
    std::size_t blocks = 0;
    std::size_t threads = 0;
    bool scalar_path = false;
  };

  explicit SeparatorIndexer(Config cfg) : cfg_(std::move(cfg)) {}

  // `ends_in_quotes`: the buffer ends inside a quoted field.
  // Fails with BackendUnavailable when worker threads cannot be started.
  bool index(std::string_view text, std::vector<Separator>& out, bool* ends_in_quotes,
             Error* err_out = nullptr) const;

  std::size_t block_bytes() const noexcept;
  const Stats& stats() const { return stats_; }

private:
  void block_masks(std::string_view text, std::size_t lo, std::size_t hi, std::vector<WordMasks>& out) const;
  bool at_field_start(std::string_view text, std::size_t at) const;
  void index_scalar(std::string_view text, std::vector<Separator>& out, bool* ends_in_quotes) const;

  Config cfg_;
  mutable Stats stats_;
};

// Asynchronous availability check: indexes a small sample on a background
// thread. Never blocks the caller; callers bound the wait themselves.
std::future<bool> accelerated_is_available();

}
