#include "csv_toolbox/backends.hpp"

namespace ctb {

TokenPipeline::TokenPipeline(const ParseOptions& options, ExecutionSink& sink)
    : asm_(options.assembler_config()), sink_(sink) {
  emit_ = [this](Record&& r) { sink_.record(std::move(r)); };
}

bool TokenPipeline::push(const Token& t) {
  sink_.lexing.tick();
  return asm_.assemble(t, emit_);
}

bool TokenPipeline::finish() { return asm_.flush(emit_); }

std::string unescape_field(std::string_view raw, std::string_view quote) {
  if (raw.compare(0, quote.size(), quote) != 0) return std::string(raw);
  std::string out;
  out.reserve(raw.size());
  std::size_t pos = quote.size();
  while (pos < raw.size()) {
    const std::size_t j = raw.find(quote, pos);
    if (j == std::string_view::npos) {
      out.append(raw.substr(pos));                         // unterminated
      return out;
    }
    out.append(raw.substr(pos, j - pos));
    pos = j + quote.size();
    if (raw.compare(pos, quote.size(), quote) == 0) {      // doubled quotation
      out.append(quote);
      pos += quote.size();
      continue;
    }
    out.append(raw.substr(pos));                           // text after the closing quotation
    return out;
  }
  return out;
}

ExecutorTable ExecutorTable::defaults() {
  ExecutorTable t;
  t.plain = run_plain;
  t.compiled = run_compiled;
  t.accelerated = run_accelerated;
  return t;
}

const BackendExecutor& ExecutorTable::get(Backend b) const {
  switch (b) {
    case Backend::Compiled:    return compiled;
    case Backend::Accelerated: return accelerated;
    case Backend::Plain:       break;
  }
  return plain;
}

}
