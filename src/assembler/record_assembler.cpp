#include "csv_toolbox/record_assembler.hpp"
#include <unordered_set>
#include <utility>

namespace ctb {

const char* to_string(ColumnCountPolicy p) {
  switch (p) {
    case ColumnCountPolicy::Keep:     return "keep";
    case ColumnCountPolicy::Pad:      return "pad";
    case ColumnCountPolicy::Strict:   return "strict";
    case ColumnCountPolicy::Truncate: return "truncate";
    case ColumnCountPolicy::Fill:     return "fill";
  }
  return "keep";
}

const char* to_string(OutputShape s) { return s == OutputShape::Array ? "array" : "object"; }

bool parse_column_policy(std::string_view s, ColumnCountPolicy* out) {
  if (s == "keep")          *out = ColumnCountPolicy::Keep;
  else if (s == "pad" || s == "sparse") *out = ColumnCountPolicy::Pad;
  else if (s == "strict")   *out = ColumnCountPolicy::Strict;
  else if (s == "truncate") *out = ColumnCountPolicy::Truncate;
  else if (s == "fill")     *out = ColumnCountPolicy::Fill;
  else return false;
  return true;
}

bool parse_output_shape(std::string_view s, OutputShape* out) {
  if (s == "object")     *out = OutputShape::Object;
  else if (s == "array") *out = OutputShape::Array;
  else return false;
  return true;
}

namespace {

bool has_duplicates(const std::vector<std::string>& names) {
  std::unordered_set<std::string> seen;
  for (const auto& n : names) {
    if (!seen.insert(n).second) return true;
  }
  return false;
}

Error option_error(std::string msg) { return make_error(ErrorCode::InvalidOption, std::move(msg)); }

}

bool validate_assembler_config(const AssemblerConfig& cfg, Error* err_out) {
  if (cfg.max_field_count == 0)
    return set_error(err_out, option_error("max_field_count must be at least 1"));
  if (cfg.include_header && cfg.output != OutputShape::Array)
    return set_error(err_out, option_error("include_header is only supported for array output"));
  if (!cfg.header) return true;

  const auto& h = *cfg.header;
  if (h.empty()) {
    if (cfg.output != OutputShape::Array)
      return set_error(err_out, option_error("Headerless mode (empty header) requires array output"));
    if (cfg.policy != ColumnCountPolicy::Keep)
      return set_error(err_out, option_error(
          std::string("Headerless mode (empty header) only supports the keep column count policy, got '") +
          to_string(cfg.policy) + "'"));
    return true;
  }
  if (h.size() > cfg.max_field_count)
    return set_error(err_out, option_error("Header length (" + std::to_string(h.size()) +
                                           ") exceeds max_field_count of " +
                                           std::to_string(cfg.max_field_count)));
  if (has_duplicates(h))
    return set_error(err_out, option_error("The header must not contain duplicate fields"));
  return true;
}

struct RecordAssembler::Impl {
  AssemblerConfig cfg;
  Error err;
  bool valid = true;

  std::vector<std::string> row;
  std::size_t field_index = 0;
  bool dirty = false;              // a field or delimiter arrived since the last record
  std::uint64_t row_number = 1;

  bool headerless = false;
  std::shared_ptr<const Header> header;   // every column name
  std::shared_ptr<const Header> keys;     // names used as object keys (non-empty)
  std::vector<std::size_t> key_columns;   // column index of each key
  std::uint64_t emitted = 0;

  bool fail(ErrorCode code, std::string msg) {
    err = make_error(code, std::move(msg));
    err.row = row_number;
    err.source = cfg.source;
    return false;
  }

  void set_header(std::vector<std::string> names) {
    std::vector<std::string> key_names;
    key_columns.clear();
    for (std::size_t i = 0; i < names.size(); ++i) {
      if (names[i].empty()) continue;
      key_names.push_back(names[i]);
      key_columns.push_back(i);
    }
    header = std::make_shared<const Header>(std::move(names));
    keys = std::make_shared<const Header>(std::move(key_names));
  }

  void emit(Record&& r, const RecordCallback& cb) {
    ++emitted;
    cb(std::move(r));
  }

  bool infer_header(std::size_t n, const RecordCallback& cb) {
    if (n == 0) return fail(ErrorCode::ParseError, "The header must not be empty");
    std::vector<std::string> names(row.begin(), row.begin() + static_cast<std::ptrdiff_t>(n));
    if (has_duplicates(names))
      return fail(ErrorCode::ParseError, "The header must not contain duplicate fields");
    if (cfg.include_header) {
      std::vector<FieldValue> values(names.begin(), names.end());
      emit(Record::make_array(std::move(values)), cb);
    }
    set_header(std::move(names));
    return true;
  }

  Record empty_record() const {
    if (headerless) return Record::make_array({});
    if (cfg.output == OutputShape::Object)
      return Record::make_object(keys, std::vector<FieldValue>(keys->size(), std::string()));
    return Record::make_array(std::vector<FieldValue>(header->size(), std::string()));
  }

  Record build_object(std::size_t n) {
    std::vector<FieldValue> values;
    values.reserve(key_columns.size());
    for (std::size_t col : key_columns) {
      if (col < n) values.emplace_back(std::move(row[col]));
      else if (cfg.policy == ColumnCountPolicy::Pad) values.emplace_back(std::nullopt);
      else values.emplace_back(std::string());
    }
    return Record::make_object(keys, std::move(values));
  }

  Record build_array(std::size_t n) {
    const std::size_t h = headerless ? n : header->size();
    std::size_t len = n;
    switch (cfg.policy) {
      case ColumnCountPolicy::Pad:
      case ColumnCountPolicy::Fill:     len = h; break;
      case ColumnCountPolicy::Truncate: len = n < h ? n : h; break;
      case ColumnCountPolicy::Keep:
      case ColumnCountPolicy::Strict:   break;
    }
    std::vector<FieldValue> values;
    values.reserve(len);
    for (std::size_t i = 0; i < len; ++i) {
      if (i < n) values.emplace_back(std::move(row[i]));
      else if (cfg.policy == ColumnCountPolicy::Pad) values.emplace_back(std::nullopt);
      else values.emplace_back(std::string());
    }
    return Record::make_array(std::move(values));
  }

  bool complete_row(const RecordCallback& cb) {
    const std::size_t n = dirty ? field_index + 1 : 0;
    if (row.size() < n) row.resize(n);
    bool ok = true;
    if (!header && !headerless) {
      ok = infer_header(n, cb);
    } else if (n == 0) {
      if (!cfg.skip_empty_lines) emit(empty_record(), cb);
    } else if (cfg.policy == ColumnCountPolicy::Strict && !headerless && n != header->size()) {
      ok = fail(ErrorCode::ColumnCountMismatch,
                "Expected " + std::to_string(header->size()) + " columns, got " + std::to_string(n));
    } else {
      emit(cfg.output == OutputShape::Object ? build_object(n) : build_array(n), cb);
    }
    for (auto& f : row) f.clear();
    field_index = 0;
    dirty = false;
    return ok;
  }
};

RecordAssembler::RecordAssembler(AssemblerConfig cfg) : p_(new Impl{}) {
  p_->cfg = std::move(cfg);
  p_->valid = validate_assembler_config(p_->cfg, &p_->err);
  if (p_->valid && p_->cfg.header) {
    if (p_->cfg.header->empty()) p_->headerless = true;
    else p_->set_header(*p_->cfg.header);
  }
}

RecordAssembler::~RecordAssembler() { delete p_; }

bool RecordAssembler::ok() const { return p_->valid; }

bool RecordAssembler::assemble(const Token& token, const RecordCallback& on_record) {
  Impl& s = *p_;
  if (!s.valid || !s.err.ok()) return false;
  s.row_number = token.location.row;
  switch (token.kind) {
    case TokenKind::Field:
      if (s.row.size() <= s.field_index) s.row.resize(s.field_index + 1);
      s.row[s.field_index] = token.value;
      s.dirty = true;
      return true;
    case TokenKind::FieldDelimiter:
      ++s.field_index;
      s.dirty = true;
      if (s.field_index + 1 > s.cfg.max_field_count)
        return s.fail(ErrorCode::BufferLimitExceeded,
                      "Field count (" + std::to_string(s.field_index + 1) +
                      ") exceeded maximum allowed count of " + std::to_string(s.cfg.max_field_count));
      return true;
    case TokenKind::RecordDelimiter:
      return s.complete_row(on_record);
  }
  return true;
}

bool RecordAssembler::flush(const RecordCallback& on_record) {
  Impl& s = *p_;
  if (!s.valid || !s.err.ok()) return false;
  if (!s.dirty) return true;
  return s.complete_row(on_record);
}

const Error& RecordAssembler::error() const { return p_->err; }
const Header* RecordAssembler::header() const { return p_->header.get(); }
std::uint64_t RecordAssembler::records() const { return p_->emitted; }

}
