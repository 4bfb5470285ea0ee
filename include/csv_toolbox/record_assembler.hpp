#pragma once
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/record.hpp"
#include "csv_toolbox/token.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctb {

constexpr std::size_t kDefaultMaxFieldCount = 100000;

enum class ColumnCountPolicy {
  Keep,      // emit rows as they are
  Pad,       // pad short rows with missing values, truncate long ones
  Strict,    // length must equal the header
  Truncate,  // truncate long rows, never pad
  Fill,      // pad short rows with "", truncate long ones
};

enum class OutputShape { Object, Array };

const char* to_string(ColumnCountPolicy p);
const char* to_string(OutputShape s);
bool parse_column_policy(std::string_view s, ColumnCountPolicy* out);
bool parse_output_shape(std::string_view s, OutputShape* out);

struct AssemblerConfig {
  std::optional<std::vector<std::string>> header; // nullopt: infer from row 1; empty: headerless
  ColumnCountPolicy policy = ColumnCountPolicy::Keep;
  OutputShape output       = OutputShape::Object;
  bool include_header      = false;   // array output: emit the inferred header first
  bool skip_empty_lines    = false;
  std::size_t max_field_count = kDefaultMaxFieldCount;
  std::string source;
};

bool validate_assembler_config(const AssemblerConfig& cfg, Error* err_out = nullptr);

// Turns a token stream into records. One instance serves one document.
class RecordAssembler {
public:
  explicit RecordAssembler(AssemblerConfig cfg);
  ~RecordAssembler();
  RecordAssembler(const RecordAssembler&) = delete;
  RecordAssembler& operator=(const RecordAssembler&) = delete;

  bool ok() const;

  bool assemble(const Token& token, const RecordCallback& on_record);
  // Emits the pending row when the document did not end with a record delimiter.
  bool flush(const RecordCallback& on_record);

  const Error& error() const;
  // Full resolved header; nullptr before inference and in headerless mode.
  const Header* header() const;
  std::uint64_t records() const;

private:
  struct Impl; Impl* p_;
};

}
