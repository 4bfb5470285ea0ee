#pragma once
#include "csv_toolbox/cancellation.hpp"
#include "csv_toolbox/csv_lexer.hpp"
#include "csv_toolbox/error.hpp"
#include "csv_toolbox/record_assembler.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ctb {

constexpr std::size_t kDefaultMaxBinarySize = 100 * 1024 * 1024; // buffered byte input
constexpr std::size_t kDefaultLexerBackpressureInterval = 100;   // tokens
constexpr std::size_t kDefaultAssemblerBackpressureInterval = 10; // records
constexpr std::size_t kDefaultChannelCapacity = 1024;             // records in flight

// Everything that shapes the records of one call. Engine choice lives in EngineConfig.
struct ParseOptions {
  std::string delimiter = ",";
  std::string quotation = "\"";
  std::optional<std::vector<std::string>> header;   // nullopt: first row; empty: headerless
  ColumnCountPolicy column_count_policy = ColumnCountPolicy::Keep;
  OutputShape output = OutputShape::Object;
  bool include_header = false;
  bool skip_empty_lines = false;

  std::size_t max_buffer_size = kDefaultMaxBufferSize;
  std::size_t max_field_count = kDefaultMaxFieldCount;
  std::size_t max_binary_size = kDefaultMaxBinarySize;

  std::size_t lexer_backpressure_interval = kDefaultLexerBackpressureInterval;
  std::size_t assembler_backpressure_interval = kDefaultAssemblerBackpressureInterval;
  std::size_t channel_capacity = kDefaultChannelCapacity;

  std::string source;       // appears in error messages
  CancellationToken cancel;

  LexerConfig lexer_config() const;
  AssemblerConfig assembler_config() const;
};

bool validate_parse_options(const ParseOptions& opts, Error* err_out = nullptr);

}
