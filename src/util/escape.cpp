#include "csv_toolbox/escape.hpp"

namespace ctb {

std::string escape_field(std::string_view value, std::string_view delimiter, std::string_view quotation) {
  const bool needs_quotes = value.empty() || value.find_first_of("\r\n") != std::string_view::npos ||
                            value.find(delimiter) != std::string_view::npos ||
                            value.find(quotation) != std::string_view::npos;
  if (!needs_quotes) return std::string(value);
  std::string out;
  out.reserve(value.size() + 2 * quotation.size());
  out.append(quotation.data(), quotation.size());
  std::size_t pos = 0;
  for (std::size_t j = value.find(quotation); j != std::string_view::npos; j = value.find(quotation, pos)) {
    out.append(value.data() + pos, j + quotation.size() - pos);
    out.append(quotation.data(), quotation.size());
    pos = j + quotation.size();
  }
  out.append(value.data() + pos, value.size() - pos);
  out.append(quotation.data(), quotation.size());
  return out;
}

}
