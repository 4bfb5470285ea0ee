#pragma once
#include <string>
#include <string_view>

namespace ctb {

// Quotes `value` when it holds the delimiter, the quotation, CR or LF, doubling
// embedded quotations. Empty values are quoted too so a lone field survives as a row.
std::string escape_field(std::string_view value, std::string_view delimiter = ",",
                         std::string_view quotation = "\"");

}
