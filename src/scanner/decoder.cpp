#include "csv_toolbox/decoder.hpp"
#include <simdutf.h>
#include <cctype>
#include <cstring>
#include <vector>

namespace ctb {

namespace {

std::string normalize_label(std::string_view label) {
  std::string s;
  s.reserve(label.size());
  for (char c : label) {
    if (c == '-' || c == '_' || c == ' ') continue;
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return s;
}

}

bool is_utf8_charset(std::string_view label) {
  const std::string s = normalize_label(label);
  return s == "utf8" || s == "utf8bom";
}

bool is_supported_charset(std::string_view label) {
  const std::string s = normalize_label(label);
  return s == "utf8" || s == "utf8bom" || s == "latin1" || s == "iso88591" || s == "usascii" ||
         s == "ascii" || s == "utf16le" || s == "utf16be";
}

Decoder::Decoder(std::string charset) : charset_(std::move(charset)) {
  const std::string s = normalize_label(charset_);
  if (s == "utf8" || s == "utf8bom") kind_ = Kind::Utf8;
  else if (s == "latin1" || s == "iso88591" || s == "usascii" || s == "ascii") kind_ = Kind::Latin1;
  else if (s == "utf16le") kind_ = Kind::Utf16LE;
  else if (s == "utf16be") kind_ = Kind::Utf16BE;
  else err_ = make_error(ErrorCode::InvalidOption, "Unsupported charset: " + charset_);
}

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

char16_t unit_at(const std::string& data, std::size_t i, bool le) {
  const auto b0 = static_cast<unsigned char>(data[2 * i]);
  const auto b1 = static_cast<unsigned char>(data[2 * i + 1]);
  return le ? static_cast<char16_t>(b0 | (b1 << 8)) : static_cast<char16_t>((b0 << 8) | b1);
}

void set_unit(std::string& data, std::size_t i, char16_t u, bool le) {
  data[2 * i + (le ? 0 : 1)] = static_cast<char>(u & 0xFF);
  data[2 * i + (le ? 1 : 0)] = static_cast<char>(u >> 8);
}

bool is_high(char16_t u) { return u >= 0xD800 && u <= 0xDBFF; }
bool is_low(char16_t u) { return u >= 0xDC00 && u <= 0xDFFF; }

// Unpaired surrogates become U+FFFD so the transcoder sees valid UTF-16.
void replace_lone_surrogates(std::string& data, std::size_t units, bool le) {
  for (std::size_t i = 0; i < units; ++i) {
    const char16_t u = unit_at(data, i, le);
    if (is_high(u) && i + 1 < units && is_low(unit_at(data, i + 1, le))) {
      ++i;
      continue;
    }
    if (is_high(u) || is_low(u)) set_unit(data, i, 0xFFFD, le);
  }
}

}

bool Decoder::decode_utf16(std::string_view bytes, bool final_chunk, std::string& out) {
  const bool le = kind_ == Kind::Utf16LE;
  std::string data;
  data.reserve(carry_.size() + bytes.size());
  data.append(carry_);
  data.append(bytes.data(), bytes.size());
  carry_.clear();

  // Hold back an odd byte, and a high surrogate whose pair may follow.
  std::size_t units = data.size() / 2;
  if (!final_chunk && units > 0 && is_high(unit_at(data, units - 1, le))) --units;
  carry_.assign(data, units * 2, std::string::npos);

  if (units > 0) {
    // Copy into a char16_t buffer: the chunk bytes carry no alignment guarantee.
    std::vector<char16_t> buf(units);
    std::memcpy(buf.data(), data.data(), units * sizeof(char16_t));
    const bool valid = le ? simdutf::validate_utf16le(buf.data(), units)
                          : simdutf::validate_utf16be(buf.data(), units);
    if (!valid) {
      replace_lone_surrogates(data, units, le);
      std::memcpy(buf.data(), data.data(), units * sizeof(char16_t));
    }

    const std::size_t utf8_len = le ? simdutf::utf8_length_from_utf16le(buf.data(), units)
                                    : simdutf::utf8_length_from_utf16be(buf.data(), units);
    const std::size_t at = out.size();
    out.resize(at + utf8_len);
    const std::size_t written = le ? simdutf::convert_utf16le_to_utf8(buf.data(), units, &out[at])
                                   : simdutf::convert_utf16be_to_utf8(buf.data(), units, &out[at]);
    if (written == 0) {
      out.resize(at);
      err_ = make_error(ErrorCode::ParseError, "Failed to transcode " + charset_ + " to UTF-8");
      return false;
    }
    out.resize(at + written);
  }

  if (final_chunk) {
    if (!carry_.empty()) out.append(kReplacement.data(), kReplacement.size());
    carry_.clear();
  }
  return true;
}

bool Decoder::decode_latin1(std::string_view bytes, std::string& out) {
  if (bytes.empty()) return true;
  const std::size_t utf8_len = simdutf::utf8_length_from_latin1(bytes.data(), bytes.size());
  const std::size_t at = out.size();
  out.resize(at + utf8_len);
  const std::size_t written = simdutf::convert_latin1_to_utf8(bytes.data(), bytes.size(), &out[at]);
  if (written == 0) {
    out.resize(at);
    err_ = make_error(ErrorCode::ParseError, "Failed to transcode " + charset_ + " to UTF-8");
    return false;
  }
  out.resize(at + written);
  return true;
}

bool Decoder::decode(std::string_view bytes, bool final_chunk, std::string& out) {
  if (!err_.ok()) return false;
  switch (kind_) {
    case Kind::Utf8:
      out.append(bytes.data(), bytes.size());
      return true;
    case Kind::Latin1:
      return decode_latin1(bytes, out);
    case Kind::Utf16LE:
    case Kind::Utf16BE:
      return decode_utf16(bytes, final_chunk, out);
  }
  return true;
}

}
