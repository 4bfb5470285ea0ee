#include "csv_toolbox/chunk_source.hpp"
#include "csv_toolbox/decoder.hpp"
#include "csv_toolbox/parse.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static std::string utf16le(const std::u16string& s) {
  std::string out;
  for (char16_t u : s) {
    out.push_back(static_cast<char>(u & 0xFF));
    out.push_back(static_cast<char>(u >> 8));
  }
  return out;
}

int main() {
  // labels
  {
    check(ctb::is_utf8_charset("UTF-8") && ctb::is_utf8_charset("utf8"), "utf-8 labels");
    check(!ctb::is_utf8_charset("latin1"), "latin1 is not utf-8");
    check(ctb::is_supported_charset("ISO-8859-1") && ctb::is_supported_charset("utf-16le"), "supported labels");
    check(!ctb::is_supported_charset("shift_jis"), "unsupported label");
    ctb::Decoder bad("ebcdic");
    check(!bad.ok() && bad.error().code == ctb::ErrorCode::InvalidOption, "decoder rejects unknown charset");
  }

  // latin1 maps bytes to code points
  {
    ctb::Decoder d("latin1");
    std::string out;
    check(d.decode("caf\xE9", true, out) && out == "caf\xC3\xA9", "latin1 e-acute");
  }

  // utf-16 split inside a code unit and inside a surrogate pair
  {
    const std::string bytes = utf16le(u"a,\U0001F600\n");
    for (std::size_t cut = 0; cut <= bytes.size(); ++cut) {
      ctb::Decoder d("utf-16le");
      std::string out;
      d.decode(std::string_view(bytes).substr(0, cut), false, out);
      d.decode(std::string_view(bytes).substr(cut), true, out);
      if (out != "a,\xF0\x9F\x98\x80\n") {
        check(false, "utf-16 split at " + std::to_string(cut));
        break;
      }
    }
    ctb::Decoder be("utf-16be");
    std::string out;
    be.decode(std::string("\x00" "A\x00", 3), true, out);
    check(out == "A\xEF\xBF\xBD", "dangling byte becomes U+FFFD");
  }

  // unpaired surrogates decode to U+FFFD, the rest of the chunk survives
  {
    ctb::Decoder d("utf-16le");
    std::string out;
    const std::string lone_high = utf16le(std::u16string(u"x") + char16_t(0xD83D) + u"y");
    check(d.decode(lone_high, true, out) && out == "x\xEF\xBF\xBDy", "lone high surrogate");
    ctb::Decoder d2("utf-16le");
    std::string out2;
    const std::string lone_low = utf16le(std::u16string(1, char16_t(0xDE00)) + u"z");
    check(d2.decode(lone_low, true, out2) && out2 == "\xEF\xBF\xBDz", "lone low surrogate");
    ctb::Decoder d3("utf-16le");
    std::string out3;
    d3.decode(utf16le(std::u16string(u"q") + char16_t(0xD83D)), false, out3);
    d3.decode("", true, out3);
    check(out3 == "q\xEF\xBF\xBD", "high surrogate at end of input");
  }

  // latin1 upper half and ascii in one chunk
  {
    ctb::Decoder d("ISO-8859-1");
    std::string out;
    check(d.decode("\xA7;\xFF", true, out) && out == "\xC2\xA7;\xC3\xBF", "latin1 upper half");
  }

  // end to end: latin1 byte stream in small chunks
  {
    auto src = std::make_shared<ctb::StringChunkSource>(
        std::vector<std::string>{"na", "me\nJos\xE9\n", "M\xFCller"});
    std::vector<ctb::Record> rs;
    ctb::Error err;
    bool ok = ctb::parse_all(ctb::ParseInput::from_byte_stream(src, "latin1"), ctb::ParseOptions{},
                             ctb::EngineConfig{}, rs, &err);
    check(ok && rs.size() == 2, "latin1 stream parsed: " + err.to_string());
    if (rs.size() == 2) {
      check(*rs[0].find("name") == std::string("Jos\xC3\xA9"), "decoded first value");
      check(*rs[1].find("name") == std::string("M\xC3\xBC" "ller"), "decoded second value");
    }
  }

  // utf-16 buffered bytes with a BOM
  {
    std::string bytes = utf16le(u"\uFEFFk\n\u00E9");
    std::vector<ctb::Record> rs;
    ctb::Error err;
    bool ok = ctb::parse_all(ctb::ParseInput::from_bytes(bytes, "utf-16le"), ctb::ParseOptions{},
                             ctb::EngineConfig{}, rs, &err);
    check(ok && rs.size() == 1 && rs[0].keys()[0] == "k" && *rs[0].find("k") == std::string("\xC3\xA9"),
          "utf-16 document with BOM");
  }

  // unsupported charset and size limit are rejected up front
  {
    ctb::Error err;
    std::vector<ctb::Record> rs;
    check(!ctb::parse_all(ctb::ParseInput::from_bytes("a", "koi8-r"), ctb::ParseOptions{}, ctb::EngineConfig{}, rs, &err) &&
          err.code == ctb::ErrorCode::InvalidOption, "unsupported charset");
    ctb::ParseOptions small;
    small.max_binary_size = 3;
    check(!ctb::parse_all(ctb::ParseInput::from_bytes("a,b\n1,2"), small, ctb::EngineConfig{}, rs, &err) &&
          err.code == ctb::ErrorCode::BufferLimitExceeded, "binary size limit");
  }

  // file source reads in fixed chunks
  {
    ctb::FileChunkSource::Config cfg;
    cfg.chunk_bytes = 4;
    ctb::FileChunkSource src("tests/data/simple.csv", cfg);
    std::string chunk, all;
    std::size_t chunks = 0;
    while (src.next(chunk)) { all += chunk; ++chunks; }
    check(src.error().ok() && chunks > 1 && src.bytes_read() == all.size(), "file read in chunks");

    ctb::FileChunkSource missing("tests/data/does_not_exist.csv");
    check(!missing.next(chunk) && missing.error().code == ctb::ErrorCode::Io, "missing file is an Io error");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " decoder checks failed\n"; return 1; }
  std::cout << "[PASS] decoder and input shapes\n";
  return 0;
}
