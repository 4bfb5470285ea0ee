#include "csv_toolbox/record_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace ctb {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static void value(std::ostringstream& o, const FieldValue& v){
  if (v) esc(o, *v);
  else o << "null";
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RecordJsonWriter::to_json(const Record& r) {
  std::ostringstream o;
  if (r.is_object()) {
    const auto& keys = r.keys();
    o << "{";
    for (size_t i=0;i<r.size() && i<keys.size();++i){
      if (i) o << ",";
      esc(o, keys[i]); o << ":"; value(o, r.at(i));
    }
    o << "}";
  } else {
    o << "[";
    for (size_t i=0;i<r.size();++i){
      if (i) o << ",";
      value(o, r.at(i));
    }
    o << "]";
  }
  return o.str();
}

std::string RecordJsonWriter::to_json(const RunSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"records\":" << s.records << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(s.records_per_sec) << ",";
  o << "\"backend\":"; esc(o, s.backend); o << ",";
  o << "\"context\":"; esc(o, s.context); o << ",";
  o << "\"engine\":";  esc(o, s.engine);  o << ",";

  o << "\"fallbacks\":[";
  for (size_t i=0;i<s.fallbacks.size();++i){
    if (i) o << ",";
    const auto& f = s.fallbacks[i];
    o << "{\"requested\":"; esc(o, f.requested);
    o << ",\"actual\":";    esc(o, f.actual);
    o << ",\"reason\":";    esc(o, f.reason);
    o << "}";
  }
  o << "],";

  o << "\"filename\":"; esc(o, s.filename); o << ",";
  o << "\"charset\":";  esc(o, s.charset);  o << ",";
  o << "\"error\":";    esc(o, s.error);
  o << "}";
  return o.str();
}

}
