#include "csv_toolbox/response_options.hpp"
#include "csv_toolbox/decoder.hpp"
#include "csv_toolbox/parse.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>

namespace ctb {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return std::string();
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

std::string unquote(std::string s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') return s.substr(1, s.size() - 2);
  return s;
}

}

bool options_from_response(const httplib::Response& res, ResponseOptions& out, Error* err_out) {
  out = ResponseOptions{};
  if (res.has_header("Content-Type")) {
    const std::string ct = res.get_header_value("Content-Type");
    std::size_t pos = ct.find(';');
    out.mime_type = lower(trim(ct.substr(0, pos)));
    if (out.mime_type != "text/csv")
      return set_error(err_out, make_error(ErrorCode::InvalidOption, "Invalid mime type: \"" + ct + "\""));
    while (pos != std::string::npos) {
      const std::size_t next = ct.find(';', pos + 1);
      const std::string param = trim(ct.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1));
      const std::size_t eq = param.find('=');
      if (eq != std::string::npos && lower(trim(param.substr(0, eq))) == "charset")
        out.charset = lower(unquote(trim(param.substr(eq + 1))));
      pos = next;
    }
  }
  if (res.has_header("Content-Encoding"))
    out.content_encoding = lower(trim(res.get_header_value("Content-Encoding")));
  return true;
}

bool input_from_response(const httplib::Response& res, ParseInput& out, Error* err_out) {
  ResponseOptions ro;
  if (!options_from_response(res, ro, err_out)) return false;
  if (!ro.content_encoding.empty() && ro.content_encoding != "identity")
    return set_error(err_out, make_error(ErrorCode::InvalidOption,
                                         "Unsupported content encoding: " + ro.content_encoding));
  if (!is_supported_charset(ro.charset))
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "Unsupported charset: " + ro.charset));
  out = ParseInput::from_bytes(res.body, ro.charset);
  return true;
}

bool parse_response(const httplib::Response& res, const ParseOptions& options, const EngineConfig& engine,
                    const RecordCallback& on_record, Error* err_out, RunReport* report) {
  ParseInput input;
  if (!input_from_response(res, input, err_out)) return false;
  return parse(std::move(input), options, engine, on_record, err_out, report);
}

bool fetch_csv(const std::string& url, ParseInput& out, Error* err_out) {
  const std::size_t scheme = url.find("://");
  if (scheme == std::string::npos || lower(url.substr(0, scheme)) != "http")
    return set_error(err_out, make_error(ErrorCode::InvalidOption, "only http:// URLs are supported: " + url));
  const std::size_t path_at = url.find('/', scheme + 3);
  const std::string origin = path_at == std::string::npos ? url : url.substr(0, path_at);
  const std::string path = path_at == std::string::npos ? std::string("/") : url.substr(path_at);

  try {
    httplib::Client cli(origin);
    auto res = cli.Get(path);
    if (!res)
      return set_error(err_out, make_error(ErrorCode::Io, "GET " + url + " failed: " + httplib::to_string(res.error())));
    if (res->status != 200)
      return set_error(err_out, make_error(ErrorCode::Io, "GET " + url + " returned HTTP " + std::to_string(res->status)));
    return input_from_response(*res, out, err_out);
  } catch (const std::exception& e) {
    return set_error(err_out, make_error(ErrorCode::Io, std::string("GET ") + url + " failed: " + e.what()));
  }
}

}
