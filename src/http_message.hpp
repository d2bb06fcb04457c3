#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "protocol.hpp"

inline constexpr std::size_t kMaxHeadBytes = 64 * 1024;

struct HttpRequest {
  std::string method;
  std::string target;                       // as sent: path + optional query
  std::vector<std::string> segments;        // percent-decoded path segments
  std::map<std::string, std::string> query; // percent-decoded
  std::map<std::string, std::string> headers; // names lower-cased
  std::string body;

  std::string header(const std::string& name) const;
  std::string query_param(const std::string& name, const std::string& fallback = "") const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;

  static HttpResponse json_body(int status, const json& body);
  static HttpResponse bytes(std::string data, std::string content_type);
};

const char* http_status_text(int status);

// `head` is everything before the blank line. Malformed input is FormatError.
HttpRequest parse_request_head(const std::string& head);
// 0 when absent; FormatError when not a decimal number.
std::size_t request_content_length(const HttpRequest& request);
std::string serialize_response(const HttpResponse& response);

// Client side.
std::string build_get_request(const std::string& host, std::uint16_t port, const std::string& target);
// `raw` is the full byte stream up to EOF. Malformed or truncated is ProtocolError.
HttpResponse parse_response(const std::string& raw);

// "/a/b c" style target from raw segments, each percent-encoded.
std::string build_target(const std::vector<std::string>& segments,
                         const std::map<std::string, std::string>& query = {});

std::string guess_content_type(const std::string& filename);
