#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// "node-" followed by 16 hex chars derived from hostname, pid and clock.
std::string generate_node_id();

std::string trim_ascii(const std::string& s);
std::string to_lower_ascii(std::string s);
bool is_ascii(const std::string& s);
std::vector<std::string> split(const std::string& s, char sep);

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percent_encode(const std::string& s);
// Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(const std::string& s);

using SystemTime = std::chrono::system_clock::time_point;

std::int64_t to_epoch_ms(SystemTime t);
SystemTime from_epoch_ms(std::int64_t ms);
// UTC, millisecond precision: 2024-05-01T12:00:00.000Z
std::string format_iso8601(SystemTime t);
// Accepts the format above with or without the fraction.
std::optional<SystemTime> parse_iso8601(const std::string& text);
