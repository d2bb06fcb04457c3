#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "peer_error.hpp"
#include "utils.hpp"

namespace {

std::vector<std::string> split_lines(const std::string& head) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while(start <= head.size()) {
        auto pos = head.find("\r\n", start);
        if(pos == std::string::npos) {
            if(start < head.size()) lines.push_back(head.substr(start));
            break;
        }
        lines.push_back(head.substr(start, pos - start));
        start = pos + 2;
    }
    return lines;
}

template<typename Fail>
void parse_header_lines(const std::vector<std::string>& lines,
                        std::map<std::string, std::string>& out,
                        Fail fail) {
    for(std::size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if(line.empty()) continue;
        auto colon = line.find(':');
        if(colon == std::string::npos || colon == 0) fail("malformed header line");
        out[to_lower_ascii(trim_ascii(line.substr(0, colon)))] = trim_ascii(line.substr(colon + 1));
    }
}

std::string decode_component(const std::string& raw, bool plus_as_space) {
    std::string s = raw;
    if(plus_as_space) std::replace(s.begin(), s.end(), '+', ' ');
    auto decoded = percent_decode(s);
    if(!decoded) {
        throw_peer_error(ErrorKind::FormatError, "bad percent-encoding in '" + raw + "'");
    }
    return *decoded;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower_ascii(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::query_param(const std::string& name, const std::string& fallback) const {
    auto it = query.find(name);
    return it == query.end() ? fallback : it->second;
}

HttpResponse HttpResponse::json_body(int status, const json& body) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    // Invalid UTF-8 (from a decoded path or a file) becomes U+FFFD.
    r.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    return r;
}

HttpResponse HttpResponse::bytes(std::string data, std::string content_type) {
    HttpResponse r;
    r.status = 200;
    r.content_type = std::move(content_type);
    r.body = std::move(data);
    return r;
}

const char* http_status_text(int status) {
    switch(status) {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 504: return "Gateway Timeout";
    }
    return "Unknown";
}

HttpRequest parse_request_head(const std::string& head) {
    auto fail = [](const std::string& why) {
        throw_peer_error(ErrorKind::FormatError, "bad request: " + why);
    };
    const auto lines = split_lines(head);
    if(lines.empty()) fail("empty request");

    std::istringstream request_line(lines[0]);
    HttpRequest req;
    std::string version;
    if(!(request_line >> req.method >> req.target >> version)) fail("malformed request line");
    if(version.rfind("HTTP/1.", 0) != 0) fail("unsupported version " + version);
    if(req.target.empty() || req.target[0] != '/') fail("target must be an absolute path");

    std::string path = req.target;
    std::string query;
    if(auto q = path.find('?'); q != std::string::npos) {
        query = path.substr(q + 1);
        path.erase(q);
    }
    for(const auto& raw : split(path.substr(1), '/')) {
        if(raw.empty()) continue;
        req.segments.push_back(decode_component(raw, false));
    }
    if(!query.empty()) {
        for(const auto& pair : split(query, '&')) {
            if(pair.empty()) continue;
            auto eq = pair.find('=');
            auto key = decode_component(pair.substr(0, eq), true);
            auto value = eq == std::string::npos ? std::string() : decode_component(pair.substr(eq + 1), true);
            req.query[key] = value;
        }
    }
    parse_header_lines(lines, req.headers, fail);
    return req;
}

std::size_t request_content_length(const HttpRequest& request) {
    const auto value = request.header("content-length");
    if(value.empty()) return 0;
    if(!std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c); }) ||
       value.size() > 18) {
        throw_peer_error(ErrorKind::FormatError, "bad Content-Length '" + value + "'");
    }
    return static_cast<std::size_t>(std::stoull(value));
}

std::string serialize_response(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << http_status_text(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n";
    out << response.body;
    return out.str();
}

std::string build_get_request(const std::string& host, std::uint16_t port, const std::string& target) {
    std::ostringstream out;
    out << "GET " << target << " HTTP/1.1\r\n"
        << "Host: " << host << ':' << port << "\r\n"
        << "Accept: */*\r\n"
        << "Connection: close\r\n\r\n";
    return out.str();
}

HttpResponse parse_response(const std::string& raw) {
    auto fail = [](const std::string& why) {
        throw_peer_error(ErrorKind::ProtocolError, "bad response: " + why);
    };
    const auto end_of_head = raw.find("\r\n\r\n");
    if(end_of_head == std::string::npos) fail("no header terminator");
    const auto lines = split_lines(raw.substr(0, end_of_head));
    if(lines.empty()) fail("empty status line");

    std::istringstream status_line(lines[0]);
    std::string version;
    int status = 0;
    if(!(status_line >> version >> status) || version.rfind("HTTP/1.", 0) != 0 ||
       status < 100 || status > 599) {
        fail("malformed status line '" + lines[0] + "'");
    }

    std::map<std::string, std::string> headers;
    parse_header_lines(lines, headers, fail);
    if(auto te = headers.find("transfer-encoding"); te != headers.end() &&
       to_lower_ascii(te->second) != "identity") {
        fail("unsupported transfer-encoding " + te->second);
    }

    HttpResponse response;
    response.status = status;
    if(auto ct = headers.find("content-type"); ct != headers.end()) response.content_type = ct->second;
    response.body = raw.substr(end_of_head + 4);
    if(auto cl = headers.find("content-length"); cl != headers.end()) {
        const auto& v = cl->second;
        if(v.empty() || v.size() > 18 ||
           !std::all_of(v.begin(), v.end(), [](unsigned char c){ return std::isdigit(c); })) {
            fail("bad Content-Length '" + v + "'");
        }
        const auto expected = static_cast<std::size_t>(std::stoull(v));
        if(response.body.size() < expected) fail("truncated body");
        response.body.resize(expected);
    }
    return response;
}

std::string build_target(const std::vector<std::string>& segments,
                         const std::map<std::string, std::string>& query) {
    std::string target;
    for(const auto& s : segments) {
        target += '/';
        target += percent_encode(s);
    }
    if(target.empty()) target = "/";
    char sep = '?';
    for(const auto& kv : query) {
        target += sep;
        target += percent_encode(kv.first) + "=" + percent_encode(kv.second);
        sep = '&';
    }
    return target;
}

std::string guess_content_type(const std::string& filename) {
    auto dot = filename.rfind('.');
    const auto ext = dot == std::string::npos ? std::string() : to_lower_ascii(filename.substr(dot + 1));
    static const std::map<std::string, std::string> types{
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"}, {"gif", "image/gif"},
        {"bmp", "image/bmp"}, {"tiff", "image/tiff"}, {"webp", "image/webp"},
        {"md", "text/markdown; charset=utf-8"}, {"txt", "text/plain; charset=utf-8"},
        {"rst", "text/plain; charset=utf-8"}, {"html", "text/html; charset=utf-8"},
        {"pdf", "application/pdf"}, {"mp3", "audio/mpeg"}, {"wav", "audio/wav"},
        {"ogg", "audio/ogg"}, {"flac", "audio/flac"}, {"mp4", "video/mp4"},
        {"webm", "video/webm"}, {"mkv", "video/x-matroska"}};
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}
