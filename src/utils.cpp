#include "utils.hpp"
#include <openssl/sha.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string generate_node_id(){
    char host[256] = {0};
    if(gethostname(host, sizeof(host) - 1) != 0) host[0] = '\0';
    const auto ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::ostringstream seed;
    seed << host << ':' << getpid() << ':' << ticks;
    return "node-" + sha256_hex(seed.str()).substr(0, 16);
}

std::string trim_ascii(const std::string& s){
    auto is_space = [](unsigned char c){ return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; };
    std::size_t begin = 0, end = s.size();
    while(begin < end && is_space(static_cast<unsigned char>(s[begin]))) ++begin;
    while(end > begin && is_space(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string to_lower_ascii(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_ascii(const std::string& s){
    return std::all_of(s.begin(), s.end(), [](char c){ return static_cast<unsigned char>(c) < 0x80; });
}

std::vector<std::string> split(const std::string& s, char sep){
    std::vector<std::string> out;
    std::size_t start = 0;
    for(;;){
        auto pos = s.find(sep, start);
        if(pos == std::string::npos){
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string percent_encode(const std::string& s){
    static const char* digits = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for(unsigned char c : s){
        if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~'){
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> percent_decode(const std::string& s){
    auto hex = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for(std::size_t i = 0; i < s.size(); ++i){
        if(s[i] != '%'){
            out.push_back(s[i]);
            continue;
        }
        if(i + 2 >= s.size()) return std::nullopt;
        int hi = hex(s[i + 1]), lo = hex(s[i + 2]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::int64_t to_epoch_ms(SystemTime t){
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

SystemTime from_epoch_ms(std::int64_t ms){
    return SystemTime(std::chrono::duration_cast<SystemTime::duration>(std::chrono::milliseconds(ms)));
}

std::string format_iso8601(SystemTime t){
    const auto ms = to_epoch_ms(t);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if(millis < 0){
        millis += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::optional<SystemTime> parse_iso8601(const std::string& text){
    std::tm tm{};
    int millis = 0;
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(iss.fail()) return std::nullopt;
    if(iss.peek() == '.'){
        iss.get();
        std::string frac;
        while(std::isdigit(iss.peek())) frac.push_back(static_cast<char>(iss.get()));
        if(frac.empty()) return std::nullopt;
        frac.resize(3, '0');
        millis = std::stoi(frac);
    }
    if(iss.get() != 'Z') return std::nullopt;
    const std::time_t secs = timegm(&tm);
    if(secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return from_epoch_ms(static_cast<std::int64_t>(secs) * 1000 + millis);
}
