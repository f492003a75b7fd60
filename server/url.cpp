// url.cpp
#include "url.hpp"

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            int hi = (i + 2 < in.size()) ? hex_value(in[i + 1]) : -1;
            int lo = (i + 2 < in.size()) ? hex_value(in[i + 2]) : -1;
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

RequestTarget parse_target(const std::string& target) {
    RequestTarget out;
    size_t qpos = target.find('?');
    std::string path = target.substr(0, qpos);
    std::string query = (qpos == std::string::npos) ? std::string() : target.substr(qpos + 1);

    // fragments are never sent by clients, but drop one if it shows up
    size_t hpos = query.find('#');
    if (hpos != std::string::npos) query.erase(hpos);

    for (const auto& raw : split(path, '/')) {
        if (raw.empty()) continue;
        out.segments.push_back(percent_decode(raw));
    }

    if (query.empty()) return out;
    for (const auto& pair : split(query, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        std::string key = percent_decode(pair.substr(0, eq), true);
        out.query[key] = percent_decode(eq == std::string::npos ? std::string() : pair.substr(eq + 1), true);
    }
    return out;
}
