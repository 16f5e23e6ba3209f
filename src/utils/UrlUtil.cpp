#include "UrlUtil.hpp"
#include <regex>
#include <cstring>

namespace MangaHarvest {
namespace UrlUtil {

static inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

static inline std::string get_scheme_host(const std::string& url) {
    // Very small parser: scheme://host[:port]
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos) return {};
    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    return url.substr(0, pos_end);
}

static inline std::string get_base_dir(const std::string& url) {
    // Returns scheme://host[:port]/path/dir (without filename)
    auto scheme_host = get_scheme_host(url);
    if (scheme_host.empty()) return {};
    std::string rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest = rest.substr(0, qpos);
    if (!rest.empty()) {
        if (rest.back() != '/') {
            auto slash = rest.find_last_of('/');
            rest = (slash != std::string::npos) ? rest.substr(0, slash + 1) : "/";
        }
    } else {
        rest = "/";
    }
    return scheme_host + rest;
}

// Path component only: no scheme/host, no query, no fragment.
static inline std::string get_path(const std::string& url) {
    std::string rest = url;
    auto scheme_host = get_scheme_host(url);
    if (!scheme_host.empty()) rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest.resize(qpos);
    return rest;
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    if (starts_with(candidate, "http://") || starts_with(candidate, "https://")) return candidate;
    if (starts_with(candidate, "//")) return std::string("https:") + candidate;

    auto scheme_host = get_scheme_host(base_url);
    if (scheme_host.empty()) return candidate; // fallback

    if (candidate[0] == '/') {
        return scheme_host + candidate;
    }

    auto base_dir = get_base_dir(base_url);
    if (base_dir.empty()) return candidate;
    if (base_dir.back() != '/') {
        return base_dir + "/" + candidate;
    }
    return base_dir + candidate;
}

std::string Encode(const std::string& s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string WithQuery(const std::string& url, const QueryParams& params) {
    if (params.empty()) return url;
    std::string out = url;
    char sep = (url.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& kv : params) {
        out.push_back(sep);
        out += Encode(kv.first);
        out.push_back('=');
        out += Encode(kv.second);
        sep = '&';
    }
    return out;
}

std::string GetExtension(const std::string& url) {
    std::string path = get_path(url);
    if (path.empty() || path.back() == '/') return {};
    auto slash = path.find_last_of('/');
    std::string segment = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = segment.find('.');
    if (dot == std::string::npos || dot + 1 >= segment.size()) return {};
    return segment.substr(dot + 1);
}

std::optional<int> PageNumberFromUrl(const std::string& url) {
    static const std::regex page_regex(R"((?:/page/|[?&]paged?=)(\d+))");
    std::smatch m;
    if (!std::regex_search(url, m, page_regex)) return std::nullopt;
    try {
        return std::stoi(m[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}
}
