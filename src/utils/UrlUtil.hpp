#pragma once
#include <string>
#include <utility>
#include <vector>
#include <optional>

namespace MangaHarvest {

// Ordered so that generated URLs are stable.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

namespace UrlUtil {

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate starts with http:// or https://, return as-is.
// - If candidate starts with //, prefix https:.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// On parse failure, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

// Percent-encode everything except RFC 3986 unreserved characters.
std::string Encode(const std::string& s);

// Append params as an encoded query string, joining with '?' or '&' as needed.
std::string WithQuery(const std::string& url, const QueryParams& params);

// Extension of the last path segment, without the dot. Everything after the
// first dot counts ("archive.tar.gz" -> "tar.gz"). Query and fragment are ignored.
// Returns "" for directory URLs and segments without a dot.
std::string GetExtension(const std::string& url);

// Page number from a pagination link such as ".../page/7/" or "...?paged=7".
std::optional<int> PageNumberFromUrl(const std::string& url);

}
}
