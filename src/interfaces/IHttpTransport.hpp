#pragma once
#include <string>

namespace MangaHarvest {

struct HttpResponse {
    std::string content;
    long status_code = 0;
    std::string error;          // non-empty on connection-level failure (DNS, TLS, timeout...)
    bool permanent = false;     // error will recur on every attempt (body over the size cap)
    std::string effective_url;
};

// One GET, one attempt. Retrying is the caller's business.
// Implementations must be safe to call from several threads at once.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse Get(const std::string& url, long timeout_ms) = 0;
};

}
