#pragma once
#include <string>

namespace tc {

struct HttpsResponse {
  unsigned status{0};
  std::string body;
};

// Blocking HTTPS GET with peer verification. Follows up to 5 same-scheme
// redirects. Throws std::runtime_error on network or TLS failure.
HttpsResponse httpsGet(const std::string& host, const std::string& target,
                       int timeoutSec = 20);

} // namespace tc
