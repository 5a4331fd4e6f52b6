#include "tc/data/HttpsClient.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace tc {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

std::runtime_error makeError(const std::string& host, const std::string& target,
                             const std::string& message) {
  return std::runtime_error("GET https://" + host + target + " failed: " + message);
}

// Resolve a Location header against the current host. Only https:// on the
// default port and host-relative targets are accepted.
void applyRedirect(const std::string& location, std::string& host, std::string& target) {
  if (location.empty()) throw std::runtime_error("redirect without Location header");

  if (location.rfind("https://", 0) == 0) {
    std::string rest = location.substr(8);
    std::size_t slash = rest.find('/');
    std::string hostPart = slash == std::string::npos ? rest : rest.substr(0, slash);
    std::size_t colon = hostPart.find(':');
    if (colon != std::string::npos) {
      if (hostPart.substr(colon + 1) != "443")
        throw std::runtime_error("redirect to unsupported port " + hostPart.substr(colon + 1));
      hostPart = hostPart.substr(0, colon);
    }
    if (hostPart.empty()) throw std::runtime_error("redirect URL has no host");
    host = hostPart;
    target = slash == std::string::npos ? "/" : rest.substr(slash);
  } else if (location.rfind("http://", 0) == 0) {
    throw std::runtime_error("refusing insecure redirect to " + location);
  } else {
    target = location.front() == '/' ? location : "/" + location;
  }
}

http::response<http::string_body> performRequest(const std::string& host,
                                                 const std::string& target,
                                                 int timeoutSec) {
  net::io_context ioc;
  ssl::context sslCtx(ssl::context::tls_client);
  sslCtx.set_default_verify_paths();
  sslCtx.set_verify_mode(ssl::verify_peer);

  ssl::stream<beast::tcp_stream> stream(ioc, sslCtx);
  stream.set_verify_callback(ssl::host_name_verification(host));

  if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
    unsigned long err = ::ERR_get_error();
    const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
    throw makeError(host, target,
                    std::string("cannot set SNI host name") + (reason ? std::string(": ") + reason : ""));
  }

  beast::error_code ec;
  net::ip::tcp::resolver resolver(ioc);
  auto const results = resolver.resolve(host, "443", ec);
  if (ec) throw makeError(host, target, "DNS resolution: " + ec.message());

  auto& tcp = beast::get_lowest_layer(stream);
  tcp.expires_after(std::chrono::seconds(timeoutSec));
  tcp.connect(results, ec);
  if (ec) throw makeError(host, target, "connect: " + ec.message());

  tcp.expires_after(std::chrono::seconds(timeoutSec));
  stream.handshake(ssl::stream_base::client, ec);
  if (ec) throw makeError(host, target, "TLS handshake: " + ec.message());

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, "Mozilla/5.0 (compatible; trendchart/1.0)");
  req.set(http::field::accept, "application/json");
  req.set(http::field::connection, "close");

  tcp.expires_after(std::chrono::seconds(timeoutSec));
  http::write(stream, req, ec);
  if (ec) throw makeError(host, target, "write: " + ec.message());

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  tcp.expires_after(std::chrono::seconds(timeoutSec));
  http::read(stream, buffer, res, ec);
  if (ec) throw makeError(host, target, "read: " + ec.message());

  stream.shutdown(ec);
  // Servers commonly close without a TLS close_notify.
  if (ec == net::error::eof || ec == ssl::error::stream_truncated) ec = {};
  if (ec) std::fprintf(stderr, "HttpsClient: shutdown %s: %s\n", host.c_str(), ec.message().c_str());

  return res;
}

} // anonymous namespace

HttpsResponse httpsGet(const std::string& host, const std::string& target, int timeoutSec) {
  if (host.empty()) throw std::runtime_error("HTTPS GET requires a host");
  if (timeoutSec <= 0) throw std::runtime_error("HTTPS GET timeout must be positive");

  std::string curHost = host;
  std::string curTarget = target.empty() ? "/" : target;
  if (curTarget.front() != '/') curTarget.insert(curTarget.begin(), '/');

  for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
    auto res = performRequest(curHost, curTarget, timeoutSec);
    unsigned status = static_cast<unsigned>(res.result_int());
    if (status == 301 || status == 302 || status == 307 || status == 308) {
      try {
        applyRedirect(std::string(res.base()[http::field::location]), curHost, curTarget);
      } catch (const std::exception& e) {
        throw makeError(curHost, curTarget, e.what());
      }
      continue;
    }

    HttpsResponse out;
    out.status = status;
    out.body = std::move(res.body());
    return out;
  }

  throw makeError(curHost, curTarget, "too many redirects");
}

} // namespace tc
