#pragma once

#include <cstdint>
#include <string>

namespace playlink {
namespace internal {

// Percent-encode everything except RFC 3986 unreserved characters.
std::string PercentEncode(const std::string& text);
// Reverse of PercentEncode. False on a malformed escape.
bool PercentDecode(const std::string& text, std::string* out);

// Components of an `http://host[:port]/path` URL.
struct HttpUrl {
  std::string host;
  uint16_t port = 80;
  std::string path = "/";
};

bool ParseHttpUrl(const std::string& url, HttpUrl* out, std::string* error);

}  // namespace internal
}  // namespace playlink
