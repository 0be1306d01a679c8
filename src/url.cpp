#include "url.h"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace playlink {
namespace internal {
namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string PercentEncode(const std::string& text) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

bool PercentDecode(const std::string& text, std::string* out) {
  std::string decoded;
  decoded.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      decoded.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size()) {
      return false;
    }
    const int high = HexValue(text[i + 1]);
    const int low = HexValue(text[i + 2]);
    if (high < 0 || low < 0) {
      return false;
    }
    decoded.push_back(static_cast<char>((high << 4) | low));
    i += 2;
  }
  *out = std::move(decoded);
  return true;
}

bool ParseHttpUrl(const std::string& url, HttpUrl* out, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    return fail("only http:// URLs are supported: " + url);
  }
  const size_t authority_start = scheme.size();
  const size_t path_start = url.find('/', authority_start);
  const std::string authority =
      url.substr(authority_start, path_start == std::string::npos
                                      ? std::string::npos
                                      : path_start - authority_start);
  HttpUrl parsed;
  parsed.path = path_start == std::string::npos ? "/" : url.substr(path_start);
  const size_t colon = authority.rfind(':');
  if (colon == std::string::npos) {
    parsed.host = authority;
  } else {
    parsed.host = authority.substr(0, colon);
    const std::string port_text = authority.substr(colon + 1);
    char* end = nullptr;
    const long port = std::strtol(port_text.c_str(), &end, 10);
    if (port_text.empty() || *end != '\0' || port <= 0 || port > 65535) {
      return fail("invalid port in URL: " + url);
    }
    parsed.port = static_cast<uint16_t>(port);
  }
  if (parsed.host.empty()) {
    return fail("missing host in URL: " + url);
  }
  *out = std::move(parsed);
  return true;
}

}  // namespace internal
}  // namespace playlink
