#ifndef TOKENKEEPER_ENCODING_H
#define TOKENKEEPER_ENCODING_H

#include <string>

#include "tokenkeeper/core/compat.h"

namespace tokenkeeper {

// Standard alphabet with padding (RFC 4648 section 4)
std::string base64Encode(const std::string& input);

// URL-safe alphabet without padding (RFC 4648 section 5)
std::string base64UrlEncode(const std::string& input);

// Accepts input with or without padding; nullopt on invalid characters
optional<std::string> base64UrlDecode(const std::string& encoded);

}  // namespace tokenkeeper

#endif  // TOKENKEEPER_ENCODING_H
