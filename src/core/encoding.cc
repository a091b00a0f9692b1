#include "tokenkeeper/core/encoding.h"

#include <algorithm>
#include <cstring>

namespace tokenkeeper {

namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

std::string base64Encode(const std::string& input) {
  std::string out;
  out.reserve(((input.size() + 2) / 3) * 4);

  unsigned int val = 0;
  int valb = -6;
  for (unsigned char c : input) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(kAlphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(kAlphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (out.size() % 4 != 0) {
    out.push_back('=');
  }
  return out;
}

std::string base64UrlEncode(const std::string& input) {
  std::string out = base64Encode(input);
  out.erase(std::find(out.begin(), out.end(), '='), out.end());
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  return out;
}

optional<std::string> base64UrlDecode(const std::string& encoded) {
  std::string padded = encoded;
  std::replace(padded.begin(), padded.end(), '-', '+');
  std::replace(padded.begin(), padded.end(), '_', '/');

  // Strip padding, then reject lengths no encoder produces
  padded.erase(std::find(padded.begin(), padded.end(), '='), padded.end());
  if (padded.length() % 4 == 1) {
    return nullopt;
  }

  std::string decoded;
  decoded.reserve(padded.length() * 3 / 4);

  unsigned int val = 0;
  int valb = -8;
  for (unsigned char c : padded) {
    const char* pos = c ? std::strchr(kAlphabet, c) : nullptr;
    if (!pos) {
      return nullopt;
    }

    val = (val << 6) + static_cast<unsigned int>(pos - kAlphabet);
    valb += 6;
    if (valb >= 0) {
      decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }

  return decoded;
}

}  // namespace tokenkeeper
