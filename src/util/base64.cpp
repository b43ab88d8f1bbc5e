#include "util/base64.hpp"

#include <cstdint>

namespace adoi {

namespace {
constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
} // namespace

std::string base64_encode(const std::string &input) {
  std::string out;
  out.reserve(((input.size() + 2) / 3) * 4);
  std::size_t i = 0;
  while (i + 2 < input.size()) {
    std::uint32_t chunk =
        (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16) |
        (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 1])) << 8) |
        static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 2]));
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
    out.push_back(kAlphabet[chunk & 0x3F]);
    i += 3;
  }
  const std::size_t rest = input.size() - i;
  if (rest == 1) {
    std::uint32_t chunk =
        static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16;
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    std::uint32_t chunk =
        (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16) |
        (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 1])) << 8);
    out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
    out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::string basic_auth_header(const std::string &pat) {
  return "Authorization: Basic " + base64_encode(":" + pat);
}

} // namespace adoi
