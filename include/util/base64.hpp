/**
 * @file base64.hpp
 * @brief Base64 encoding used for HTTP Basic authentication headers.
 */
#ifndef ADOINVENTORY_UTIL_BASE64_HPP
#define ADOINVENTORY_UTIL_BASE64_HPP

#include <string>

namespace adoi {

/**
 * Encode arbitrary bytes using the standard base64 alphabet with `=` padding.
 *
 * @param input Raw bytes to encode.
 * @return Encoded text; empty when @p input is empty.
 */
std::string base64_encode(const std::string &input);

/**
 * Build an `Authorization` header for a personal access token.
 *
 * Azure DevOps expects Basic credentials with an empty user name, so the
 * encoded payload is `":" + pat`.
 *
 * @param pat Personal access token.
 * @return Complete header line, e.g. `Authorization: Basic OnRva2Vu`.
 */
std::string basic_auth_header(const std::string &pat);

} // namespace adoi

#endif // ADOINVENTORY_UTIL_BASE64_HPP
