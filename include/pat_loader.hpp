/**
 * @file pat_loader.hpp
 * @brief Personal access token lookup from files and the environment.
 */
#ifndef ADOINVENTORY_PAT_LOADER_HPP
#define ADOINVENTORY_PAT_LOADER_HPP

#include <optional>
#include <string>

namespace adoi {

/**
 * Load a personal access token from a file.
 *
 * JSON, YAML and TOML files may hold a bare string or an object/table with a
 * `pat` or `token` entry. Any other file is read as plain text and its first
 * non-empty line is used.
 *
 * @param path Filesystem path to the token file
 * @return Token with surrounding whitespace removed
 * @throws std::runtime_error When the file cannot be read or holds no token
 */
std::string load_pat_from_file(const std::string &path);

/**
 * Read the token from the environment, trying `PAT` and then `ADO_PAT`.
 */
std::optional<std::string> pat_from_environment();

} // namespace adoi

#endif // ADOINVENTORY_PAT_LOADER_HPP
