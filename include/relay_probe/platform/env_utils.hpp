#pragma once

#include <string>

namespace relay_probe::platform {

/**
 * @brief Expands a leading `~/` to the user's home directory.
 *
 * @param path Path possibly starting with ~/
 * @return Expanded path; unchanged when it has no leading ~/ or no home directory is set
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

}// namespace relay_probe::platform
