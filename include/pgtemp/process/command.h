#pragma once

#include <pgtemp/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgtemp::process {

/**
 * @brief Run a command to completion
 *
 * @param argv Command and arguments; argv[0] is resolved through PATH
 * @param inheritOutput Inherit stdout/stderr instead of discarding them
 * @return Exit status of the command (127 if it could not be executed), or an
 *         error if the child could not be spawned
 */
Result<int> runCommand(const std::vector<std::string>& argv, bool inheritOutput);

/**
 * @brief Locate an executable the way execvp() would
 *
 * A name containing '/' is checked as a path; any other name is looked up in
 * each entry of $PATH.
 */
std::optional<std::filesystem::path> findExecutable(std::string_view name);

// Quote a single word for /bin/sh (POSIX single-quote rules)
std::string shellQuote(std::string_view word);

// Join an argv into one string, quoting only where the shell would need it
std::string joinCommand(const std::vector<std::string>& argv);

} // namespace pgtemp::process
