#pragma once

#include <workflow/model.hpp>

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Runs external commands as child processes
 *
 * Each invocation gets its own io_context on which stdout and stderr are drained asynchronously.
 * The context runs for at most the given timeout; a child still alive at the deadline is killed
 * and reaped before the timeout is reported.
 */
class ProcessRunner {
public:
    /**
     * @brief Runs a command to completion
     *
     * @param command Executable name (looked up on PATH) or path
     * @param args Arguments passed verbatim
     * @param variables Added to the inherited environment, overriding existing entries
     * @param timeout Upper bound on the wall-clock time of the child
     * @return std::string Captured standard output
     * @throws CommandLaunchException, CommandFailedException, CommandTimeoutException
     */
    std::string run(std::string const &command,
        std::vector<std::string> const &args,
        variables_t const &variables,
        std::chrono::seconds timeout) const;
};
