#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

// a single command invocation did not succeed; retryable
struct CommandException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CommandLaunchException : public CommandException {
    CommandLaunchException(std::string const &command, std::string const &reason)
        : CommandException{ "Could not start command '" + command + "': " + reason }
        , command{ command } { }

    std::string command;
};

struct CommandFailedException : public CommandException {
    CommandFailedException(std::string const &command, int exit_code, std::string const &stderr_text)
        : CommandException{ "Command failed with exit code " + std::to_string(exit_code) + ": " + stderr_text }
        , command{ command }
        , exit_code{ exit_code }
        , stderr_text{ stderr_text } { }

    std::string command;
    int exit_code;
    std::string stderr_text;
};

struct CommandTimeoutException : public CommandException {
    CommandTimeoutException(std::string const &command, std::chrono::seconds timeout)
        : CommandException{ "Command '" + command + "' timed out after " + std::to_string(timeout.count()) + " seconds" }
        , command{ command }
        , timeout{ timeout } { }

    std::string command;
    std::chrono::seconds timeout;
};
