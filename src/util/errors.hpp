/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Error types shared across components
 *
 * All errors derive from std::runtime_error. Persistence faults
 * (cache corruption, unreadable checkpoints) are absorbed by the
 * component that detects them; only ConfigurationError and
 * ProcessingFailure are meant to terminate an analysis run.
 */

#ifndef MAILRLM_UTIL_ERRORS_HPP
#define MAILRLM_UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mailrlm {

/**
 * Invalid or incomplete configuration (missing processing call,
 * zero checkpoint interval, bad config values)
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("Configuration error: " + what) {}
};

/**
 * The processing call failed to produce a result
 */
class ProcessingFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * No checkpoint file at the requested path
 */
class CheckpointNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Checkpoint file exists but does not parse into a valid checkpoint
 */
class CheckpointCorrupted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mailrlm

#endif // MAILRLM_UTIL_ERRORS_HPP
