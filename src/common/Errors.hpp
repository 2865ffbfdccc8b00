#pragma once

// ============================================================================
// Errors — every failure BulkBridge reports is one of these exception types
// ============================================================================
//
//   ConfigurationError    — invalid or missing settings, raised before any
//                           remote call is made
//   ValidationError       — destination/source precondition failed
//                           (presence, emptiness); bypassable with validate=false
//   JobFailedError        — a job kept FAILING until the retry bound ran out
//   JobStatusUnknownError — a job could not be classified; never retried
//   JobCancelledError     — polling was interrupted by a CancellationToken
//   WarehouseError        — a JobClient/TableClient call itself failed
//   StagingError          — the staging filesystem (Arrow) returned an error
//
// Cleanup failures are NOT exceptions: they are logged and dropped.
// ============================================================================

#include <stdexcept>
#include <string>

namespace BulkBridge
{

    class ConfigurationError : public std::invalid_argument
    {
    public:
        explicit ConfigurationError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    class ValidationError : public std::runtime_error
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::runtime_error(message) {}
    };

    class JobFailedError : public std::runtime_error
    {
    public:
        JobFailedError(const std::string &message, std::string last_job)
            : std::runtime_error(message), last_job_(std::move(last_job)) {}

        // Pretty-printed record of the last failed attempt
        const std::string &last_job() const { return last_job_; }

    private:
        std::string last_job_;
    };

    class JobStatusUnknownError : public std::runtime_error
    {
    public:
        explicit JobStatusUnknownError(const std::string &message)
            : std::runtime_error(message) {}
    };

    class JobCancelledError : public std::runtime_error
    {
    public:
        explicit JobCancelledError(const std::string &message)
            : std::runtime_error(message) {}
    };

    class WarehouseError : public std::runtime_error
    {
    public:
        explicit WarehouseError(const std::string &message, bool not_found = false)
            : std::runtime_error(message), not_found_(not_found) {}

        bool not_found() const { return not_found_; }

    private:
        bool not_found_;
    };

    class StagingError : public std::runtime_error
    {
    public:
        explicit StagingError(const std::string &message)
            : std::runtime_error(message) {}
    };

} // namespace BulkBridge
