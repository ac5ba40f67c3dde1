#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the peerbench engine
 *
 * Computational outcomes (insufficient data, zero denominators) are not
 * exceptions; they travel as KpiResult statuses. The types below cover
 * configuration, storage, cancellation and build failures.
 */

#include <stdexcept>
#include <string>

namespace peerbench {

/// Invalid static configuration (KPI tree, aggregates, scopes). Fatal at startup.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/// A line-item source or generation store could not be reached.
class StorageUnavailable : public std::runtime_error {
public:
    explicit StorageUnavailable(const std::string& message)
        : std::runtime_error("Storage unavailable: " + message) {}
};

/// A persisted table failed its magic, version, checksum or schema check.
class TableFormatError : public std::runtime_error {
public:
    explicit TableFormatError(const std::string& message)
        : std::runtime_error("Invalid table: " + message) {}
};

/// Raised at a cancellation checkpoint after the token was cancelled.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& where)
        : std::runtime_error("Operation cancelled at " + where) {}
};

/**
 * @brief A build pipeline stage failed; nothing was published
 *
 * Carries the failing stage name and the subject being processed
 * (entity/period, KPI/scope, or file path).
 */
class BuildFailure : public std::runtime_error {
public:
    BuildFailure(std::string stage, std::string subject, const std::string& message)
        : std::runtime_error("Build failed in stage '" + stage + "' (" + subject + "): " + message)
        , stage_(std::move(stage))
        , subject_(std::move(subject)) {}

    const std::string& stage() const { return stage_; }
    const std::string& subject() const { return subject_; }

private:
    std::string stage_;
    std::string subject_;
};

} // namespace peerbench
