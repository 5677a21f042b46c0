#pragma once
/*
===============================================================================
ERRORS — Exception types raised by the laundry optimizer
===============================================================================

    Error                 base of everything thrown by this library
    ├── ValidationError   bad order or request; carries the offending keys
    ├── SolverError       no certified optimum; carries the solver status
    └── ConfigError       malformed pricing configuration

All three derive from std::runtime_error through Error, so callers that only
care about "the quote failed" can catch laundry::Error or std::exception.
Nothing here is retried internally: a ValidationError is fixed by the caller,
a SolverError points at a configuration or solver-engine defect.

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace laundry {

    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class ValidationError
     * @brief Raised for unrecognized item types, negative or oversized quantities or
     *        malformed request documents
     */
    class ValidationError : public Error {
    public:
        explicit ValidationError(const std::string& message,
            std::vector<std::string> keys = {})
            : Error(message), keys_(std::move(keys))
        {
        }

        /// @brief Request keys that caused the failure (may be empty)
        const std::vector<std::string>& keys() const noexcept { return keys_; }

    private:
        std::vector<std::string> keys_;
    };

    /**
     * @class SolverError
     * @brief Raised when the integer program is not solved to proven optimality
     *
     * @details status() holds the Gurobi optimization status (GRB_TIME_LIMIT,
     *          GRB_INFEASIBLE, ...) or, when the engine itself threw, the
     *          GRBException error code.
     */
    class SolverError : public Error {
    public:
        SolverError(const std::string& message, int status)
            : Error(message), status_(status)
        {
        }

        int status() const noexcept { return status_; }

    private:
        int status_;
    };

    /// @brief Raised while validating or loading pricing configuration
    class ConfigError : public Error {
    public:
        using Error::Error;
    };

} // namespace laundry
