#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace imgen_core {

    /**
     * @brief Base class for every error raised by imgen_core
     */
    class ImgenError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Malformed or out-of-range generation parameters.
     *
     * Raised before any network activity. Never retried.
     */
    class ValidationError : public ImgenError {
    public:
        ValidationError(std::string field, const std::string& message)
            : ImgenError(message), field_(std::move(field)) {}

        /// Name of the parameter that violated its constraint.
        [[nodiscard]] const std::string& field() const noexcept { return field_; }

    private:
        std::string field_;
    };

    /**
     * @brief n_samples exceeds the cap allowed at the normalized resolution
     */
    class SampleCountError : public ValidationError {
    public:
        SampleCountError(int cap, int requested, int width, int height);

        [[nodiscard]] int cap() const noexcept { return cap_; }
        [[nodiscard]] int requested() const noexcept { return requested_; }

    private:
        int cap_;
        int requested_;
    };

    /**
     * @brief Response payload could not be decoded (bad archive, bad image
     * signature, empty response).
     */
    class FormatError : public ImgenError {
    public:
        using ImgenError::ImgenError;
    };

    /**
     * @brief The service answered with a non-success status or an empty body.
     */
    class TransportError : public ImgenError {
    public:
        TransportError(int status, const std::string& message)
            : ImgenError(message), status_(status) {}

        [[nodiscard]] int status() const noexcept { return status_; }

    private:
        int status_;
    };

    /// 400: the service rejected the request parameters.
    class ApiError : public TransportError {
    public:
        using TransportError::TransportError;
    };

    /// 401 / 402: bad access token or no active subscription.
    class AuthError : public TransportError {
    public:
        using TransportError::TransportError;
    };

    /// 409
    class ConflictError : public TransportError {
    public:
        using TransportError::TransportError;
    };

    /// 429: too many concurrent generations.
    class RateLimitError : public TransportError {
    public:
        using TransportError::TransportError;
    };

} // namespace imgen_core
