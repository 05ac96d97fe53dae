#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace imgen_core::client {

    // Raw-body bytes quoted in an error message when the body is not JSON.
    constexpr size_t MAX_QUOTED_ERROR_BYTES = 500;

    /**
     * @brief Maps an HTTP response onto the error hierarchy.
     *
     * Returns normally for a 2xx status with a non-empty body. Otherwise
     * throws ApiError (400), AuthError (401, 402), ConflictError (409),
     * RateLimitError (429) or TransportError, carrying the error body
     * pretty-printed when it is JSON.
     */
    void check_response(int status, std::string_view content_type, std::span<const uint8_t> body);

    /// Human-readable error body: indented JSON, or a quote of the raw bytes.
    [[nodiscard]] std::string describe_error_body(std::span<const uint8_t> body);

} // namespace imgen_core::client
