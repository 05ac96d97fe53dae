#include "client/response_status.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace imgen_core::client {

    std::string describe_error_body(std::span<const uint8_t> body) {
        const auto parsed = nlohmann::json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded()) {
            return parsed.dump(2);
        }
        const size_t quoted = std::min(body.size(), MAX_QUOTED_ERROR_BYTES);
        return "Unable to parse error response. Raw content: " + std::string(body.begin(), body.begin() + quoted);
    }

    void check_response(int status, std::string_view content_type, std::span<const uint8_t> body) {
        if (status >= 200 && status < 300) {
            if (body.empty()) {
                throw TransportError(status, "Received empty response from the service");
            }
            return;
        }

        const std::string detail = describe_error_body(body);
        spdlog::error("check_response: Service returned status {} ({})", status, content_type);

        switch (status) {
            case 400:
                throw ApiError(status, fmt::format("A validation error occurred.\nResponse: {}", detail));
            case 401:
                throw AuthError(status, fmt::format("Access token is incorrect.\nResponse: {}", detail));
            case 402:
                throw AuthError(status, fmt::format("An active subscription is required.\nResponse: {}", detail));
            case 409:
                throw ConflictError(status, fmt::format("A conflict error occurred.\nResponse: {}", detail));
            case 429:
                throw RateLimitError(status, fmt::format("Rate limit exceeded.\nResponse: {}", detail));
            default:
                throw TransportError(status, fmt::format("Unknown error (Status: {}).\nResponse: {}", status, detail));
        }
    }

} // namespace imgen_core::client
