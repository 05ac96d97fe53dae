#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imgen_core::client {

    inline constexpr std::string_view ENDPOINT_GENERATE_IMAGE = "/ai/generate-image";
    inline constexpr std::string_view ENDPOINT_GENERATE_IMAGE_STREAM = "/ai/generate-image-stream";
    inline constexpr std::string_view ENDPOINT_AUGMENT_IMAGE = "/ai/augment-image";
    inline constexpr std::string_view ENDPOINT_ENCODE_VIBE = "/ai/encode-vibe";

    struct HttpResponse {
        int status = 0;
        std::string content_type;
        std::vector<uint8_t> body;
    };

    /**
     * @brief Body of a response read incrementally.
     *
     * Status and content type are available before the first chunk.
     */
    class IResponseStream {
    public:
        virtual ~IResponseStream() = default;

        [[nodiscard]] virtual int status() const = 0;
        [[nodiscard]] virtual std::string content_type() const = 0;

        /// Next body chunk as received, or std::nullopt at end of body.
        virtual std::optional<std::vector<uint8_t>> next_chunk() = 0;
    };

    /**
     * @brief HTTP access to the image service, supplied by the embedding
     * application.
     *
     * Implementations own authentication, host selection and timeouts.
     * Network failures are reported by throwing TransportError.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /// POSTs a JSON payload and buffers the whole response.
        virtual HttpResponse post(std::string_view endpoint, const nlohmann::json& payload) = 0;

        /// POSTs a JSON payload and returns the response for chunked reading.
        virtual std::unique_ptr<IResponseStream> post_stream(std::string_view endpoint,
                                                             const nlohmann::json& payload) = 0;
    };

} // namespace imgen_core::client
