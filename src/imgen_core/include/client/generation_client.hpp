#pragma once

#include "client/transport.hpp"
#include "config/client_config.hpp"
#include "director/director_request.hpp"
#include "metadata/metadata_normalizer.hpp"
#include "metadata/seed_source.hpp"
#include "types/generation_request.hpp"
#include "types/image.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace imgen_core::client {

    /**
     * @brief Front door of the library: normalizes requests, sends them over
     * an ITransport and decodes the responses.
     */
    class GenerationClient {
    public:
        using EventCallback = std::function<void(const StreamEvent&)>;

        /**
         * @brief Constructor.
         * @param transport HTTP access; must outlive the client
         * @param config Client settings
         * @param seed_source Seed source for unset seeds; a RandomSeedSource when null
         */
        GenerationClient(ITransport& transport,
                         config::ClientConfig config,
                         std::unique_ptr<metadata::ISeedSource> seed_source = nullptr);

        GenerationClient(const GenerationClient&) = delete;
        GenerationClient& operator=(const GenerationClient&) = delete;
        GenerationClient(GenerationClient&&) = delete;
        GenerationClient& operator=(GenerationClient&&) = delete;

        /**
         * @brief Generates images and waits for all of them.
         *
         * Legacy models answer with a ZIP archive; current-protocol models
         * with an event stream, from which only the final images are kept.
         * Vibe transfer images for the curated V4 preview are first
         * exchanged for vibe tokens (see encode_vibes).
         *
         * @throws ValidationError before any request is sent
         * @throws TransportError subclasses for a failed response
         * @throws FormatError if the response cannot be decoded
         */
        [[nodiscard]] std::vector<Image> generate(const GenerationRequest& request);

        /**
         * @brief Generates with a current-protocol model, reporting each
         * intermediate and final event as it is decoded.
         * @return Number of events delivered
         * @throws ValidationError for legacy models
         */
        size_t generate_stream(const GenerationRequest& request, const EventCallback& on_event);

        /**
         * @brief Runs a director tool on an image.
         */
        [[nodiscard]] Image use_director_tool(const director::DirectorRequest& request);

        /// A request carrying the configured default model and resolution.
        [[nodiscard]] GenerationRequest new_request(std::string prompt) const;

        /// Normalized form of a request, exactly as it would be sent.
        [[nodiscard]] GenerationRequest prepare(const GenerationRequest& request) const;

        [[nodiscard]] const config::ClientConfig& config() const noexcept { return config_; }

        /**
         * @brief Replaces the reference images of a curated V4 preview request
         * with vibe tokens from /ai/encode-vibe.
         *
         * Each image is encoded with its information-extracted value (1.0 when
         * none are given). Tokens are cached per client by image, value and
         * model, so a repeated reference is encoded once. The
         * information-extracted list is cleared afterwards. Other models are
         * left untouched.
         *
         * @throws TransportError subclasses for a failed encode response
         */
        void encode_vibes(GenerationRequest& request);

        /// Number of vibe tokens held in the cache.
        [[nodiscard]] size_t cached_vibe_count() const noexcept { return vibe_cache_.size(); }

    private:
        using VibeKey = std::tuple<std::string, double, Model>;

        size_t stream_normalized(const GenerationRequest& normalized, const EventCallback& on_event);
        void log_cost(const GenerationRequest& normalized) const;

        ITransport& transport_;
        config::ClientConfig config_;
        std::unique_ptr<metadata::ISeedSource> seed_source_;
        metadata::MetadataNormalizer normalizer_;
        std::map<VibeKey, std::string> vibe_cache_;
    };

} // namespace imgen_core::client
