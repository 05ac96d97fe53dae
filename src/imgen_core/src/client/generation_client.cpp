#include "client/generation_client.hpp"
#include "client/response_status.hpp"
#include "decoding/archive_extractor.hpp"
#include "decoding/batch_event_parser.hpp"
#include "decoding/stream_event_parser.hpp"
#include "metadata/cost_estimator.hpp"
#include "metadata/request_json.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace imgen_core::client {

    GenerationClient::GenerationClient(ITransport& transport,
                                       config::ClientConfig config,
                                       std::unique_ptr<metadata::ISeedSource> seed_source)
        : transport_(transport),
          config_(std::move(config)),
          seed_source_(seed_source ? std::move(seed_source) : std::make_unique<metadata::RandomSeedSource>()),
          normalizer_(*seed_source_)
    {
        spdlog::info("GenerationClient: Initialized (default model '{}', stream={})",
                     model_id(config_.default_model), config_.stream);
    }

    GenerationRequest GenerationClient::new_request(std::string prompt) const {
        GenerationRequest request;
        request.prompt = std::move(prompt);
        request.model = config_.default_model;
        request.res_preset = config_.default_resolution;
        return request;
    }

    GenerationRequest GenerationClient::prepare(const GenerationRequest& request) const {
        return normalizer_.normalize(request);
    }

    std::vector<Image> GenerationClient::generate(const GenerationRequest& request) {
        GenerationRequest normalized = prepare(request);
        log_cost(normalized);
        encode_vibes(normalized);

        if (!is_current_protocol(normalized.model)) {
            HttpResponse response = transport_.post(ENDPOINT_GENERATE_IMAGE, metadata::build_payload(normalized));
            check_response(response.status, response.content_type, response.body);
            auto images = decoding::extract_images(response.body);
            spdlog::info("GenerationClient: Received {} images from archive", images.size());
            return images;
        }

        if (config_.stream) {
            std::vector<Image> images;
            stream_normalized(normalized, [&images](const StreamEvent& event) {
                if (event.event_type == EventType::FINAL) {
                    images.push_back(event.image);
                }
            });
            spdlog::info("GenerationClient: Received {} final images from stream", images.size());
            return images;
        }

        HttpResponse response = transport_.post(ENDPOINT_GENERATE_IMAGE_STREAM, metadata::build_payload(normalized));
        check_response(response.status, response.content_type, response.body);
        auto images = decoding::extract_final_images(response.body);
        spdlog::info("GenerationClient: Received {} final images", images.size());
        return images;
    }

    size_t GenerationClient::generate_stream(const GenerationRequest& request, const EventCallback& on_event) {
        if (!is_current_protocol(request.model)) {
            throw ValidationError("model", fmt::format("Model '{}' does not support streamed generation",
                                                       model_id(request.model)));
        }
        GenerationRequest normalized = prepare(request);
        log_cost(normalized);
        encode_vibes(normalized);
        return stream_normalized(normalized, on_event);
    }

    void GenerationClient::encode_vibes(GenerationRequest& request) {
        if (request.model != Model::V4_CUR || !request.reference_image_multiple ||
            request.reference_image_multiple->empty()) {
            return;
        }

        const auto& extracted = request.reference_information_extracted_multiple;
        std::vector<std::string> tokens;
        tokens.reserve(request.reference_image_multiple->size());

        for (size_t i = 0; i < request.reference_image_multiple->size(); ++i) {
            const std::string& image = (*request.reference_image_multiple)[i];
            const double information = extracted && i < extracted->size() ? (*extracted)[i]
                                                                      : metadata::DEFAULT_REFERENCE_INFORMATION_EXTRACTED;

            VibeKey key{image, information, request.model};
            if (auto it = vibe_cache_.find(key); it != vibe_cache_.end()) {
                spdlog::debug("GenerationClient: Using cached vibe token for reference {}", i);
                tokens.push_back(it->second);
                continue;
            }

            spdlog::debug("GenerationClient: Encoding vibe token for reference {} (information extracted {})",
                          i, information);
            const nlohmann::json payload = {
                {"image", image},
                {"information_extracted", information},
                {"model", model_id(request.model)},
            };
            HttpResponse response = transport_.post(ENDPOINT_ENCODE_VIBE, payload);
            check_response(response.status, response.content_type, response.body);

            std::string token(response.body.begin(), response.body.end());
            vibe_cache_.emplace(std::move(key), token);
            tokens.push_back(std::move(token));
        }

        request.reference_image_multiple = std::move(tokens);
        request.reference_information_extracted_multiple.reset();
    }

    size_t GenerationClient::stream_normalized(const GenerationRequest& normalized, const EventCallback& on_event) {
        auto stream = transport_.post_stream(ENDPOINT_GENERATE_IMAGE_STREAM, metadata::build_payload(normalized));
        const int status = stream->status();

        if (status < 200 || status >= 300) {
            std::vector<uint8_t> body;
            while (auto chunk = stream->next_chunk()) {
                body.insert(body.end(), chunk->begin(), chunk->end());
            }
            check_response(status, stream->content_type(), body);
        }

        decoding::StreamEventParser parser;
        size_t received_bytes = 0;
        size_t delivered = 0;
        while (auto chunk = stream->next_chunk()) {
            received_bytes += chunk->size();
            for (const auto& event : parser.feed_chunk(*chunk)) {
                on_event(event);
                ++delivered;
            }
        }

        if (received_bytes == 0) {
            throw TransportError(status, "Received empty response from the service");
        }
        if (parser.buffered_bytes() > 0) {
            spdlog::warn("GenerationClient: Stream ended inside a frame ({} bytes unconsumed)",
                         parser.buffered_bytes());
        }
        spdlog::debug("GenerationClient: Stream finished with {} events ({} frames dropped)",
                      delivered, parser.frames_dropped());
        return delivered;
    }

    Image GenerationClient::use_director_tool(const director::DirectorRequest& request) {
        const nlohmann::json payload = director::build_director_payload(request);
        spdlog::debug("GenerationClient: Director tool '{}' on {}x{} image",
                      director::tool_name(request.tool), request.width, request.height);

        HttpResponse response = transport_.post(ENDPOINT_AUGMENT_IMAGE, payload);
        check_response(response.status, response.content_type, response.body);
        return director::decode_director_response(response.body, request.tool);
    }

    void GenerationClient::log_cost(const GenerationRequest& normalized) const {
        if (!config_.verbose) {
            return;
        }
        spdlog::info("GenerationClient: Estimated cost {} Anlas ({} sample(s), {}x{}, {} steps)",
                     metadata::calculate_cost(normalized, config_.is_opus), normalized.n_samples,
                     *normalized.width, *normalized.height, normalized.steps);
    }

} // namespace imgen_core::client
