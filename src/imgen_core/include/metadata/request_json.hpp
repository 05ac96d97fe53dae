#pragma once

#include "types/generation_request.hpp"

#include <nlohmann/json.hpp>

namespace imgen_core {

    // nlohmann ADL hooks for the caption and character types.
    void to_json(nlohmann::json& j, const PositionCoords& coords);
    void from_json(const nlohmann::json& j, PositionCoords& coords);
    void to_json(nlohmann::json& j, const CharacterPrompt& cp);
    void from_json(const nlohmann::json& j, CharacterPrompt& cp);
    void to_json(nlohmann::json& j, const CharacterCaption& caption);
    void from_json(const nlohmann::json& j, CharacterCaption& caption);
    void to_json(nlohmann::json& j, const CaptionFormat& caption);
    void from_json(const nlohmann::json& j, CaptionFormat& caption);
    void to_json(nlohmann::json& j, const V4PromptFormat& format);
    void from_json(const nlohmann::json& j, V4PromptFormat& format);
    void to_json(nlohmann::json& j, const V4NegativePromptFormat& format);
    void from_json(const nlohmann::json& j, V4NegativePromptFormat& format);

} // namespace imgen_core

namespace imgen_core::metadata {

    /**
     * @brief Serializes a (normalized) request into the service payload:
     * `{input, model, action, parameters}`.
     *
     * `parameters` uses the service's field names; unset optionals are
     * omitted. The structured captions are only sent for current-protocol
     * models.
     */
    [[nodiscard]] nlohmann::json build_payload(const GenerationRequest& request);

    /**
     * @brief Builds a sparse request from a JSON object.
     *
     * Accepts `prompt`, `model`, `action`, `res_preset` plus any parameter
     * under its payload name. Missing keys and null values keep the request
     * defaults.
     *
     * @throws ValidationError on a non-object document, a mistyped value or
     *         an unknown enum name
     */
    [[nodiscard]] GenerationRequest request_from_json(const nlohmann::json& j);

} // namespace imgen_core::metadata
