#pragma once

#include <optional>
#include <string>
#include <vector>

namespace imgen_core {

    /**
     * @brief Normalized character center, each axis in [0.1, 0.9]
     */
    struct PositionCoords {
        double x = 0.5;
        double y = 0.5;

        bool operator==(const PositionCoords&) const = default;
    };

    /**
     * @brief Per-character prompt used for multi-character generation.
     *
     * Unset fields are filled by the normalizer. An empty prompt or uc counts
     * as unset.
     */
    struct CharacterPrompt {
        std::string prompt;
        std::string uc;
        std::optional<PositionCoords> center;
        std::optional<bool> enabled;

        bool operator==(const CharacterPrompt&) const = default;
    };

    struct CharacterCaption {
        std::string char_caption;
        std::vector<PositionCoords> centers;

        bool operator==(const CharacterCaption&) const = default;
    };

    // Wire-level caption: base text plus ordered character captions.
    struct CaptionFormat {
        std::string base_caption;
        std::vector<CharacterCaption> char_captions;

        bool operator==(const CaptionFormat&) const = default;
    };

    struct V4PromptFormat {
        CaptionFormat caption;
        bool use_coords = false;
        bool use_order = true;

        bool operator==(const V4PromptFormat&) const = default;
    };

    struct V4NegativePromptFormat {
        CaptionFormat caption;
        bool legacy_uc = false;

        bool operator==(const V4NegativePromptFormat&) const = default;
    };

} // namespace imgen_core
