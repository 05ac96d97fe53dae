#pragma once

#include "types/constants.hpp"

#include <optional>
#include <string_view>

namespace imgen_core::metadata {

    /**
     * @brief Quality suffix appended to the prompt when qualityToggle is on.
     *
     * The returned text starts with ", " so it can be appended verbatim.
     */
    [[nodiscard]] std::string_view quality_tags(ModelFamily family);

    /**
     * @brief Undesired-content block for a family and preset index.
     * @return Tag block, or std::nullopt when the family has no such preset
     */
    [[nodiscard]] std::optional<std::string_view> undesired_content_preset(ModelFamily family, int preset);

} // namespace imgen_core::metadata
