#pragma once

#include <string>
#include <string_view>

namespace imgen_core::metadata {

    /**
     * @brief Removes duplicate tags from a comma-separated prompt.
     *
     * Tags are trimmed, empty tags dropped, and duplicates compared
     * case-insensitively; the first occurrence wins and keeps its casing.
     * Weight and bracket syntax (`{tag}`, `-0.8::feet::`) is part of the tag.
     * The result is joined with ", ".
     *
     * @param prompt Comma-separated tag string
     * @return Deduplicated tag string; dedup(dedup(s)) == dedup(s)
     */
    [[nodiscard]] std::string deduplicate_tags(std::string_view prompt);

} // namespace imgen_core::metadata
