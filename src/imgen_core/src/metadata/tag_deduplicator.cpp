#include "metadata/tag_deduplicator.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <vector>

namespace imgen_core::metadata {

    namespace {

        bool is_space(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        std::string_view trim(std::string_view text) {
            while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
            while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
            return text;
        }

        std::string lowercase(std::string_view text) {
            std::string lowered(text);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lowered;
        }

    } // namespace

    std::string deduplicate_tags(std::string_view prompt) {
        if (prompt.empty()) {
            return {};
        }

        std::unordered_set<std::string> seen;
        std::vector<std::string_view> kept;

        size_t start = 0;
        while (start <= prompt.size()) {
            size_t comma = prompt.find(',', start);
            if (comma == std::string_view::npos) {
                comma = prompt.size();
            }

            std::string_view tag = trim(prompt.substr(start, comma - start));
            if (!tag.empty() && seen.insert(lowercase(tag)).second) {
                kept.push_back(tag);
            }
            start = comma + 1;
        }

        std::string result;
        for (size_t i = 0; i < kept.size(); ++i) {
            if (i > 0) result += ", ";
            result += kept[i];
        }
        return result;
    }

} // namespace imgen_core::metadata
