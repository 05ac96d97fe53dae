#include "metadata/seed_source.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace imgen_core::metadata {

    RandomSeedSource::RandomSeedSource()
        : engine_(std::random_device{}()) {}

    RandomSeedSource::RandomSeedSource(uint64_t engine_seed)
        : engine_(engine_seed) {}

    uint64_t RandomSeedSource::next_seed() {
        return distribution_(engine_);
    }

    FixedSeedSource::FixedSeedSource(std::vector<uint64_t> seeds)
        : seeds_(std::move(seeds))
    {
        if (seeds_.empty()) {
            throw std::invalid_argument("FixedSeedSource requires at least one seed");
        }
        for (uint64_t seed : seeds_) {
            if (seed < MIN_SEED || seed > MAX_SEED) {
                throw std::invalid_argument("FixedSeedSource: seed out of range: " + std::to_string(seed));
            }
        }
    }

    uint64_t FixedSeedSource::next_seed() {
        uint64_t seed = seeds_[next_index_];
        next_index_ = (next_index_ + 1) % seeds_.size();
        return seed;
    }

} // namespace imgen_core::metadata
