#pragma once

#include "types/constants.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace imgen_core::metadata {

    // Abstract source of generation seeds, injected into the normalizer.
    class ISeedSource {
    public:
        virtual ~ISeedSource() = default;

        // Returns a seed in [MIN_SEED, MAX_SEED].
        virtual uint64_t next_seed() = 0;
    };

    /**
     * @brief Uniform seeds from a Mersenne Twister engine.
     */
    class RandomSeedSource : public ISeedSource {
    public:
        RandomSeedSource();
        explicit RandomSeedSource(uint64_t engine_seed);

        uint64_t next_seed() override;

    private:
        std::mt19937_64 engine_;
        std::uniform_int_distribution<uint64_t> distribution_{MIN_SEED, MAX_SEED};
    };

    /**
     * @brief Replays a fixed list of seeds, cycling when exhausted.
     */
    class FixedSeedSource : public ISeedSource {
    public:
        explicit FixedSeedSource(std::vector<uint64_t> seeds);

        uint64_t next_seed() override;

    private:
        std::vector<uint64_t> seeds_;
        size_t next_index_ = 0;
    };

} // namespace imgen_core::metadata
