//
// Created by Malik T on 02/10/2025.
//
#include "Random.hpp"

#include <algorithm>
#include <utility>

namespace
{
    auto MakeEngine(uint64_t const seed, uint64_t const salt, uint64_t const size) -> std::mt19937_64
    {
        std::seed_seq seq{
            static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
            static_cast<uint32_t>(salt), static_cast<uint32_t>(salt >> 32),
            static_cast<uint32_t>(size)
        };
        return std::mt19937_64{seq};
    }
}

namespace uno::core
{
    auto util::PileFingerprint(Pile const& pile) -> uint64_t
    {
        constexpr uint64_t fnv_offset = 14695981039346656037ULL;
        constexpr uint64_t fnv_prime = 1099511628211ULL;

        uint64_t h = fnv_offset;
        auto mix = [&h](uint64_t const byte)
        {
            h ^= byte;
            h *= fnv_prime;
        };
        for (Card const& c : pile)
        {
            mix(std::to_underlying(c.type));
            mix(c.color ? std::to_underlying(*c.color) + 1u : 0u);
            mix(c.number ? *c.number + 1u : 0u);
        }
        return h;
    }

    auto SeededShuffler::Shuffle(Pile pile) const -> Pile
    {
        std::mt19937_64 rng = MakeEngine(seed_, util::PileFingerprint(pile), pile.size());
        std::ranges::shuffle(pile, rng);
        return pile;
    }

    auto SeededRandomizer::Next(size_t const bound) const -> size_t
    {
        std::mt19937_64 rng = MakeEngine(seed_, 0, bound);
        return std::uniform_int_distribution<size_t>{0, bound - 1}(rng);
    }
}
