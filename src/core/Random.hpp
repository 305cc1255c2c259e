//
// Created by Malik T on 02/10/2025.
//

#ifndef UNOGAME_RANDOM_HPP
#define UNOGAME_RANDOM_HPP

#include <cstdint>
#include <random>
#include "Types.hpp"

namespace uno::core
{
    // Randomness is injected, never global. Implementations must behave like pure
    // functions: a Hand snapshot copies its shuffler handle, and replaying a
    // snapshot has to reproduce the same recycled draw pile.
    class Shuffler
    {
    public:
        virtual ~Shuffler() = default;

        // Must return a permutation of `pile`.
        virtual auto Shuffle(Pile pile) const -> Pile = 0;
    };

    class Randomizer
    {
    public:
        virtual ~Randomizer() = default;

        // Value in [0, bound). bound is never 0.
        virtual auto Next(size_t bound) const -> size_t = 0;
    };

    class SeededShuffler final : public Shuffler
    {
    public:
        explicit SeededShuffler(uint64_t seed) : seed_(seed) {}

        auto Shuffle(Pile pile) const -> Pile override;
        auto Seed() const noexcept -> uint64_t { return seed_; }

    private:
        uint64_t seed_;
    };

    class SeededRandomizer final : public Randomizer
    {
    public:
        explicit SeededRandomizer(uint64_t seed) : seed_(seed) {}

        auto Next(size_t bound) const -> size_t override;

    private:
        uint64_t seed_;
    };

    namespace util
    {
        // Order-sensitive FNV-1a over the cards of a pile.
        auto PileFingerprint(Pile const& pile) -> uint64_t;
    }
}

#endif //UNOGAME_RANDOM_HPP
