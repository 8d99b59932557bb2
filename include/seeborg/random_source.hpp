#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>

namespace seeborg {

class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual std::uint64_t next_u64() = 0;
};

// Wraps a standard random bit generator. Engines with a narrower range
// (std::mt19937) are drawn twice per value.
template <typename Engine = std::mt19937_64>
class EngineRandomSource final : public RandomSource {
public:
    EngineRandomSource() : m_engine(std::random_device{}()) {}
    explicit EngineRandomSource(typename Engine::result_type seed) : m_engine(seed) {}

    std::uint64_t next_u64() override {
        if constexpr (Engine::max() - Engine::min() >= std::numeric_limits<std::uint64_t>::max()) {
            return static_cast<std::uint64_t>(m_engine());
        } else {
            const auto high = static_cast<std::uint64_t>(m_engine());
            const auto low = static_cast<std::uint64_t>(m_engine());
            return (high << 32) | (low & 0xFFFFFFFFull);
        }
    }

    Engine& engine() noexcept { return m_engine; }

private:
    Engine m_engine;
};

// Yields initial, initial + increment, initial + 2 * increment, ...
// (wrapping on overflow). Used to replay a fixed sequence of draws.
class StepRandomSource final : public RandomSource {
public:
    StepRandomSource(std::uint64_t initial, std::uint64_t increment)
        : m_next(initial), m_increment(increment) {}

    std::uint64_t next_u64() override {
        const std::uint64_t value = m_next;
        m_next += m_increment;
        return value;
    }

private:
    std::uint64_t m_next;
    std::uint64_t m_increment;
};

// Uniform index into a sequence of `length` elements: next_u64() % length.
// Throws std::invalid_argument when length is zero.
std::size_t pick_index(RandomSource& random, std::size_t length);

// Uniform double in [0, 1) built from the top 53 bits of one draw.
double draw_unit(RandomSource& random);

} // namespace seeborg
