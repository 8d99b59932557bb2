#include "../include/seeborg/random_source.hpp"

#include <stdexcept>

namespace seeborg {

std::size_t pick_index(RandomSource& random, std::size_t length) {
    if (length == 0) {
        throw std::invalid_argument("pick_index: cannot pick from an empty sequence");
    }
    return static_cast<std::size_t>(random.next_u64() % static_cast<std::uint64_t>(length));
}

double draw_unit(RandomSource& random) {
    return static_cast<double>(random.next_u64() >> 11) * (1.0 / 9007199254740992.0);
}

} // namespace seeborg
