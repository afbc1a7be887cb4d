#include "Rng.hpp"

int Rng::dice(int number, int size) noexcept {
    if (size <= 0)
        return 0;
    if (size == 1)
        return number;
    auto sum = 0;
    for (auto die = 0; die < number; die++)
        sum += number_range(1, size);
    return sum;
}

// Rejection sampling over the smallest power of two covering the range.
int Rng::number_range(int from, int to) noexcept {
    const auto span = to - from + 1;
    if (span <= 1)
        return from;
    auto power = 2;
    while (power < span)
        power <<= 1;
    int number;
    while ((number = number_mm() & (power - 1)) >= span)
        ;
    return from + number;
}

KnuthRng::KnuthRng(int seed) {
    constexpr auto mask = (1u << 30) - 1;
    auto *state = &state_[2];
    state[-2] = 0;
    state[-1] = StateSize - StateSize / 2;
    state[0] = static_cast<uint32_t>(seed) & mask;
    state[1] = 1;
    for (auto i = 2u; i < StateSize; i++)
        state[i] = (state[i - 1] + state[i - 2]) & mask;
}

int KnuthRng::number_mm() noexcept {
    constexpr auto mask = (1u << 30) - 1;
    auto *state = &state_[2];
    auto first = state[-2];
    auto second = state[-1];
    const auto result = (state[first] + state[second]) & mask;
    state[first] = result;
    if (++first == StateSize)
        first = 0;
    if (++second == StateSize)
        second = 0;
    state[-2] = first;
    state[-1] = second;
    return static_cast<int>(result >> 6);
}
