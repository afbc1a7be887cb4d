#pragma once

#include <array>
#include <cstdint>

// Source of randomness for ability rolls and hit point rolls. Tests substitute a mock.
class Rng {
public:
    virtual ~Rng() = default;
    virtual int number_mm() noexcept = 0;
    virtual int dice(int number, int size) noexcept;
    virtual int number_range(int from, int to) noexcept;
};

class KnuthRng final : public Rng {
    // Mitchell-Moore additive generator, from Knuth Volume II.
    static constexpr auto StateSize = 55u;
    std::array<uint32_t, 2 + StateSize> state_{};

public:
    explicit KnuthRng(int seed);
    int number_mm() noexcept override;
};

// Always answers the same number. Handy for reproducible runs of rowgen.
class FakeRng final : public Rng {
    int result_;

public:
    explicit FakeRng(int result) : result_(result) {}
    int number_mm() noexcept override { return result_; }
};
