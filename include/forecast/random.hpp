#ifndef FORECAST_RANDOM_HPP
#define FORECAST_RANDOM_HPP

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace forecast {

enum class RandomGeneratorType {
    MERSENNE_TWISTER,
    XOR_SHIFT
};

// Source of uniform variates in [0, 1). One instance per worker; never shared across threads.
class RandomGenerator {
public:
    virtual ~RandomGenerator() = default;
    virtual double generate() = 0;
    virtual std::vector<double> generateBatch(size_t n);

    // Uniform index in [0, n). n must be positive.
    size_t generateIndex(size_t n);

    static std::unique_ptr<RandomGenerator> create(
        RandomGeneratorType type = RandomGeneratorType::MERSENNE_TWISTER);
    static std::unique_ptr<RandomGenerator> create(
        RandomGeneratorType type, std::uint64_t seed_value);
};

class MersenneTwisterGenerator : public RandomGenerator {
public:
    MersenneTwisterGenerator();
    explicit MersenneTwisterGenerator(std::uint64_t seed_value);

    double generate() override;

private:
    std::mt19937_64 generator_;
    std::uniform_real_distribution<double> distribution_;
};

class XorShiftGenerator : public RandomGenerator {
public:
    XorShiftGenerator();
    explicit XorShiftGenerator(std::uint64_t seed_value);

    double generate() override;

private:
    std::uint64_t next();

    std::uint64_t state_;
    static constexpr double INV_2_POW_53 = 1.0 / 9007199254740992.0;
};

} // namespace forecast

#endif // FORECAST_RANDOM_HPP
