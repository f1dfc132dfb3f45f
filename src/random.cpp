#include "forecast/random.hpp"
#include <algorithm>
#include <stdexcept>

namespace forecast {

std::vector<double> RandomGenerator::generateBatch(size_t n) {
    std::vector<double> result(n);
    std::generate(result.begin(), result.end(),
                  [this]() { return this->generate(); });
    return result;
}

size_t RandomGenerator::generateIndex(size_t n) {
    if (n == 0) {
        throw std::invalid_argument("Index range must be positive");
    }
    size_t index = static_cast<size_t>(generate() * static_cast<double>(n));
    // generate() < 1.0, but rounding on huge n can still land on n
    return std::min(index, n - 1);
}

// MersenneTwisterGenerator Implementation
MersenneTwisterGenerator::MersenneTwisterGenerator()
    : generator_(std::random_device{}())
    , distribution_(0.0, 1.0) {}

MersenneTwisterGenerator::MersenneTwisterGenerator(std::uint64_t seed_value)
    : generator_(seed_value)
    , distribution_(0.0, 1.0) {}

double MersenneTwisterGenerator::generate() {
    return distribution_(generator_);
}

// XorShiftGenerator Implementation
constexpr double XorShiftGenerator::INV_2_POW_53;

XorShiftGenerator::XorShiftGenerator()
    : state_(std::random_device{}()) {
    if (state_ == 0) state_ = 1;
}

XorShiftGenerator::XorShiftGenerator(std::uint64_t seed_value)
    : state_(seed_value) {
    if (state_ == 0) state_ = 1;
}

std::uint64_t XorShiftGenerator::next() {
    state_ ^= state_ << 13;
    state_ ^= state_ >> 7;
    state_ ^= state_ << 17;
    return state_;
}

double XorShiftGenerator::generate() {
    // top 53 bits keep the result strictly below 1.0
    return static_cast<double>(next() >> 11) * INV_2_POW_53;
}

// Factory Method Implementation
std::unique_ptr<RandomGenerator> RandomGenerator::create(RandomGeneratorType type) {
    switch (type) {
        case RandomGeneratorType::MERSENNE_TWISTER:
            return std::make_unique<MersenneTwisterGenerator>();
        case RandomGeneratorType::XOR_SHIFT:
            return std::make_unique<XorShiftGenerator>();
        default:
            throw std::runtime_error("Unknown random generator type");
    }
}

std::unique_ptr<RandomGenerator> RandomGenerator::create(RandomGeneratorType type,
                                                         std::uint64_t seed_value) {
    switch (type) {
        case RandomGeneratorType::MERSENNE_TWISTER:
            return std::make_unique<MersenneTwisterGenerator>(seed_value);
        case RandomGeneratorType::XOR_SHIFT:
            return std::make_unique<XorShiftGenerator>(seed_value);
        default:
            throw std::runtime_error("Unknown random generator type");
    }
}

} // namespace forecast
