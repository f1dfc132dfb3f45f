#ifndef FORECAST_SAMPLER_HPP
#define FORECAST_SAMPLER_HPP

#include "forecast/random.hpp"
#include <memory>

namespace forecast {

// Draws one duration (or quantity) from an (optimistic, most_likely, pessimistic) triplet.
// Throws std::invalid_argument when pessimistic < optimistic or, for a non-collapsed
// range, when most_likely lies outside it. A collapsed range returns optimistic.
class ThreePointSampler {
public:
    virtual ~ThreePointSampler() = default;
    virtual double sample(double optimistic, double most_likely, double pessimistic) = 0;

protected:
    // Validates the triplet; true when the range collapses to a point.
    static bool check_triplet(double optimistic, double most_likely, double pessimistic);
};

class BetaPertSampler : public ThreePointSampler {
public:
    explicit BetaPertSampler(std::unique_ptr<RandomGenerator> generator);

    double sample(double optimistic, double most_likely, double pessimistic) override;

private:
    std::unique_ptr<RandomGenerator> generator_;
};

// Always returns most_likely. Makes simulations exactly reproducible.
class MostLikelySampler : public ThreePointSampler {
public:
    double sample(double optimistic, double most_likely, double pessimistic) override;
};

} // namespace forecast

#endif // FORECAST_SAMPLER_HPP
