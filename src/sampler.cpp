#include "forecast/sampler.hpp"
#include "forecast/distributions.hpp"
#include "forecast/estimate.hpp"
#include <stdexcept>

namespace forecast {

bool ThreePointSampler::check_triplet(double optimistic, double most_likely, double pessimistic) {
    ThreePointEstimate triplet(optimistic, most_likely, pessimistic);
    if (pessimistic < optimistic) {
        throw std::invalid_argument("Pessimistic must not be less than optimistic");
    }
    if (triplet.isCollapsed()) {
        return true;
    }
    if (most_likely < optimistic || most_likely > pessimistic) {
        throw std::invalid_argument("Most likely must lie between optimistic and pessimistic");
    }
    return false;
}

BetaPertSampler::BetaPertSampler(std::unique_ptr<RandomGenerator> generator)
    : generator_(std::move(generator)) {
    if (!generator_) {
        throw std::invalid_argument("Random generator cannot be null");
    }
}

double BetaPertSampler::sample(double optimistic, double most_likely, double pessimistic) {
    if (check_triplet(optimistic, most_likely, pessimistic)) {
        return optimistic;
    }

    PertDistribution<double> distribution(optimistic, most_likely, pessimistic);
    return distribution.sample(*generator_);
}

double MostLikelySampler::sample(double optimistic, double most_likely, double pessimistic) {
    if (check_triplet(optimistic, most_likely, pessimistic)) {
        return optimistic;
    }
    return most_likely;
}

} // namespace forecast
