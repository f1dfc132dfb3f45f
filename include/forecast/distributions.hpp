#ifndef FORECAST_DISTRIBUTIONS_HPP
#define FORECAST_DISTRIBUTIONS_HPP

#include "forecast/random.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace forecast {

namespace detail {
    // Uniform variate in (0, 1], safe to pass to log().
    inline double open_uniform(RandomGenerator& generator) {
        double u = 1.0 - generator.generate();
        return u > 0.0 ? u : std::numeric_limits<double>::min();
    }

    // Box-Muller transform, one variate per call
    inline double standard_normal(RandomGenerator& generator) {
        double u1 = open_uniform(generator);
        double u2 = generator.generate();
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(2 * M_PI * u2);
    }

    // Marsaglia-Tsang squeeze method for Gamma(shape, 1)
    inline double gamma_variate(RandomGenerator& generator, double shape) {
        if (shape <= 0.0) {
            throw std::invalid_argument("Gamma shape must be positive");
        }
        if (shape < 1.0) {
            double u = open_uniform(generator);
            return gamma_variate(generator, shape + 1.0) * std::pow(u, 1.0 / shape);
        }

        const double d = shape - 1.0 / 3.0;
        const double c = 1.0 / std::sqrt(9.0 * d);
        while (true) {
            double x;
            double v;
            do {
                x = standard_normal(generator);
                v = 1.0 + c * x;
            } while (v <= 0.0);

            v = v * v * v;
            double u = open_uniform(generator);
            double x2 = x * x;
            if (u < 1.0 - 0.0331 * x2 * x2) {
                return d * v;
            }
            if (std::log(u) < 0.5 * x2 + d * (1.0 - v + std::log(v))) {
                return d * v;
            }
        }
    }

    // Beta(alpha, beta) as X / (X + Y) with X ~ Gamma(alpha), Y ~ Gamma(beta)
    inline double beta_variate(RandomGenerator& generator, double alpha, double beta) {
        double x = gamma_variate(generator, alpha);
        double y = gamma_variate(generator, beta);
        return x / (x + y);
    }
}

// Beta-PERT over [optimistic, pessimistic] with mode most_likely.
template<typename T = double>
class PertDistribution {
public:
    PertDistribution(T optimistic, T most_likely, T pessimistic)
        : optimistic_(optimistic), most_likely_(most_likely), pessimistic_(pessimistic) {
        if (!(optimistic < pessimistic)) {
            throw std::invalid_argument("Pessimistic must be greater than optimistic");
        }
        if (most_likely < optimistic || most_likely > pessimistic) {
            throw std::invalid_argument("Most likely must lie between optimistic and pessimistic");
        }
        T range = pessimistic - optimistic;
        alpha_ = 1 + 4 * (most_likely - optimistic) / range;
        beta_ = 1 + 4 * (pessimistic - most_likely) / range;
    }

    T sample(RandomGenerator& generator) const {
        double unit = detail::beta_variate(generator, alpha_, beta_);
        return static_cast<T>(optimistic_ + unit * (pessimistic_ - optimistic_));
    }

    std::vector<T> sampleBatch(RandomGenerator& generator, size_t n) const {
        std::vector<T> result;
        result.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            result.push_back(sample(generator));
        }
        return result;
    }

    T mean() const { return (optimistic_ + 4 * most_likely_ + pessimistic_) / 6; }
    T variance() const {
        T range = pessimistic_ - optimistic_;
        T sum = alpha_ + beta_;
        return range * range * alpha_ * beta_ / (sum * sum * (sum + 1));
    }

private:
    T optimistic_;
    T most_likely_;
    T pessimistic_;
    T alpha_;
    T beta_;
};

} // namespace forecast

#endif // FORECAST_DISTRIBUTIONS_HPP
