#ifndef FORECAST_STATISTICS_HPP
#define FORECAST_STATISTICS_HPP

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace forecast {

// The four confidence levels every forecast reports.
template<typename T = double>
struct PercentileSummary {
    T p0 = 0;
    T p50 = 0;
    T p85 = 0;
    T p100 = 0;
};

template<typename T>
class StatisticalAnalysis {
public:
    // Nearest-rank percentile of an ascending sample: p <= 0 gives the minimum,
    // p >= 100 the maximum, otherwise the element at round(p/100 * (n-1)).
    // An empty sample yields 0.
    static T percentile(const std::vector<T>& sorted_values, double p) {
        if (sorted_values.empty()) {
            return T(0);
        }
        size_t index;
        if (p <= 0.0) {
            index = 0;
        } else if (p >= 100.0) {
            index = sorted_values.size() - 1;
        } else {
            double position = (p / 100.0) * (static_cast<double>(sorted_values.size()) - 1.0);
            index = static_cast<size_t>(std::round(position));
        }
        return sorted_values[index];
    }

    static PercentileSummary<T> summarizeSorted(const std::vector<T>& sorted_values) {
        PercentileSummary<T> summary;
        summary.p0 = percentile(sorted_values, 0.0);
        summary.p50 = percentile(sorted_values, 50.0);
        summary.p85 = percentile(sorted_values, 85.0);
        summary.p100 = percentile(sorted_values, 100.0);
        return summary;
    }

    static PercentileSummary<T> summarize(const std::vector<T>& values) {
        std::vector<T> sorted_values = values;
        std::sort(sorted_values.begin(), sorted_values.end());
        return summarizeSorted(sorted_values);
    }

    static T mean(const std::vector<T>& data) {
        if (data.empty()) return T(0);
        return std::accumulate(data.begin(), data.end(), T(0)) / static_cast<T>(data.size());
    }

    // Sample standard deviation; 0 for fewer than two values.
    static T standardDeviation(const std::vector<T>& data) {
        if (data.size() < 2) return T(0);
        T m = mean(data);
        T sum_sq_diff = 0;
        for (const auto& x : data) {
            T diff = x - m;
            sum_sq_diff += diff * diff;
        }
        return std::sqrt(sum_sq_diff / static_cast<T>(data.size() - 1));
    }
};

} // namespace forecast

#endif // FORECAST_STATISTICS_HPP
