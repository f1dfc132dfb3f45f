#ifndef FORECAST_ESTIMATE_HPP
#define FORECAST_ESTIMATE_HPP

#include <string>
#include <utility>

namespace forecast {

struct ThreePointEstimate {
    double optimistic = 0.0;
    double mostLikely = 0.0;
    double pessimistic = 0.0;

    ThreePointEstimate() = default;
    ThreePointEstimate(double o, double m, double p)
        : optimistic(o), mostLikely(m), pessimistic(p) {}

    // optimistic <= most_likely <= pessimistic, or a collapsed range
    bool isConsistent() const;
    bool isCollapsed() const;
};

// Surrounding terms of {0, 1, 2, 3, 5, 8, ..., 987} used as the spread of a
// story-point value: value <= 0 gives (0, 1), otherwise the first pair (l, u)
// with value <= u, and (987, 987) above the series.
std::pair<double, double> fibonacciBounds(double value);

class Estimate {
public:
    enum class Type {
        NONE,
        STORY_POINTS,
        THREE_POINT,
        REFERENCE
    };

    Estimate() = default;

    static Estimate storyPoints(double value);
    static Estimate threePoint(double optimistic, double most_likely, double pessimistic);
    static Estimate reference(const std::string& report_file_path);

    Type type() const { return type_; }
    bool isSet() const { return type_ != Type::NONE; }
    bool isStoryPoints() const { return type_ == Type::STORY_POINTS; }

    // Valid for STORY_POINTS only.
    double storyPointValue() const;

    // Valid for REFERENCE only.
    const std::string& reportFilePath() const;
    bool isResolved() const { return resolved_; }
    void resolve(const ThreePointEstimate& cached);

    // The triplet this estimate is sampled from, in the estimate's own unit
    // (story points or days). Throws EstimationError for a missing estimate or
    // an unresolved reference.
    ThreePointEstimate samplingTriplet() const;

private:
    Type type_ = Type::NONE;
    double story_points_ = 0.0;
    ThreePointEstimate triplet_;
    std::string report_file_path_;
    bool resolved_ = false;
};

} // namespace forecast

#endif // FORECAST_ESTIMATE_HPP
