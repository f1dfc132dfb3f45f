#include "forecast/estimate.hpp"
#include "forecast/errors.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace forecast {

namespace {

const double FIBONACCI_SERIES[] = {
    0.0, 1.0, 2.0, 3.0, 5.0, 8.0, 13.0, 21.0, 34.0, 55.0, 89.0, 144.0, 233.0, 377.0, 610.0,
    987.0
};
const size_t FIBONACCI_TERMS = sizeof(FIBONACCI_SERIES) / sizeof(FIBONACCI_SERIES[0]);

} // namespace

bool ThreePointEstimate::isCollapsed() const {
    return std::abs(pessimistic - optimistic) < std::numeric_limits<float>::epsilon();
}

bool ThreePointEstimate::isConsistent() const {
    if (pessimistic < optimistic) return false;
    if (isCollapsed()) return true;
    return mostLikely >= optimistic && mostLikely <= pessimistic;
}

std::pair<double, double> fibonacciBounds(double value) {
    if (value <= FIBONACCI_SERIES[0]) {
        return std::make_pair(FIBONACCI_SERIES[0], FIBONACCI_SERIES[1]);
    }
    for (size_t i = 0; i + 1 < FIBONACCI_TERMS; ++i) {
        if (value <= FIBONACCI_SERIES[i + 1]) {
            return std::make_pair(FIBONACCI_SERIES[i], FIBONACCI_SERIES[i + 1]);
        }
    }
    double last = FIBONACCI_SERIES[FIBONACCI_TERMS - 1];
    return std::make_pair(last, last);
}

Estimate Estimate::storyPoints(double value) {
    Estimate estimate;
    estimate.type_ = Type::STORY_POINTS;
    estimate.story_points_ = value;
    return estimate;
}

Estimate Estimate::threePoint(double optimistic, double most_likely, double pessimistic) {
    Estimate estimate;
    estimate.type_ = Type::THREE_POINT;
    estimate.triplet_ = ThreePointEstimate(optimistic, most_likely, pessimistic);
    return estimate;
}

Estimate Estimate::reference(const std::string& report_file_path) {
    Estimate estimate;
    estimate.type_ = Type::REFERENCE;
    estimate.report_file_path_ = report_file_path;
    return estimate;
}

double Estimate::storyPointValue() const {
    if (type_ != Type::STORY_POINTS) {
        throw std::logic_error("Estimate is not a story point estimate");
    }
    return story_points_;
}

const std::string& Estimate::reportFilePath() const {
    if (type_ != Type::REFERENCE) {
        throw std::logic_error("Estimate is not a reference estimate");
    }
    return report_file_path_;
}

void Estimate::resolve(const ThreePointEstimate& cached) {
    if (type_ != Type::REFERENCE) {
        throw std::logic_error("Only reference estimates can be resolved");
    }
    triplet_ = cached;
    resolved_ = true;
}

ThreePointEstimate Estimate::samplingTriplet() const {
    switch (type_) {
        case Type::STORY_POINTS: {
            std::pair<double, double> bounds = fibonacciBounds(story_points_);
            return ThreePointEstimate(bounds.first, story_points_, bounds.second);
        }
        case Type::THREE_POINT:
            return triplet_;
        case Type::REFERENCE:
            if (!resolved_) {
                throw EstimationError("reference estimate " + report_file_path_ +
                                      " has not been resolved");
            }
            return triplet_;
        case Type::NONE:
            break;
    }
    throw EstimationError("missing estimate");
}

} // namespace forecast
