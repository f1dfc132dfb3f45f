#include "forecast/velocity.hpp"
#include "forecast/errors.hpp"
#include <algorithm>
#include <cstddef>

namespace forecast {

constexpr size_t VelocityCalculator::MAX_COMPLETED_ITEMS;

double VelocityCalculator::calculate(const Project& project, const TeamCalendar& calendar) {
    std::vector<const WorkItem*> completed;
    for (const auto& item : project.workItems()) {
        if (item.status == ItemStatus::DONE && item.hasStoryPoints() &&
            item.startDate.isValid() && item.doneDate.isValid()) {
            completed.push_back(&item);
        }
    }

    if (completed.empty()) {
        throw VelocityError("no completed issues with story point estimates");
    }

    std::stable_sort(completed.begin(), completed.end(),
                     [](const WorkItem* a, const WorkItem* b) { return a->doneDate < b->doneDate; });
    if (completed.size() > MAX_COMPLETED_ITEMS) {
        completed.erase(completed.begin(),
                        completed.end() - static_cast<std::ptrdiff_t>(MAX_COMPLETED_ITEMS));
    }

    Date start = completed.front()->startDate;
    Date end = completed.back()->doneDate;
    double total_points = 0.0;
    for (const WorkItem* item : completed) {
        start = std::min(start, item->startDate);
        total_points += item->estimate.storyPointValue();
    }

    double summed_capacity = calendar.summedCapacity(start, end);
    if (summed_capacity <= 0.0) {
        throw VelocityError("invalid velocity duration: no capacity between " +
                            start.toString() + " and " + end.toString());
    }

    double velocity = total_points / summed_capacity;
    if (velocity <= 0.0) {
        throw VelocityError("invalid velocity value");
    }
    return velocity;
}

} // namespace forecast
