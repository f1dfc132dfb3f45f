#ifndef FORECAST_PROJECT_HPP
#define FORECAST_PROJECT_HPP

#include "forecast/date.hpp"
#include "forecast/estimate.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace forecast {

enum class ItemStatus {
    NONE,
    TO_DO,
    IN_PROGRESS,
    DONE
};

// Accepts "todo", "to do", "inprogress", "in progress", "done" in any letter case.
ItemStatus parseItemStatus(const std::string& text);
std::string itemStatusName(ItemStatus status);

struct WorkItem {
    std::string id;
    std::string summary;
    std::string description;
    Estimate estimate;
    std::vector<std::string> dependencies;
    ItemStatus status = ItemStatus::NONE;
    Date createdDate;
    Date startDate;
    Date doneDate;
    std::string subgraph;

    // Replaced by the id of the preceding work item when added to a project.
    bool dependsOnPrevious = false;

    WorkItem() = default;
    explicit WorkItem(std::string item_id) : id(std::move(item_id)) {}

    // Story points of a set STORY_POINTS estimate, for velocity purposes.
    bool hasStoryPoints() const { return estimate.isStoryPoints(); }
};

class Project {
public:
    Project() = default;
    explicit Project(std::string name) : name_(std::move(name)) {}

    // Throws StructuralError for an empty or duplicate id, or when the first
    // item asks to depend on its predecessor.
    void addWorkItem(WorkItem item);

    const std::string& name() const { return name_; }

    const std::vector<WorkItem>& workItems() const { return work_items_; }
    // Ids are indexed; callers may update estimates but must not rename items.
    std::vector<WorkItem>& workItems() { return work_items_; }
    size_t size() const { return work_items_.size(); }
    bool empty() const { return work_items_.empty(); }

    bool contains(const std::string& id) const { return index_.count(id) != 0; }
    const WorkItem& find(const std::string& id) const;

    bool hasStoryPoints() const;

private:
    std::string name_;
    std::vector<WorkItem> work_items_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace forecast

#endif // FORECAST_PROJECT_HPP
