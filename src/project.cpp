#include "forecast/project.hpp"
#include "forecast/errors.hpp"
#include <algorithm>
#include <cctype>

namespace forecast {

namespace {

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

ItemStatus parseItemStatus(const std::string& text) {
    std::string value = text;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "todo" || value == "to do") return ItemStatus::TO_DO;
    if (value == "inprogress" || value == "in progress") return ItemStatus::IN_PROGRESS;
    if (value == "done") return ItemStatus::DONE;
    throw InputError("invalid status: " + text);
}

std::string itemStatusName(ItemStatus status) {
    switch (status) {
        case ItemStatus::TO_DO: return "ToDo";
        case ItemStatus::IN_PROGRESS: return "InProgress";
        case ItemStatus::DONE: return "Done";
        case ItemStatus::NONE: return "";
    }
    return "";
}

void Project::addWorkItem(WorkItem item) {
    if (trim(item.id).empty()) {
        throw StructuralError("missing issue id");
    }
    if (contains(item.id)) {
        throw StructuralError("duplicate issue id " + item.id);
    }
    if (item.dependsOnPrevious) {
        if (work_items_.empty()) {
            throw StructuralError("issue " + item.id +
                                  " depends on the previous issue but is the first one");
        }
        item.dependencies.assign(1, work_items_.back().id);
        item.dependsOnPrevious = false;
    }

    index_[item.id] = work_items_.size();
    work_items_.push_back(std::move(item));
}

const WorkItem& Project::find(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw StructuralError("unknown issue id " + id);
    }
    return work_items_[it->second];
}

bool Project::hasStoryPoints() const {
    return std::any_of(work_items_.begin(), work_items_.end(),
                       [](const WorkItem& item) { return item.hasStoryPoints(); });
}

} // namespace forecast
