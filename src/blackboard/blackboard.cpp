#include "goapagent/blackboard/blackboard.hpp"
#include "goapagent/blackboard/aggregation.hpp"
#include "goapagent/core/errors.hpp"
#include "goapagent/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace goapagent::blackboard {

DomainObjectPtr Blackboard::get_value(const std::string& variable,
                                      const std::string& type,
                                      const AggregationRegistry* aggregations) {
    auto bound = get(variable);
    if (bound && bound->satisfies_type(type)) {
        return bound;
    }

    if (aggregations && aggregations->contains(type)) {
        if (auto aggregate = aggregations->synthesize(type, *this)) {
            spdlog::info("Adding aggregation {} to blackboard {}", type, id());
            add_object(aggregate);
        }
    }

    if (variable != kDefaultBinding) {
        return nullptr;
    }

    const auto& entries = objects();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if ((*it)->satisfies_type(type)) {
            return *it;
        }
    }
    return nullptr;
}

void Blackboard::bind_all(const std::map<std::string, DomainObjectPtr>& bindings) {
    for (const auto& [name, value] : bindings) {
        bind(name, value);
    }
}

void Blackboard::add_all(const std::vector<DomainObjectPtr>& values) {
    for (const auto& value : values) {
        add_object(value);
    }
}

DomainObjectPtr Blackboard::last_result() const {
    const auto& entries = objects();
    return entries.empty() ? nullptr : entries.back();
}

std::string Blackboard::info_string(bool verbose) const {
    std::ostringstream ss;
    ss << "Blackboard: id=" << id() << " objects=[";
    const auto& entries = objects();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << (verbose ? entries[i]->info_string() : entries[i]->type_name());
    }
    ss << "]";
    return ss.str();
}

InMemoryBlackboard::InMemoryBlackboard()
    : id_(generate_blackboard_id())
{
}

InMemoryBlackboard::InMemoryBlackboard(BlackboardId id)
    : id_(std::move(id))
{
}

DomainObjectPtr InMemoryBlackboard::get(const std::string& name) const {
    auto it = map_.find(name);
    return it == map_.end() ? nullptr : it->second;
}

void InMemoryBlackboard::bind(const std::string& name, DomainObjectPtr value) {
    if (!value) {
        throw UsageError(ErrorCode::InvalidArgument, "Cannot bind null to " + name);
    }
    map_[name] = value;
    entries_.push_back(value);
    notify_observers(BlackboardChange{name, value, true});
}

void InMemoryBlackboard::add_object(DomainObjectPtr value) {
    if (!value) {
        throw UsageError(ErrorCode::InvalidArgument, "Cannot add null to blackboard");
    }
    entries_.push_back(value);
    notify_observers(BlackboardChange{std::string(kDefaultBinding), value, false});
}

void InMemoryBlackboard::set_condition(const std::string& key, bool value) {
    conditions_[key] = value;
}

std::optional<bool> InMemoryBlackboard::get_condition(const std::string& key) const {
    auto it = conditions_.find(key);
    if (it == conditions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<Blackboard> InMemoryBlackboard::spawn() const {
    // Fresh id, no observers
    auto child = std::make_shared<InMemoryBlackboard>();
    child->map_ = map_;
    child->entries_ = entries_;
    child->conditions_ = conditions_;
    return child;
}

size_t InMemoryBlackboard::observe(ChangeCallback callback) {
    size_t handle = next_observer_++;
    observers_[handle] = std::move(callback);
    return handle;
}

void InMemoryBlackboard::unobserve(size_t handle) {
    observers_.erase(handle);
}

void InMemoryBlackboard::notify_observers(const BlackboardChange& change) {
    for (const auto& [_, callback] : observers_) {
        callback(change);
    }
}

Json InMemoryBlackboard::to_json() const {
    Json bindings = Json::object();
    for (const auto& [name, value] : map_) {
        bindings[name] = value->to_json();
    }
    Json objects = Json::array();
    for (const auto& entry : entries_) {
        objects.push_back(entry->to_json());
    }
    Json conditions = Json::object();
    for (const auto& [key, value] : conditions_) {
        conditions[key] = value;
    }
    return Json{
        {"id", id_},
        {"bindings", bindings},
        {"objects", objects},
        {"conditions", conditions}
    };
}

}  // namespace goapagent::blackboard
