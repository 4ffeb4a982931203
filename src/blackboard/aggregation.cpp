#include "goapagent/blackboard/aggregation.hpp"

#include <spdlog/spdlog.h>

namespace goapagent::blackboard {

DomainObjectPtr AggregationRegistry::synthesize(const std::string& type, const Blackboard& blackboard) const {
    auto it = factories_.find(type);
    if (it == factories_.end()) {
        return nullptr;
    }
    auto aggregate = it->second(blackboard);
    if (!aggregate) {
        spdlog::debug("Cannot synthesize {}: not every part is on blackboard {}", type, blackboard.id());
    }
    return aggregate;
}

std::vector<std::string> AggregationRegistry::types() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        names.push_back(name);
    }
    return names;
}

void AggregationRegistry::merge(const AggregationRegistry& other) {
    for (const auto& [name, factory] : other.factories_) {
        factories_.emplace(name, factory);
    }
}

}  // namespace goapagent::blackboard
