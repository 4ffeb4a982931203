#pragma once

#include "blackboard.hpp"

#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace goapagent::blackboard {

// Builds a composite object from what is on the blackboard; nullptr if a part is missing
using AggregationFactory = std::function<DomainObjectPtr(const Blackboard&)>;

// Factory that resolves every part as the most recent object of its type
// and passes them to Agg's constructor as shared_ptr<const Part>.
template<typename Agg, typename... Parts>
AggregationFactory make_aggregation() {
    return [](const Blackboard& blackboard) -> DomainObjectPtr {
        auto parts = std::make_tuple(blackboard.last<Parts>()...);
        bool complete = std::apply([](const auto&... part) {
            return (static_cast<bool>(part) && ...);
        }, parts);
        if (!complete) {
            return nullptr;
        }
        return std::apply([](const auto&... part) {
            return std::make_shared<const Agg>(part...);
        }, parts);
    };
}

// Type name to aggregation factory
class AggregationRegistry {
public:
    void register_factory(const std::string& type, AggregationFactory factory) {
        factories_[type] = std::move(factory);
    }

    template<typename Agg, typename... Parts>
    void register_aggregation() {
        register_factory(Agg::kTypeName, make_aggregation<Agg, Parts...>());
    }

    bool contains(const std::string& type) const { return factories_.count(type) > 0; }

    // nullptr when the type is unregistered or a part is missing
    DomainObjectPtr synthesize(const std::string& type, const Blackboard& blackboard) const;

    std::vector<std::string> types() const;

    // Entries of `other` are added; existing entries win
    void merge(const AggregationRegistry& other);

    bool empty() const { return factories_.empty(); }

private:
    std::map<std::string, AggregationFactory> factories_;
};

}  // namespace goapagent::blackboard
