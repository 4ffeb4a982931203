#pragma once

#include "goapagent/core/types.hpp"
#include "goapagent/model/domain_object.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace goapagent::blackboard {

using namespace goapagent::core;
using model::DomainObject;
using model::DomainObjectPtr;

class AggregationRegistry;

// A bind or add on a blackboard. `name` is "it" for unnamed adds.
struct BlackboardChange {
    std::string name;
    DomainObjectPtr value;
    bool named = false;
};

using ChangeCallback = std::function<void(const BlackboardChange&)>;

// Per-process store of named bindings plus an append-only list of every
// object bound or added. Objects are never removed.
class Blackboard {
public:
    virtual ~Blackboard() = default;

    virtual const BlackboardId& id() const = 0;

    // Raw lookup by binding name, no type filtering
    virtual DomainObjectPtr get(const std::string& name) const = 0;

    // Bind to a name and append to objects
    virtual void bind(const std::string& name, DomainObjectPtr value) = 0;

    // Append without a name
    virtual void add_object(DomainObjectPtr value) = 0;

    virtual const std::vector<DomainObjectPtr>& objects() const = 0;

    virtual void set_condition(const std::string& key, bool value) = 0;
    virtual std::optional<bool> get_condition(const std::string& key) const = 0;

    // Independent copy of the current state. Observers are not copied.
    virtual std::shared_ptr<Blackboard> spawn() const = 0;

    // Returns a handle for unobserve
    virtual size_t observe(ChangeCallback callback) = 0;
    virtual void unobserve(size_t handle) = 0;

    // Typed resolution: the bound value if it satisfies `type`; otherwise try
    // to synthesize a registered aggregation; for "it" fall back to the last
    // object satisfying `type`. Named variables never fall back.
    DomainObjectPtr get_value(const std::string& variable,
                              const std::string& type,
                              const AggregationRegistry* aggregations = nullptr);

    void set(const std::string& name, DomainObjectPtr value) { bind(name, std::move(value)); }

    Blackboard& operator+=(DomainObjectPtr value) {
        add_object(std::move(value));
        return *this;
    }

    void bind_all(const std::map<std::string, DomainObjectPtr>& bindings);
    void add_all(const std::vector<DomainObjectPtr>& values);

    DomainObjectPtr last_result() const;

    // Last, count and all use instance-of semantics over objects
    template<typename T>
    std::shared_ptr<const T> last() const {
        const auto& entries = objects();
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            if (auto typed = std::dynamic_pointer_cast<const T>(*it)) {
                return typed;
            }
        }
        return nullptr;
    }

    template<typename T>
    std::vector<std::shared_ptr<const T>> all() const {
        std::vector<std::shared_ptr<const T>> result;
        for (const auto& entry : objects()) {
            if (auto typed = std::dynamic_pointer_cast<const T>(entry)) {
                result.push_back(std::move(typed));
            }
        }
        return result;
    }

    template<typename T>
    size_t count() const {
        return all<T>().size();
    }

    virtual Json to_json() const = 0;
    std::string info_string(bool verbose = false) const;
};

using BlackboardPtr = std::shared_ptr<Blackboard>;

class InMemoryBlackboard : public Blackboard {
public:
    InMemoryBlackboard();
    explicit InMemoryBlackboard(BlackboardId id);

    const BlackboardId& id() const override { return id_; }

    DomainObjectPtr get(const std::string& name) const override;
    void bind(const std::string& name, DomainObjectPtr value) override;
    void add_object(DomainObjectPtr value) override;
    const std::vector<DomainObjectPtr>& objects() const override { return entries_; }

    void set_condition(const std::string& key, bool value) override;
    std::optional<bool> get_condition(const std::string& key) const override;

    std::shared_ptr<Blackboard> spawn() const override;

    size_t observe(ChangeCallback callback) override;
    void unobserve(size_t handle) override;

    Json to_json() const override;

private:
    BlackboardId id_;
    std::map<std::string, DomainObjectPtr> map_;
    std::vector<DomainObjectPtr> entries_;
    std::map<std::string, bool> conditions_;

    std::map<size_t, ChangeCallback> observers_;
    size_t next_observer_ = 1;

    void notify_observers(const BlackboardChange& change);
};

}  // namespace goapagent::blackboard
