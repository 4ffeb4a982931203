#pragma once

#include "goapagent/core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace goapagent::model {

using namespace goapagent::core;

// Base of every value that can live on a blackboard.
// Objects are immutable once shared.
class DomainObject {
public:
    virtual ~DomainObject() = default;

    // Simple type name, e.g. "Person"
    virtual std::string type_name() const = 0;

    // Namespace qualified name, e.g. "crm.Person". Defaults to the simple name.
    virtual std::string qualified_type_name() const { return type_name(); }

    // Names of every supertype, transitively
    virtual std::vector<std::string> supertypes() const { return {}; }

    virtual Json to_json() const { return Json{{"type", type_name()}}; }

    // Simple name, qualified name, or any supertype name matches
    bool satisfies_type(std::string_view type) const;

    std::string info_string() const;
};

using DomainObjectPtr = std::shared_ptr<const DomainObject>;

// Free text supplied by the caller that starts a process
class UserInput : public DomainObject {
public:
    static constexpr const char* kTypeName = "UserInput";

    explicit UserInput(std::string content) : content_(std::move(content)) {}

    const std::string& content() const { return content_; }

    std::string type_name() const override { return kTypeName; }
    Json to_json() const override { return Json{{"type", kTypeName}, {"content", content_}}; }

private:
    std::string content_;
};

}  // namespace goapagent::model
