#pragma once

#include "goapagent/core/types.hpp"

#include <functional>
#include <string>

namespace goapagent::model {

using namespace goapagent::core;

// Named, typed slot consumed or produced by an action: "name:Type".
// A bare "Type" binds to the default name "it"; the stored value is always
// normalized to "name:Type". Throws UsageError for blank input.
class IoBinding {
public:
    explicit IoBinding(const std::string& value);
    IoBinding(const std::string& name, const std::string& type);

    const std::string& name() const { return name_; }
    const std::string& type() const { return type_; }
    const std::string& value() const { return value_; }

    bool is_default() const { return name_ == kDefaultBinding; }

    bool operator==(const IoBinding& other) const { return value_ == other.value_; }
    bool operator!=(const IoBinding& other) const { return value_ != other.value_; }
    bool operator<(const IoBinding& other) const { return value_ < other.value_; }

private:
    std::string name_;
    std::string type_;
    std::string value_;
};

}  // namespace goapagent::model

template<>
struct std::hash<goapagent::model::IoBinding> {
    size_t operator()(const goapagent::model::IoBinding& binding) const noexcept {
        return std::hash<std::string>{}(binding.value());
    }
};
