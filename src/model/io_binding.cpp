#include "goapagent/model/io_binding.hpp"
#include "goapagent/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace goapagent::model {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

IoBinding::IoBinding(const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed.empty()) {
        throw UsageError(ErrorCode::InvalidBinding, "Type definition must not be blank");
    }

    auto colon = trimmed.find(':');
    if (colon == std::string::npos) {
        name_ = std::string(kDefaultBinding);
        type_ = trimmed;
    } else {
        name_ = trim(trimmed.substr(0, colon));
        type_ = trim(trimmed.substr(colon + 1));
    }

    if (name_.empty() || type_.empty() || type_.find(':') != std::string::npos) {
        throw UsageError(Error{ErrorCode::InvalidBinding, "Binding must be 'name:Type' or 'Type'", value});
    }
    value_ = name_ + ":" + type_;
}

IoBinding::IoBinding(const std::string& name, const std::string& type)
    : IoBinding(name + ":" + type) {}

}  // namespace goapagent::model
