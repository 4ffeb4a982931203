#include "goapagent/model/schema_type.hpp"

#include <algorithm>
#include <map>

namespace goapagent::model {

SchemaType SchemaType::merged_with(const SchemaType& other) const {
    SchemaType merged = *this;
    for (const auto& property : other.properties) {
        if (std::find(merged.properties.begin(), merged.properties.end(), property) == merged.properties.end()) {
            merged.properties.push_back(property);
        }
    }
    return merged;
}

Json SchemaType::to_json() const {
    Json props = Json::array();
    for (const auto& property : properties) {
        props.push_back(property.to_json());
    }
    return Json{{"name", name}, {"properties", props}};
}

std::string SchemaType::info_string() const {
    std::string result = name + "(";
    for (size_t i = 0; i < properties.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += properties[i].name + ": " + properties[i].type;
    }
    return result + ")";
}

std::vector<SchemaType> merge_schema_types(const std::vector<SchemaType>& references) {
    std::map<std::string, SchemaType> by_name;
    for (const auto& reference : references) {
        auto it = by_name.find(reference.name);
        if (it == by_name.end()) {
            SchemaType fresh{reference.name, {}};
            by_name.emplace(reference.name, fresh.merged_with(reference));
        } else {
            it->second = it->second.merged_with(reference);
        }
    }

    std::vector<SchemaType> merged;
    merged.reserve(by_name.size());
    for (auto& [_, type] : by_name) {
        merged.push_back(std::move(type));
    }
    return merged;
}

}  // namespace goapagent::model
