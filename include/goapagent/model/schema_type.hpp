#pragma once

#include "goapagent/core/types.hpp"

#include <string>
#include <vector>

namespace goapagent::model {

using namespace goapagent::core;

struct PropertyDefinition {
    std::string name;
    std::string type = "string";
    std::string description;

    bool operator==(const PropertyDefinition& other) const { return name == other.name; }

    Json to_json() const {
        return Json{{"name", name}, {"type", type}, {"description", description}};
    }
};

// Loosely typed description of a domain type referenced by actions
struct SchemaType {
    std::string name;
    std::vector<PropertyDefinition> properties;

    // Union of properties, deduplicated by name, first definition wins
    SchemaType merged_with(const SchemaType& other) const;

    Json to_json() const;
    std::string info_string() const;
};

// Group by name, merge properties, sort by name
std::vector<SchemaType> merge_schema_types(const std::vector<SchemaType>& references);

}  // namespace goapagent::model
