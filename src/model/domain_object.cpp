#include "goapagent/model/domain_object.hpp"

#include <algorithm>

namespace goapagent::model {

bool DomainObject::satisfies_type(std::string_view type) const {
    if (type_name() == type || qualified_type_name() == type) {
        return true;
    }
    auto supers = supertypes();
    return std::any_of(supers.begin(), supers.end(), [type](const std::string& super) {
        return super == type;
    });
}

std::string DomainObject::info_string() const {
    return type_name() + ":" + to_json().dump();
}

}  // namespace goapagent::model
