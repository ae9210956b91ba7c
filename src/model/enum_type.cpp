#include "model/enum_type.hpp"

namespace enumgen::model {

Result<std::string, RegistryError> EnumType::name_of(int64_t value) const {
    auto it = values_.find(value);
    if (it == values_.end()) {
        return RegistryError::make(ErrorKind::UnrecognizedEnumerator,
                                   "value " + std::to_string(value) + " is not an enumerator of " +
                                       name_);
    }
    return it->second;
}

std::optional<int64_t> EnumType::value_of(const std::string& name) const {
    auto it = name_to_value_.find(name);
    if (it == name_to_value_.end())
        return std::nullopt;
    return it->second;
}

} // namespace enumgen::model
