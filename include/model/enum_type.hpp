//! # Enum Model
//!
//! `EnumType` and `Extension` are the two symbol kinds built by the
//! assembler. Both are identified by their declared name and created
//! through a `NamedFactory`.

#ifndef ENUMGEN_MODEL_ENUM_TYPE_HPP
#define ENUMGEN_MODEL_ENUM_TYPE_HPP

#include "common.hpp"
#include "registry/registry_error.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace enumgen::model {

/// A named enumeration and its resolved value tables.
///
/// - `values` maps each distinct integer to its canonical (shortest,
///   first-seen on ties) name, ordered by integer.
/// - `name_to_value` maps every declared name, aliases included, to its
///   resolved integer. Used for alias lookups.
///
/// Only `ValueResolver` mutates the tables.
class EnumType {
public:
    explicit EnumType(std::string name) : name_(std::move(name)) {}

    const std::string& name() const {
        return name_;
    }

    const std::map<int64_t, std::string>& values() const {
        return values_;
    }

    const std::unordered_map<std::string, int64_t>& name_to_value() const {
        return name_to_value_;
    }

    /// Canonical name for `value`, or `ErrorKind::UnrecognizedEnumerator`
    /// when no declaration resolved to it.
    Result<std::string, RegistryError> name_of(int64_t value) const;

    /// Resolved value of a declared name, if any.
    std::optional<int64_t> value_of(const std::string& name) const;

private:
    friend class ValueResolver;

    std::string name_;
    std::map<int64_t, std::string> values_;
    std::unordered_map<std::string, int64_t> name_to_value_;
};

/// A registry extension. `number` is fixed by its first declaration.
class Extension {
public:
    Extension(std::string name, int64_t number) : name_(std::move(name)), number_(number) {}

    const std::string& name() const {
        return name_;
    }

    int64_t number() const {
        return number_;
    }

private:
    std::string name_;
    int64_t number_;
};

} // namespace enumgen::model

#endif // ENUMGEN_MODEL_ENUM_TYPE_HPP
