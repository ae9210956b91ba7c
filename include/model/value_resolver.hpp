//! # Value Resolver
//!
//! Turns enumerator declarations into entries of an `EnumType`'s tables.
//!
//! ## Declaration Forms
//!
//! | Form    | Attributes                        | Value                               |
//! |---------|-----------------------------------|-------------------------------------|
//! | literal | `value`                           | the literal (decimal, 0x, 0o, 0b)   |
//! | alias   | `alias`                           | current value of the aliased name   |
//! | offset  | `offset`, `extnumber`?, `dir`?    | `extension_enum_value(E, offset)`   |
//!
//! ## Canonical Names
//!
//! Every declared name is recorded in `name_to_value` (last writer wins).
//! For `values`, the first name seen for an integer is kept unless a later
//! name is strictly shorter, so `VK_FOO` beats `VK_FOO_EXT` in either order.

#ifndef ENUMGEN_MODEL_VALUE_RESOLVER_HPP
#define ENUMGEN_MODEL_VALUE_RESOLVER_HPP

#include "common.hpp"
#include "model/enum_type.hpp"
#include "registry/document.hpp"
#include "registry/registry_error.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace enumgen::model {

/// Base of the value range reserved for extension enumerators.
constexpr int64_t EXTENSION_ENUM_BASE = 1000000000;

/// Number of values reserved per extension.
constexpr int64_t EXTENSION_ENUM_BLOCK = 1000;

/// Value of the enumerator at `offset` in the block of extension
/// `extnumber` (1-based). Error enumerators are negated.
constexpr int64_t extension_enum_value(int64_t extnumber, int64_t offset, bool error) {
    int64_t value = EXTENSION_ENUM_BASE + (extnumber - 1) * EXTENSION_ENUM_BLOCK + offset;
    return error ? -value : value;
}

/// Same as `extension_enum_value`, or nullopt when `extnumber` is not
/// positive, `offset` is negative, or the result does not fit in int64.
constexpr std::optional<int64_t> checked_extension_enum_value(int64_t extnumber, int64_t offset,
                                                              bool error) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    if (extnumber < 1 || offset < 0 || offset > max - EXTENSION_ENUM_BASE)
        return std::nullopt;
    if (extnumber - 1 > (max - EXTENSION_ENUM_BASE - offset) / EXTENSION_ENUM_BLOCK)
        return std::nullopt;
    return extension_enum_value(extnumber, offset, error);
}

class ValueResolver {
public:
    /// Records `name = value` in `type`.
    void add_value(EnumType& type, const std::string& name, int64_t value);

    /// Records `name` with the current value of `alias`.
    /// Fails with `ErrorKind::UnknownAlias` if `alias` was never declared.
    Result<int64_t, RegistryError> add_alias(EnumType& type, const std::string& name,
                                             const std::string& alias);

    /// Records `name` with an extension offset value and returns it. The
    /// arguments must satisfy `checked_extension_enum_value`.
    int64_t add_offset(EnumType& type, const std::string& name, int64_t extnumber, int64_t offset,
                       bool error);

    /// Resolves a declaration of any form into `type`.
    ///
    /// `extension` is the enclosing extension block, or nullptr for base
    /// and feature declarations. An explicit `extnumber` always wins over
    /// the enclosing extension's number. Errors carry the declaration's
    /// line but no file; the caller fills it in.
    Result<int64_t, RegistryError> resolve(EnumType& type, const registry::EnumDecl& decl,
                                           const Extension* extension);

    /// Declarations successfully resolved so far.
    size_t resolved_count() const {
        return resolved_;
    }

    /// Times a shorter name displaced an existing canonical name.
    size_t replaced_count() const {
        return replaced_;
    }

private:
    size_t resolved_ = 0;
    size_t replaced_ = 0;
};

} // namespace enumgen::model

#endif // ENUMGEN_MODEL_VALUE_RESOLVER_HPP
