//! # Model Assembler
//!
//! Feeds registry documents into the symbol factories and the value
//! resolver in a fixed precedence order. Each call to `add_document`
//! runs three passes over that document:
//!
//! ```text
//! 1. enums[@type="enum"]/enum          get_or_create(EnumType), resolve
//! 2. feature/require/enum[@extends]    lookup(EnumType), resolve if found
//! 3. extension[@supported="vulkan"]    get_or_create(Extension), then
//!      require/enum[@extends]          lookup(EnumType), resolve if found
//! ```
//!
//! Documents are processed in the order they are added; a name declared
//! again in a later document overwrites its earlier value.
//!
//! References to enum types that are not loaded are skipped: registries
//! routinely extend platform or bitmask types that never reach this
//! generator. Skips are counted and logged at debug level.

#ifndef ENUMGEN_MODEL_ASSEMBLER_HPP
#define ENUMGEN_MODEL_ASSEMBLER_HPP

#include "common.hpp"
#include "model/enum_type.hpp"
#include "model/named_factory.hpp"
#include "model/value_resolver.hpp"
#include "registry/document.hpp"
#include "registry/registry_error.hpp"

#include <cstddef>
#include <vector>

namespace enumgen::model {

/// Per-document counters reported by `add_document`.
struct AssemblyStats {
    size_t enum_blocks = 0;         ///< Base enum blocks processed
    size_t resolved = 0;            ///< Declarations that updated a type
    size_t skipped_references = 0;  ///< `extends` targets that are not loaded
    size_t ignored_extensions = 0;  ///< Extensions not supported for vulkan
};

class ModelAssembler {
public:
    ModelAssembler() = default;

    /// Runs the three passes over `doc`. Stops at the first malformed
    /// declaration; the model must then be discarded.
    Result<AssemblyStats, RegistryError> add_document(const registry::RegistryDocument& doc);

    /// Enum types ordered by name.
    std::vector<const EnumType*> enums() const {
        return enums_.sorted();
    }

    /// Extensions ordered by name.
    std::vector<const Extension*> extensions() const {
        return extensions_.sorted();
    }

    const NamedFactory<EnumType>& enum_factory() const {
        return enums_;
    }

    const NamedFactory<Extension>& extension_factory() const {
        return extensions_;
    }

    /// Counters accumulated over every document added so far.
    const ValueResolver& resolver() const {
        return resolver_;
    }

private:
    NamedFactory<EnumType> enums_;
    NamedFactory<Extension> extensions_;
    ValueResolver resolver_;

    /// Resolves `decl` into the type named by its `extends`, if loaded.
    Result<bool, RegistryError> resolve_extending(const registry::EnumDecl& decl,
                                                  const Extension* extension,
                                                  const registry::RegistryDocument& doc,
                                                  AssemblyStats& stats);
};

} // namespace enumgen::model

#endif // ENUMGEN_MODEL_ASSEMBLER_HPP
