//! # Registry Document Model
//!
//! Owned declaration tree produced by the loader. Only the parts of a
//! registry that feed enum resolution are kept:
//!
//! ```text
//! <registry>
//!   <enums name="VkResult" type="enum">          -> EnumBlock
//!     <enum name="VK_SUCCESS" value="0"/>        -> EnumDecl
//!   </enums>
//!   <feature><require>
//!     <enum extends="VkResult" .../>             -> RegistryDocument::feature_decls
//!   </require></feature>
//!   <extensions>
//!     <extension name="..." number="3" supported="vulkan">  -> ExtensionBlock
//!       <require><enum extends="VkResult" offset="0" dir="-"/></require>
//!     </extension>
//!   </extensions>
//! </registry>
//! ```
//!
//! Enumerator attribute values are kept as text. They are only parsed when
//! the declaration is resolved, so declarations that target unknown types
//! are never inspected.

#ifndef ENUMGEN_REGISTRY_DOCUMENT_HPP
#define ENUMGEN_REGISTRY_DOCUMENT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace enumgen::registry {

/// A single `<enum>` element.
struct EnumDecl {
    std::string name;
    std::optional<std::string> value;     ///< `value` attribute
    std::optional<std::string> alias;     ///< `alias` attribute
    std::optional<std::string> offset;    ///< `offset` attribute
    std::optional<std::string> extnumber; ///< `extnumber` override
    bool error = false;                   ///< `dir="-"`
    std::string extends;                  ///< Target type, empty inside `<enums>`
    size_t line = 0;

    /// Number of value forms present (literal, alias, offset).
    [[nodiscard]] int form_count() const {
        return (value ? 1 : 0) + (alias ? 1 : 0) + (offset ? 1 : 0);
    }
};

/// An `<enums type="enum">` block.
struct EnumBlock {
    std::string name;
    std::vector<EnumDecl> values;
    size_t line = 0;
};

/// An `<extensions>/<extension>` element.
struct ExtensionBlock {
    std::string name;
    int64_t number = 0;
    std::string supported;
    std::vector<EnumDecl> decls; ///< `require/enum[@extends]` children
    size_t line = 0;

    [[nodiscard]] bool is_supported() const {
        return supported == "vulkan";
    }
};

/// One parsed registry document.
struct RegistryDocument {
    std::string path;
    std::vector<EnumBlock> enum_blocks;
    std::vector<EnumDecl> feature_decls;
    std::vector<ExtensionBlock> extensions;
};

} // namespace enumgen::registry

#endif // ENUMGEN_REGISTRY_DOCUMENT_HPP
