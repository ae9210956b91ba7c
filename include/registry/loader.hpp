//! # Registry Loader
//!
//! Parses registry XML documents into `RegistryDocument` trees using
//! tinyxml2. The loader keeps document order everywhere; resolution
//! order is decided later by the assembler.
//!
//! ## Selected Elements
//!
//! | Path                                             | Kept as                 |
//! |--------------------------------------------------|-------------------------|
//! | `/registry/enums[@type="enum"]/enum`             | `EnumBlock::values`     |
//! | `/registry/feature/require/enum[@extends]`       | `feature_decls`         |
//! | `/registry/extensions/extension`                 | `ExtensionBlock`        |
//! | `.../extension[@supported="vulkan"]/require/enum[@extends]` | `ExtensionBlock::decls` |
//!
//! Children of extensions that are not supported are never inspected.

#ifndef ENUMGEN_REGISTRY_LOADER_HPP
#define ENUMGEN_REGISTRY_LOADER_HPP

#include "common.hpp"
#include "registry/document.hpp"
#include "registry/registry_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace enumgen::registry {

/// How `parse_integer` interprets its input.
enum class IntegerBase {
    Decimal, ///< Plain decimal, as used by `offset`, `extnumber`, `number`
    Auto     ///< Decimal or 0x/0o/0b prefixed, as used by `value`
};

/// Parses an integer attribute. Accepts surrounding whitespace, an optional
/// sign and single underscores between digits. With `IntegerBase::Auto`,
/// a non-zero decimal literal may not start with `0`.
/// Returns nullopt for anything else, including overflow.
std::optional<int64_t> parse_integer(std::string_view text, IntegerBase base);

/// Parses registry XML held in memory. `path` is used for diagnostics only.
Result<RegistryDocument, RegistryError> parse_registry(std::string_view xml,
                                                       const std::string& path);

/// Reads and parses the registry document at `path`.
Result<RegistryDocument, RegistryError> load_registry(const std::string& path);

} // namespace enumgen::registry

#endif // ENUMGEN_REGISTRY_LOADER_HPP
