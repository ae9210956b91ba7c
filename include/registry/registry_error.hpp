//! # Registry Error Types
//!
//! Errors produced while loading registry documents, resolving enumerator
//! values, or looking up a canonical name. Every error is fatal for the run
//! except `UnrecognizedEnumerator`, which only the lookup API returns.
//!
//! ## Example
//!
//! ```cpp
//! auto error = RegistryError::make(ErrorKind::UnknownAlias, "no such name", "vk.xml", 120);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "vk.xml:120: no such name"
//! ```

#ifndef ENUMGEN_REGISTRY_ERROR_HPP
#define ENUMGEN_REGISTRY_ERROR_HPP

#include <cstddef>
#include <string>

namespace enumgen {

/// Category of a registry failure.
enum class ErrorKind {
    Io,                    ///< Unreadable input or unwritable output
    XmlSyntax,             ///< Document is not well-formed XML
    MissingAttribute,      ///< Required attribute absent (e.g. `name`)
    InvalidInteger,        ///< Attribute is not an integer literal
    MalformedDeclaration,  ///< Not exactly one of value, alias, offset
    UnknownAlias,          ///< Alias target never declared for the type
    UnrecognizedEnumerator ///< Value has no canonical name in its type
};

/// Returns a short lowercase name for an error kind.
inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::XmlSyntax:
        return "xml-syntax";
    case ErrorKind::MissingAttribute:
        return "missing-attribute";
    case ErrorKind::InvalidInteger:
        return "invalid-integer";
    case ErrorKind::MalformedDeclaration:
        return "malformed-declaration";
    case ErrorKind::UnknownAlias:
        return "unknown-alias";
    case ErrorKind::UnrecognizedEnumerator:
        return "unrecognized-enumerator";
    }
    return "unknown";
}

/// An error with an optional document location.
struct RegistryError {
    ErrorKind kind = ErrorKind::Io;

    /// Human-readable error description.
    std::string message;

    /// Document path, empty when the error is not tied to a document.
    std::string file;

    /// 1-based line in `file`, 0 if unknown.
    size_t line = 0;

    static auto make(ErrorKind kind, std::string msg) -> RegistryError {
        return RegistryError{kind, std::move(msg), {}, 0};
    }

    static auto make(ErrorKind kind, std::string msg, std::string file, size_t line = 0)
        -> RegistryError {
        return RegistryError{kind, std::move(msg), std::move(file), line};
    }

    /// Formats as `file:line: message`, dropping the parts that are unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (!file.empty() && line > 0) {
            return file + ":" + std::to_string(line) + ": " + message;
        }
        if (!file.empty()) {
            return file + ": " + message;
        }
        return message;
    }
};

} // namespace enumgen

#endif // ENUMGEN_REGISTRY_ERROR_HPP
