//! # Registry Loader Implementation
//!
//! Walks a tinyxml2 DOM and copies the enum-related declarations into an
//! owned `RegistryDocument`. Only direct children of the root element are
//! considered for `enums`, `feature` and `extensions`.

#include "registry/loader.hpp"

#include "log/log.hpp"

#include <cctype>
#include <limits>
#include <tinyxml2.h>

namespace enumgen::registry {

// ============================================================================
// Integer Parsing
// ============================================================================

static int digit_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z')
        return c - 'A' + 10;
    return -1;
}

std::optional<int64_t> parse_integer(std::string_view text, IntegerBase base) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);

    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    int radix = 10;
    if (base == IntegerBase::Auto && text.size() > 1 && text[0] == '0') {
        char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        if (prefix == 'x')
            radix = 16;
        else if (prefix == 'o')
            radix = 8;
        else if (prefix == 'b')
            radix = 2;

        if (radix != 10) {
            text.remove_prefix(2);
            // "0x_ff" is accepted, like any other single separator
            if (!text.empty() && text.front() == '_')
                text.remove_prefix(1);
        }
    }

    if (text.empty() || text.front() == '_' || text.back() == '_')
        return std::nullopt;

    const uint64_t limit = negative
                               ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                               : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t magnitude = 0;
    bool prev_underscore = false;
    for (char c : text) {
        if (c == '_') {
            if (prev_underscore)
                return std::nullopt;
            prev_underscore = true;
            continue;
        }
        prev_underscore = false;

        int digit = digit_value(c);
        if (digit < 0 || digit >= radix)
            return std::nullopt;
        auto d = static_cast<uint64_t>(digit);
        if (magnitude > (limit - d) / static_cast<uint64_t>(radix))
            return std::nullopt;
        magnitude = magnitude * static_cast<uint64_t>(radix) + d;
    }

    // "007" is ambiguous between octal and decimal and is rejected.
    if (base == IntegerBase::Auto && radix == 10 && text.front() == '0' && magnitude != 0)
        return std::nullopt;

    return negative ? static_cast<int64_t>(0 - magnitude) : static_cast<int64_t>(magnitude);
}

// ============================================================================
// Element Helpers
// ============================================================================

namespace {

size_t line_of(const tinyxml2::XMLElement* elem) {
    int line = elem->GetLineNum();
    return line > 0 ? static_cast<size_t>(line) : 0;
}

std::optional<std::string> optional_attr(const tinyxml2::XMLElement* elem, const char* attr) {
    const char* value = elem->Attribute(attr);
    if (!value)
        return std::nullopt;
    return std::string(value);
}

Result<std::string, RegistryError> required_attr(const tinyxml2::XMLElement* elem,
                                                 const char* attr, const std::string& path) {
    const char* value = elem->Attribute(attr);
    if (!value) {
        return RegistryError::make(ErrorKind::MissingAttribute,
                                   std::string("<") + elem->Name() + "> is missing attribute '" +
                                       attr + "'",
                                   path, line_of(elem));
    }
    return std::string(value);
}

bool has_attr_value(const tinyxml2::XMLElement* elem, const char* attr, std::string_view want) {
    const char* value = elem->Attribute(attr);
    return value && want == value;
}

Result<EnumDecl, RegistryError> read_enum_decl(const tinyxml2::XMLElement* elem,
                                               const std::string& path) {
    auto name = required_attr(elem, "name", path);
    if (is_err(name))
        return unwrap_err(name);

    EnumDecl decl;
    decl.name = std::move(unwrap(name));
    decl.value = optional_attr(elem, "value");
    decl.alias = optional_attr(elem, "alias");
    decl.offset = optional_attr(elem, "offset");
    decl.extnumber = optional_attr(elem, "extnumber");
    decl.error = has_attr_value(elem, "dir", "-");
    if (const char* extends = elem->Attribute("extends"))
        decl.extends = extends;
    decl.line = line_of(elem);
    return decl;
}

/// Appends every `require/enum[@extends]` below `parent` to `out`.
std::optional<RegistryError> read_extending_decls(const tinyxml2::XMLElement* parent,
                                                  const std::string& path,
                                                  std::vector<EnumDecl>& out) {
    for (auto* require = parent->FirstChildElement("require"); require;
         require = require->NextSiblingElement("require")) {
        for (auto* elem = require->FirstChildElement("enum"); elem;
             elem = elem->NextSiblingElement("enum")) {
            if (!elem->Attribute("extends"))
                continue;
            auto decl = read_enum_decl(elem, path);
            if (is_err(decl))
                return unwrap_err(decl);
            out.push_back(std::move(unwrap(decl)));
        }
    }
    return std::nullopt;
}

Result<ExtensionBlock, RegistryError> read_extension(const tinyxml2::XMLElement* elem,
                                                     const std::string& path) {
    auto name = required_attr(elem, "name", path);
    if (is_err(name))
        return unwrap_err(name);

    ExtensionBlock ext;
    ext.name = std::move(unwrap(name));
    ext.supported = optional_attr(elem, "supported").value_or("");
    ext.line = line_of(elem);

    if (!ext.is_supported())
        return ext;

    auto number_text = required_attr(elem, "number", path);
    if (is_err(number_text))
        return unwrap_err(number_text);
    auto number = parse_integer(unwrap(number_text), IntegerBase::Decimal);
    if (!number) {
        return RegistryError::make(ErrorKind::InvalidInteger,
                                   "extension '" + ext.name + "' has invalid number '" +
                                       unwrap(number_text) + "'",
                                   path, ext.line);
    }
    ext.number = *number;

    if (auto err = read_extending_decls(elem, path, ext.decls))
        return *err;
    return ext;
}

Result<RegistryDocument, RegistryError> read_document(const tinyxml2::XMLDocument& xml,
                                                      const std::string& path) {
    const tinyxml2::XMLElement* root = xml.RootElement();
    if (!root) {
        return RegistryError::make(ErrorKind::XmlSyntax, "document has no root element", path);
    }

    RegistryDocument doc;
    doc.path = path;

    for (auto* block = root->FirstChildElement("enums"); block;
         block = block->NextSiblingElement("enums")) {
        if (!has_attr_value(block, "type", "enum"))
            continue;

        auto name = required_attr(block, "name", path);
        if (is_err(name))
            return unwrap_err(name);

        EnumBlock enum_block;
        enum_block.name = std::move(unwrap(name));
        enum_block.line = line_of(block);
        for (auto* elem = block->FirstChildElement("enum"); elem;
             elem = elem->NextSiblingElement("enum")) {
            auto decl = read_enum_decl(elem, path);
            if (is_err(decl))
                return unwrap_err(decl);
            enum_block.values.push_back(std::move(unwrap(decl)));
        }
        doc.enum_blocks.push_back(std::move(enum_block));
    }

    for (auto* feature = root->FirstChildElement("feature"); feature;
         feature = feature->NextSiblingElement("feature")) {
        if (auto err = read_extending_decls(feature, path, doc.feature_decls))
            return *err;
    }

    for (auto* list = root->FirstChildElement("extensions"); list;
         list = list->NextSiblingElement("extensions")) {
        for (auto* elem = list->FirstChildElement("extension"); elem;
             elem = elem->NextSiblingElement("extension")) {
            auto ext = read_extension(elem, path);
            if (is_err(ext))
                return unwrap_err(ext);
            doc.extensions.push_back(std::move(unwrap(ext)));
        }
    }

    ENUMGEN_LOG_INFO("registry", "Loaded " << path << ": " << doc.enum_blocks.size()
                                           << " enum blocks, " << doc.feature_decls.size()
                                           << " feature enums, " << doc.extensions.size()
                                           << " extensions");
    return doc;
}

RegistryError xml_error(const tinyxml2::XMLDocument& xml, const std::string& path) {
    const char* detail = xml.ErrorStr();
    int line = xml.ErrorLineNum();
    return RegistryError::make(ErrorKind::XmlSyntax, detail ? detail : "malformed XML", path,
                               line > 0 ? static_cast<size_t>(line) : 0);
}

} // namespace

// ============================================================================
// Entry Points
// ============================================================================

Result<RegistryDocument, RegistryError> parse_registry(std::string_view xml,
                                                       const std::string& path) {
    tinyxml2::XMLDocument dom;
    if (dom.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return xml_error(dom, path);
    }
    return read_document(dom, path);
}

Result<RegistryDocument, RegistryError> load_registry(const std::string& path) {
    tinyxml2::XMLDocument dom;
    tinyxml2::XMLError status = dom.LoadFile(path.c_str());
    switch (status) {
    case tinyxml2::XML_SUCCESS:
        break;
    case tinyxml2::XML_ERROR_FILE_NOT_FOUND:
    case tinyxml2::XML_ERROR_FILE_COULD_NOT_BE_OPENED:
    case tinyxml2::XML_ERROR_FILE_READ_ERROR:
        return RegistryError::make(ErrorKind::Io, "cannot read registry document", path);
    default:
        return xml_error(dom, path);
    }
    return read_document(dom, path);
}

} // namespace enumgen::registry
