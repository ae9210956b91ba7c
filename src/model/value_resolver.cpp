//! # Value Resolver Implementation

#include "model/value_resolver.hpp"

#include "log/log.hpp"
#include "registry/loader.hpp"

namespace enumgen::model {

using registry::EnumDecl;
using registry::IntegerBase;
using registry::parse_integer;

void ValueResolver::add_value(EnumType& type, const std::string& name, int64_t value) {
    type.name_to_value_[name] = value;

    auto it = type.values_.find(value);
    if (it == type.values_.end()) {
        type.values_.emplace(value, name);
    } else if (it->second.size() > name.size()) {
        ENUMGEN_LOG_DEBUG("resolve", type.name() << ": " << name << " replaces " << it->second
                                                 << " as the name of " << value);
        it->second = name;
        ++replaced_;
    }

    ++resolved_;
    ENUMGEN_LOG_TRACE("resolve", type.name() << "::" << name << " = " << value);
}

Result<int64_t, RegistryError> ValueResolver::add_alias(EnumType& type, const std::string& name,
                                                        const std::string& alias) {
    auto target = type.value_of(alias);
    if (!target) {
        return RegistryError::make(ErrorKind::UnknownAlias, "enumerator '" + name + "' aliases '" +
                                                                alias + "', which " + type.name() +
                                                                " does not declare");
    }
    add_value(type, name, *target);
    return *target;
}

int64_t ValueResolver::add_offset(EnumType& type, const std::string& name, int64_t extnumber,
                                  int64_t offset, bool error) {
    int64_t value = extension_enum_value(extnumber, offset, error);
    add_value(type, name, value);
    return value;
}

Result<int64_t, RegistryError> ValueResolver::resolve(EnumType& type, const EnumDecl& decl,
                                                      const Extension* extension) {
    auto fail = [&](ErrorKind kind, const std::string& message) {
        return RegistryError::make(kind, message, std::string(), decl.line);
    };

    int forms = decl.form_count();
    if (forms == 0) {
        return fail(ErrorKind::MalformedDeclaration,
                    "enumerator '" + decl.name + "' of " + type.name() +
                        " has none of 'value', 'alias' or 'offset'");
    }
    if (forms > 1) {
        return fail(ErrorKind::MalformedDeclaration,
                    "enumerator '" + decl.name + "' of " + type.name() +
                        " has more than one of 'value', 'alias' and 'offset'");
    }

    if (decl.value) {
        auto value = parse_integer(*decl.value, IntegerBase::Auto);
        if (!value) {
            return fail(ErrorKind::InvalidInteger,
                        "enumerator '" + decl.name + "' has invalid value '" + *decl.value + "'");
        }
        add_value(type, decl.name, *value);
        return *value;
    }

    if (decl.alias) {
        auto result = add_alias(type, decl.name, *decl.alias);
        if (is_err(result))
            unwrap_err(result).line = decl.line;
        return result;
    }

    auto offset = parse_integer(*decl.offset, IntegerBase::Decimal);
    if (!offset || *offset < 0) {
        return fail(ErrorKind::InvalidInteger,
                    "enumerator '" + decl.name + "' has invalid offset '" + *decl.offset + "'");
    }

    int64_t extnumber = 0;
    if (decl.extnumber) {
        auto parsed = parse_integer(*decl.extnumber, IntegerBase::Decimal);
        if (!parsed) {
            return fail(ErrorKind::InvalidInteger, "enumerator '" + decl.name +
                                                       "' has invalid extnumber '" +
                                                       *decl.extnumber + "'");
        }
        extnumber = *parsed;
    } else if (extension) {
        extnumber = extension->number();
    } else {
        return fail(ErrorKind::MalformedDeclaration,
                    "enumerator '" + decl.name +
                        "' uses 'offset' outside an extension without 'extnumber'");
    }

    if (!checked_extension_enum_value(extnumber, *offset, decl.error)) {
        return fail(ErrorKind::InvalidInteger,
                    "enumerator '" + decl.name + "' has offset " + std::to_string(*offset) +
                        " in extension " + std::to_string(extnumber) +
                        ", which is outside the extension value range");
    }
    return add_offset(type, decl.name, extnumber, *offset, decl.error);
}

} // namespace enumgen::model
