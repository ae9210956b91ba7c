//! # Model Assembler Implementation

#include "model/assembler.hpp"

#include "log/log.hpp"

namespace enumgen::model {

using registry::EnumDecl;
using registry::RegistryDocument;

namespace {

RegistryError in_document(RegistryError err, const RegistryDocument& doc) {
    if (err.file.empty())
        err.file = doc.path;
    return err;
}

} // namespace

Result<bool, RegistryError> ModelAssembler::resolve_extending(const EnumDecl& decl,
                                                              const Extension* extension,
                                                              const RegistryDocument& doc,
                                                              AssemblyStats& stats) {
    EnumType* target = enums_.lookup(decl.extends);
    if (!target) {
        ENUMGEN_LOG_DEBUG("assemble", doc.path << ":" << decl.line << ": skipping " << decl.name
                                               << ", " << decl.extends << " is not loaded");
        ++stats.skipped_references;
        return false;
    }

    auto result = resolver_.resolve(*target, decl, extension);
    if (is_err(result))
        return in_document(std::move(unwrap_err(result)), doc);

    ++stats.resolved;
    return true;
}

Result<AssemblyStats, RegistryError> ModelAssembler::add_document(const RegistryDocument& doc) {
    AssemblyStats stats;

    // Pass 1: base enum blocks
    for (const auto& block : doc.enum_blocks) {
        EnumType& type = enums_.get_or_create(block.name);
        for (const auto& decl : block.values) {
            auto result = resolver_.resolve(type, decl, nullptr);
            if (is_err(result))
                return in_document(std::move(unwrap_err(result)), doc);
            ++stats.resolved;
        }
        ++stats.enum_blocks;
    }

    // Pass 2: core feature additions to existing types
    for (const auto& decl : doc.feature_decls) {
        auto result = resolve_extending(decl, nullptr, doc, stats);
        if (is_err(result))
            return unwrap_err(result);
    }

    // Pass 3: extension blocks
    for (const auto& block : doc.extensions) {
        if (!block.is_supported()) {
            ENUMGEN_LOG_TRACE("assemble", "ignoring extension " << block.name << " (supported=\""
                                                                << block.supported << "\")");
            ++stats.ignored_extensions;
            continue;
        }

        const Extension& extension = extensions_.get_or_create(block.name, block.number);
        if (extension.number() != block.number) {
            ENUMGEN_LOG_DEBUG("assemble", doc.path << ":" << block.line << ": " << block.name
                                                   << " keeps number " << extension.number()
                                                   << ", ignoring " << block.number);
        }

        for (const auto& decl : block.decls) {
            auto result = resolve_extending(decl, &extension, doc, stats);
            if (is_err(result))
                return unwrap_err(result);
        }
    }

    ENUMGEN_LOG_INFO("assemble", doc.path << ": " << stats.resolved << " enumerators resolved, "
                                          << stats.skipped_references
                                          << " references to unloaded types skipped, "
                                          << stats.ignored_extensions
                                          << " unsupported extensions ignored");
    return stats;
}

} // namespace enumgen::model
