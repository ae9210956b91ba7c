//! # CLI Driver Interface
//!
//! `enumgen_main()` is the process entry point. `run_generator()` runs the
//! whole pipeline for already-parsed options and is what tests call.

#pragma once

#include "common.hpp"
#include "options.hpp"
#include "registry/registry_error.hpp"

#include <cstddef>
#include <string>

namespace enumgen::cli {

/// What a successful run produced.
struct GenerationSummary {
    size_t documents = 0;
    size_t enums = 0;
    size_t extensions = 0;
    std::string header_path;
    std::string source_path;
};

/// Loads, resolves, renders and writes. Nothing is written unless every
/// document loads and resolves.
Result<GenerationSummary, RegistryError> run_generator(const GeneratorOptions& options);

/// Returns 0 on success, 1 on any failure.
int enumgen_main(int argc, char* argv[]);

} // namespace enumgen::cli
