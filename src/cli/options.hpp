//! # Command-Line Options
//!
//! | Flag              | Meaning                                  |
//! |-------------------|------------------------------------------|
//! | `--xml <path>`    | Registry document, repeatable, required  |
//! | `--outdir <path>` | Directory receiving the generated files  |
//! | `--help`, `-h`    | Print usage and exit                     |
//!
//! Both value flags also accept `--flag=value`. Documents are processed
//! in the order given.

#pragma once

#include "common.hpp"

#include <string>
#include <vector>

namespace enumgen::cli {

struct GeneratorOptions {
    std::vector<std::string> xml_files;
    std::string outdir;
    bool show_help = false;
};

/// Parses argv. Returns a usage message on error.
Result<GeneratorOptions, std::string> parse_args(int argc, char* argv[]);

/// Same as above, for callers that already hold the arguments (argv[0] excluded).
Result<GeneratorOptions, std::string> parse_args(const std::vector<std::string>& args);

} // namespace enumgen::cli
