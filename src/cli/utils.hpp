//! # CLI Utilities Interface
//!
//! | Function        | Description                            |
//! |-----------------|----------------------------------------|
//! | `write_file()`  | Replace a file's contents              |
//! | `print_usage()` | Print CLI help text                    |

#pragma once

#include "common.hpp"
#include "registry/registry_error.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace enumgen::cli {

// File I/O
Result<size_t, RegistryError> write_file(const std::string& path, const std::string& content);

// Help text
void print_usage(std::ostream& out);

} // namespace enumgen::cli
