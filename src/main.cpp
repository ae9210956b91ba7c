//! # enumgen Entry Point
//!
//! Generates enum-to-string lookup functions from Vulkan-style registry
//! documents.
//!
//! ```bash
//! enumgen --xml vk.xml --xml vk_android_native_buffer.xml --outdir build/util
//! ```
//!
//! All work happens in `cli::enumgen_main()`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return enumgen::cli::enumgen_main(argc, argv);
}
