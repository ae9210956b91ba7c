//! # Enum-to-String Generator
//!
//! Renders the assembled model into a C header and source pair exposing
//! one `const char *vk_<Name>_to_str(Vk<Name> input)` function per enum
//! type. The source maps every resolved integer to its canonical name
//! with a switch whose default arm is `unreachable()`.
//!
//! ## Generated Layout
//!
//! ```c
//! /* header */
//! #define _VK_KHR_surface_number (1)
//! const char * vk_Result_to_str(VkResult input);
//!
//! /* source */
//! const char *
//! vk_Result_to_str(VkResult input)
//! {
//!     switch(input) {
//!         case -1000002000:
//!             return "VK_ERROR_OUT_OF_DATE_KHR";
//!         ...
//!     default:
//!         unreachable("Undefined enum value.");
//!     }
//! }
//! ```
//!
//! Output depends only on the model, so identical input always produces
//! byte-identical text.

#pragma once

#include "common.hpp"
#include "model/enum_type.hpp"

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace enumgen::codegen {

/// Options for enum-to-string generation.
struct EnumStrGenOptions {
    std::string header_name = "vk_enum_to_str.h"; ///< Header file name.
    std::string source_name = "vk_enum_to_str.c"; ///< Source file name.
    std::string guard_name = "MESA_VK_ENUM_TO_STR_H";
    std::string generator_name = GENERATOR_NAME; ///< Written to the banner.

    /// System headers included by both artifacts.
    std::vector<std::string> system_includes = {"vulkan/vulkan.h",
                                                "vulkan/vk_android_native_buffer.h"};

    /// Extra local headers included by the source (provides `unreachable`).
    std::vector<std::string> source_includes = {"util/macros.h"};

    /// Enumerators declared outside their logical enum block. Their cases
    /// are wrapped in a `-Wswitch` suppression.
    std::set<std::string> foreign_values = {"VK_STRUCTURE_TYPE_NATIVE_BUFFER_ANDROID"};
};

/// Generated artifacts, ready to be written.
struct EnumStrGenResult {
    std::string header_content;
    std::string source_content;
};

class EnumStrGen {
public:
    explicit EnumStrGen(EnumStrGenOptions options = {});

    /// Renders both artifacts.
    EnumStrGenResult generate(const std::vector<const model::EnumType*>& enums,
                              const std::vector<const model::Extension*>& extensions) const;

    std::string generate_header(const std::vector<const model::EnumType*>& enums,
                                const std::vector<const model::Extension*>& extensions) const;

    std::string generate_source(const std::vector<const model::EnumType*>& enums) const;

    /// Name of the lookup function for an enum type: "VkResult" -> "vk_Result_to_str".
    static std::string function_name(const std::string& enum_name);

    const EnumStrGenOptions& options() const {
        return options_;
    }

private:
    EnumStrGenOptions options_;

    std::string banner() const;
    void gen_lookup(std::ostringstream& out, const model::EnumType& type) const;
};

} // namespace enumgen::codegen
