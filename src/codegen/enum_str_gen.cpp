//! # Enum-to-String Generator Implementation

#include "codegen/enum_str_gen.hpp"

#include "log/log.hpp"

namespace enumgen::codegen {

EnumStrGen::EnumStrGen(EnumStrGenOptions options) : options_(std::move(options)) {}

std::string EnumStrGen::function_name(const std::string& enum_name) {
    // Drop the "Vk" prefix
    std::string stem = enum_name.size() > 2 ? enum_name.substr(2) : std::string();
    return "vk_" + stem + "_to_str";
}

std::string EnumStrGen::banner() const {
    std::ostringstream out;
    out << "/* Autogenerated file -- do not edit\n";
    out << " * generated by " << options_.generator_name << "\n";
    out << " */\n";
    return out.str();
}

void EnumStrGen::gen_lookup(std::ostringstream& out, const model::EnumType& type) const {
    out << "\n";
    out << "const char *\n";
    out << function_name(type.name()) << "(" << type.name() << " input)\n";
    out << "{\n";
    out << "    switch(input) {\n";

    for (const auto& [value, name] : type.values()) {
        bool foreign = options_.foreign_values.count(name) != 0;
        if (foreign) {
            out << "\n";
            out << "        #pragma GCC diagnostic push\n";
            out << "        #pragma GCC diagnostic ignored \"-Wswitch\"\n";
        }
        out << "        case " << value << ":\n";
        out << "            return \"" << name << "\";\n";
        if (foreign) {
            out << "        #pragma GCC diagnostic pop\n";
            out << "\n";
        }
    }

    out << "    default:\n";
    out << "        unreachable(\"Undefined enum value.\");\n";
    out << "    }\n";
    out << "}\n";
}

std::string EnumStrGen::generate_header(const std::vector<const model::EnumType*>& enums,
                                        const std::vector<const model::Extension*>& extensions) const {
    std::ostringstream out;
    out << banner() << "\n";

    out << "#ifndef " << options_.guard_name << "\n";
    out << "#define " << options_.guard_name << "\n\n";

    for (const auto& include : options_.system_includes) {
        out << "#include <" << include << ">\n";
    }
    out << "\n";

    out << "#ifdef __cplusplus\n";
    out << "extern \"C\" {\n";
    out << "#endif\n\n";

    for (const auto* ext : extensions) {
        out << "#define _" << ext->name() << "_number (" << ext->number() << ")\n";
    }
    out << "\n";

    for (const auto* type : enums) {
        out << "const char * " << function_name(type->name()) << "(" << type->name()
            << " input);\n";
    }
    out << "\n";

    out << "#ifdef __cplusplus\n";
    out << "} /* extern \"C\" */\n";
    out << "#endif\n\n";
    out << "#endif\n";

    return out.str();
}

std::string EnumStrGen::generate_source(const std::vector<const model::EnumType*>& enums) const {
    std::ostringstream out;
    out << banner() << "\n";

    for (const auto& include : options_.system_includes) {
        out << "#include <" << include << ">\n";
    }
    for (const auto& include : options_.source_includes) {
        out << "#include \"" << include << "\"\n";
    }
    out << "#include \"" << options_.header_name << "\"\n";

    for (const auto* type : enums) {
        gen_lookup(out, *type);
    }

    return out.str();
}

EnumStrGenResult EnumStrGen::generate(const std::vector<const model::EnumType*>& enums,
                                      const std::vector<const model::Extension*>& extensions) const {
    EnumStrGenResult result;
    result.header_content = generate_header(enums, extensions);
    result.source_content = generate_source(enums);

    ENUMGEN_LOG_INFO("emit", "Rendered " << enums.size() << " lookup functions and "
                                         << extensions.size() << " extension numbers");
    return result;
}

} // namespace enumgen::codegen
