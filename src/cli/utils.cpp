#include "utils.hpp"

#include <fstream>
#include <iostream>

namespace enumgen::cli {

Result<size_t, RegistryError> write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        return RegistryError::make(ErrorKind::Io, "cannot open for writing", path);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return RegistryError::make(ErrorKind::Io, "write failed", path);
    }
    return content.size();
}

void print_usage(std::ostream& out) {
    out << "enumgen " << VERSION << "\n\n";
    out << "Usage: enumgen --xml <registry.xml> [--xml <registry.xml>...] --outdir <dir>\n\n";
    out << "Generates vk_enum_to_str.h and vk_enum_to_str.c from registry documents.\n\n";
    out << "Options:\n";
    out << "  --xml <path>      Registry document to load (repeatable, in order)\n";
    out << "  --outdir <path>   Directory for the generated files\n";
    out << "  --help, -h        Show this help\n";
}

} // namespace enumgen::cli
