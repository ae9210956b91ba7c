#include "options.hpp"

#include <string_view>

namespace enumgen::cli {

Result<GeneratorOptions, std::string> parse_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<GeneratorOptions, std::string> parse_args(const std::vector<std::string>& args) {
    GeneratorOptions options;
    bool has_outdir = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return options;
        }

        std::string_view flag = arg;
        std::string value;
        bool inline_value = false;
        if (size_t eq = arg.find('='); arg.starts_with("--") && eq != std::string::npos) {
            flag = std::string_view(arg).substr(0, eq);
            value = arg.substr(eq + 1);
            inline_value = true;
        }

        if (flag != "--xml" && flag != "--outdir") {
            return "unrecognized argument '" + arg + "'";
        }

        if (!inline_value) {
            if (i + 1 >= args.size()) {
                return "option " + std::string(flag) + " expects a path";
            }
            value = args[++i];
            if (value.starts_with("--")) {
                return "option " + std::string(flag) + " expects a path, got '" + value + "'";
            }
        }
        if (value.empty()) {
            return "option " + std::string(flag) + " expects a non-empty path";
        }

        if (flag == "--xml") {
            options.xml_files.push_back(std::move(value));
        } else {
            options.outdir = std::move(value);
            has_outdir = true;
        }
    }

    if (options.xml_files.empty()) {
        return std::string("at least one --xml <path> is required");
    }
    if (!has_outdir) {
        return std::string("--outdir <path> is required");
    }
    return options;
}

} // namespace enumgen::cli
