//! # CLI Driver
//!
//! ```text
//! enumgen_main()
//!   ├─ parse_args()            → usage error: exit 1
//!   ├─ --help                  → print_usage(), exit 0
//!   └─ run_generator()
//!        ├─ load_registry()    per --xml, in order
//!        ├─ ModelAssembler     three passes per document
//!        ├─ EnumStrGen         header + source rendered in memory
//!        └─ write_file()       both artifacts
//! ```

#include "driver.hpp"

#include "codegen/enum_str_gen.hpp"
#include "log/log.hpp"
#include "model/assembler.hpp"
#include "registry/loader.hpp"
#include "utils.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace enumgen::cli {

Result<GenerationSummary, RegistryError> run_generator(const GeneratorOptions& options) {
    std::error_code ec;
    if (!fs::is_directory(options.outdir, ec)) {
        return RegistryError::make(ErrorKind::Io, "output directory does not exist",
                                   options.outdir);
    }

    model::ModelAssembler assembler;
    for (const auto& path : options.xml_files) {
        auto doc = registry::load_registry(path);
        if (is_err(doc))
            return unwrap_err(doc);

        auto stats = assembler.add_document(unwrap(doc));
        if (is_err(stats))
            return unwrap_err(stats);
    }

    auto enums = assembler.enums();
    auto extensions = assembler.extensions();

    codegen::EnumStrGen generator;
    auto rendered = generator.generate(enums, extensions);

    GenerationSummary summary;
    summary.documents = options.xml_files.size();
    summary.enums = enums.size();
    summary.extensions = extensions.size();
    summary.source_path = (fs::path(options.outdir) / generator.options().source_name).string();
    summary.header_path = (fs::path(options.outdir) / generator.options().header_name).string();

    auto source = write_file(summary.source_path, rendered.source_content);
    if (is_err(source))
        return unwrap_err(source);
    auto header = write_file(summary.header_path, rendered.header_content);
    if (is_err(header))
        return unwrap_err(header);

    ENUMGEN_LOG_INFO("cli", assembler.resolver().resolved_count() << " enumerators resolved, "
                            << assembler.resolver().replaced_count()
                            << " canonical names replaced by shorter aliases");
    ENUMGEN_LOG_INFO("cli", "Wrote " << summary.source_path << " (" << unwrap(source)
                                     << " bytes) and " << summary.header_path << " ("
                                     << unwrap(header) << " bytes)");
    return summary;
}

int enumgen_main(int argc, char* argv[]) {
    log::LogConfig log_config;
    log_config.level = log::LogLevel::Warn;
    log::Logger::init(log_config);

    auto options = parse_args(argc, argv);
    if (is_err(options)) {
        std::cerr << "enumgen: " << unwrap_err(options) << "\n\n";
        print_usage(std::cerr);
        return 1;
    }

    if (unwrap(options).show_help) {
        print_usage(std::cout);
        return 0;
    }

    auto result = run_generator(unwrap(options));
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        ENUMGEN_LOG_ERROR("cli", error_kind_name(err.kind) << ": " << err.to_string());
        log::Logger::instance().flush();
        return 1;
    }

    return 0;
}

} // namespace enumgen::cli
