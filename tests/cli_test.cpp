//! # CLI Tests
//!
//! Argument parsing, end-to-end generation into a scratch directory, and
//! process exit codes.

#include "cli/driver.hpp"
#include "cli/options.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace enumgen;
using namespace enumgen::cli;

namespace fs = std::filesystem;

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(ParseArgsTest, RepeatedXmlKeepsOrder) {
    auto result = parse_args({"--xml", "vk.xml", "--xml=android.xml", "--outdir", "out"});

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    const GeneratorOptions& opts = unwrap(result);
    ASSERT_EQ(opts.xml_files.size(), 2u);
    EXPECT_EQ(opts.xml_files[0], "vk.xml");
    EXPECT_EQ(opts.xml_files[1], "android.xml");
    EXPECT_EQ(opts.outdir, "out");
    EXPECT_FALSE(opts.show_help);
}

TEST(ParseArgsTest, HelpStopsParsing) {
    auto result = parse_args({"--bogus", "-h"});
    ASSERT_TRUE(is_err(result));

    auto help = parse_args({"-h", "--bogus"});
    ASSERT_TRUE(is_ok(help));
    EXPECT_TRUE(unwrap(help).show_help);
}

TEST(ParseArgsTest, Errors) {
    EXPECT_TRUE(is_err(parse_args({"--outdir", "out"})));
    EXPECT_TRUE(is_err(parse_args({"--xml", "vk.xml"})));
    EXPECT_TRUE(is_err(parse_args({"--xml", "vk.xml", "--outdir"})));
    EXPECT_TRUE(is_err(parse_args({"--xml=", "--outdir", "out"})));
    EXPECT_TRUE(is_err(parse_args({"--xml", "vk.xml", "--outdir", "out", "extra"})));

    auto unknown = parse_args({"--verbose", "--xml", "vk.xml", "--outdir", "out"});
    ASSERT_TRUE(is_err(unknown));
    EXPECT_NE(unwrap_err(unknown).find("--verbose"), std::string::npos);
}

TEST(ParseArgsTest, FlagIsNotTakenAsPath) {
    auto result = parse_args({"--xml", "--outdir", "out"});

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("--xml"), std::string::npos);
    EXPECT_NE(unwrap_err(result).find("got '--outdir'"), std::string::npos);

    // The inline spelling takes the text verbatim
    auto inline_value = parse_args({"--xml=--odd.xml", "--outdir", "out"});
    ASSERT_TRUE(is_ok(inline_value));
    EXPECT_EQ(unwrap(inline_value).xml_files[0], "--odd.xml");
}

TEST(ParseArgsTest, UsageMentionsEveryFlag) {
    std::ostringstream out;
    print_usage(out);

    EXPECT_NE(out.str().find("--xml"), std::string::npos);
    EXPECT_NE(out.str().find("--outdir"), std::string::npos);
    EXPECT_NE(out.str().find("--help"), std::string::npos);
}

// ============================================================================
// Generation
// ============================================================================

namespace {

const char* kRegistry = R"(<registry>
<enums name="VkResult" type="enum">
    <enum name="VK_SUCCESS" value="0"/>
    <enum name="VK_NOT_READY" value="1"/>
</enums>
<extensions>
    <extension name="VK_KHR_swapchain" number="3" supported="vulkan">
        <require>
            <enum offset="0" dir="-" extends="VkResult" name="VK_ERROR_OUT_OF_DATE_KHR"/>
        </require>
    </extension>
</extensions>
</registry>)";

std::string read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::LogConfig config;
        config.console = false;
        log::Logger::init(config);

        dir = fs::temp_directory_path() /
              ("enumgen_cli_test_" +
               std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir / "out");
    }

    void TearDown() override {
        fs::remove_all(dir);
        log::Logger::init(log::LogConfig{});
    }

    fs::path write_registry(const std::string& name, const std::string& content) {
        fs::path path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    GeneratorOptions options_for(std::vector<std::string> xml) {
        GeneratorOptions opts;
        opts.xml_files = std::move(xml);
        opts.outdir = (dir / "out").string();
        return opts;
    }

    fs::path dir;
};

TEST_F(GeneratorTest, WritesHeaderAndSource) {
    auto xml = write_registry("vk.xml", kRegistry);

    auto result = run_generator(options_for({xml.string()}));

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const GenerationSummary& summary = unwrap(result);
    EXPECT_EQ(summary.documents, 1u);
    EXPECT_EQ(summary.enums, 1u);
    EXPECT_EQ(summary.extensions, 1u);

    std::string header = read_all(dir / "out" / "vk_enum_to_str.h");
    std::string source = read_all(dir / "out" / "vk_enum_to_str.c");
    EXPECT_NE(header.find("#define _VK_KHR_swapchain_number (3)\n"), std::string::npos);
    EXPECT_NE(header.find("const char * vk_Result_to_str(VkResult input);\n"), std::string::npos);
    EXPECT_NE(source.find("        case -1000002000:\n"
                          "            return \"VK_ERROR_OUT_OF_DATE_KHR\";\n"),
              std::string::npos);
}

TEST_F(GeneratorTest, SummaryReportsResolverCounters) {
    log::LogConfig config;
    config.console = false;
    config.level = log::LogLevel::Info;
    log::Logger::init(config);
    auto sink = std::make_unique<log::MemorySink>();
    log::MemorySink* memory = sink.get();
    log::Logger::instance().add_sink(std::move(sink));

    auto xml = write_registry("vk.xml", kRegistry);
    ASSERT_TRUE(is_ok(run_generator(options_for({xml.string()}))));

    bool found = false;
    for (const auto& record : memory->records()) {
        if (record.module == "cli" &&
            record.message == "3 enumerators resolved, 0 canonical names replaced by shorter "
                              "aliases")
            found = true;
    }
    EXPECT_TRUE(found);
}

TEST_F(GeneratorTest, RerunIsByteIdentical) {
    auto xml = write_registry("vk.xml", kRegistry);
    auto opts = options_for({xml.string()});

    ASSERT_TRUE(is_ok(run_generator(opts)));
    std::string first = read_all(dir / "out" / "vk_enum_to_str.c");
    ASSERT_TRUE(is_ok(run_generator(opts)));
    std::string second = read_all(dir / "out" / "vk_enum_to_str.c");

    EXPECT_EQ(first, second);
}

TEST_F(GeneratorTest, MissingOutdirIsIoError) {
    auto xml = write_registry("vk.xml", kRegistry);
    GeneratorOptions opts = options_for({xml.string()});
    opts.outdir = (dir / "missing").string();

    auto result = run_generator(opts);

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Io);
}

TEST_F(GeneratorTest, FailedDocumentWritesNothing) {
    auto good = write_registry("vk.xml", kRegistry);
    auto bad = write_registry("broken.xml", "<registry><enums name=\"VkResult\"");

    auto result = run_generator(options_for({good.string(), bad.string()}));

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::XmlSyntax);
    EXPECT_FALSE(fs::exists(dir / "out" / "vk_enum_to_str.h"));
    EXPECT_FALSE(fs::exists(dir / "out" / "vk_enum_to_str.c"));
}

TEST_F(GeneratorTest, MissingDocumentIsIoError) {
    auto result = run_generator(options_for({(dir / "absent.xml").string()}));

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Io);
}

// ============================================================================
// Exit Codes
// ============================================================================

namespace {

int run_main(std::vector<std::string> args) {
    args.insert(args.begin(), "enumgen");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return enumgen_main(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST_F(GeneratorTest, MainExitCodes) {
    auto xml = write_registry("vk.xml", kRegistry);
    std::string outdir = (dir / "out").string();

    EXPECT_EQ(run_main({"--help"}), 0);
    EXPECT_EQ(run_main({"--xml", xml.string(), "--outdir", outdir}), 0);
    EXPECT_TRUE(fs::exists(dir / "out" / "vk_enum_to_str.h"));

    EXPECT_EQ(run_main({"--xml", xml.string()}), 1);
    EXPECT_EQ(run_main({"--xml", xml.string(), "--outdir", (dir / "nowhere").string()}), 1);
}
