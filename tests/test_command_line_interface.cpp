/**
 * @file test_command_line_interface.cpp
 * @brief Command line parsing tests
 */

#include "cli/CommandLineInterface.hpp"
#include "TestDatasets.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace prefmap;
using namespace prefmap::test;

namespace {

bool parse(CommandLineInterface& cli, std::vector<std::string> args) {
    args.insert(args.begin(), "prefmap");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return cli.parse_arguments(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(CommandLineInterfaceTest, Defaults) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--scale", "[{\"id\":13,\"scale\":5}]"}));

    const RenderRequest& request = cli.get_request();
    EXPECT_EQ(request.scale_payload, "[{\"id\":13,\"scale\":5}]");
    EXPECT_EQ(request.format, OutputFormat::PNG);
    EXPECT_EQ(request.output_path, "map.png");
    EXPECT_EQ(request.options.size_class, SizeClass::STANDARD);
    EXPECT_FALSE(request.options.show_scale_labels);
    EXPECT_EQ(cli.get_config().dataset_path, "japan.geojson");
}

TEST(CommandLineInterfaceTest, AllRequestOptions) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"-s", "[]", "--size=3", "--scale-text", "--footer", "Hello",
                            "-g", "regions.geojson", "--font-weight", "500",
                            "-f", "svg", "-o", "-", "--log-level", "4"}));

    const RenderRequest& request = cli.get_request();
    EXPECT_EQ(request.options.size_class, SizeClass::EXTRA_LARGE);
    EXPECT_TRUE(request.options.show_scale_labels);
    EXPECT_EQ(request.options.footer_text, "Hello");
    EXPECT_EQ(request.format, OutputFormat::SVG);
    EXPECT_EQ(request.output_path, "-");
    EXPECT_EQ(cli.get_config().dataset_path, "regions.geojson");
    EXPECT_EQ(cli.get_config().font_weight, FontWeight::MEDIUM);
    EXPECT_EQ(cli.get_config().log_config, "4");
}

TEST(CommandLineInterfaceTest, SvgDefaultOutput) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--scale", "[]", "--format", "svg"}));
    EXPECT_EQ(cli.get_request().output_path, "map.svg");
}

TEST(CommandLineInterfaceTest, ScaleFromFile) {
    TempFile file("prefmap_cli_scale.json", "[{\"id\":27,\"scale\":2}]");
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--scale-file", file.path()}));
    EXPECT_EQ(cli.get_request().scale_payload, "[{\"id\":27,\"scale\":2}]");
}

TEST(CommandLineInterfaceTest, ConfigFileThenOverrides) {
    TempFile config("prefmap_cli_config.json",
                    R"({"dataset_path": "from-config.geojson", "font_directory": "/opt/fonts"})");
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--config", config.path(), "--geojson", "override.geojson", "--scale", "[]"}));

    EXPECT_EQ(cli.get_config().dataset_path, "override.geojson");
    EXPECT_EQ(cli.get_config().font_directory, "/opt/fonts");
}

TEST(CommandLineInterfaceTest, RejectsBadArguments) {
    CommandLineInterface a;
    EXPECT_FALSE(parse(a, {"--scale", "[]", "--format", "gif"}));

    CommandLineInterface b;
    EXPECT_FALSE(parse(b, {"--scale", "[]", "--scale-file", "x.json"}));

    CommandLineInterface c;
    EXPECT_FALSE(parse(c, {"--unknown"}));

    CommandLineInterface d;
    EXPECT_FALSE(parse(d, {"--scale-file", "/nonexistent/prefmap/levels.json"}));

    CommandLineInterface e;
    EXPECT_FALSE(parse(e, {"--config", "/nonexistent/prefmap/config.json"}));

    CommandLineInterface f;
    EXPECT_FALSE(parse(f, {"stray"}));
    EXPECT_FALSE(f.help_requested());
}

TEST(CommandLineInterfaceTest, HelpIsNotAnError) {
    CommandLineInterface cli;
    EXPECT_FALSE(parse(cli, {"--help"}));
    EXPECT_TRUE(cli.help_requested());
}
