#include <catch2/catch.hpp>
#include "argtree/command.hpp"
#include "argtree/help.hpp"

#include <string>

using argtree::Argument;
using argtree::Arity;
using argtree::Command;
using argtree::Flag;
using argtree::Option;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("renderHelp - root command", "[help]") {
    Command root("app", "greets people");
    root.withArgument(Argument::of<std::string>("name", "who to greet"))
        .withOption(Option::of<int>("count", 'c', "repetitions").defaultValue(1))
        .withFlag(Flag("verbose", 'v', "verbose output"));

    REQUIRE(argtree::renderHelp(root) ==
            "Usage: app [options] <name>\n"
            "\n"
            "greets people\n"
            "\n"
            "Arguments:\n"
            "  name string - who to greet (required)\n"
            "\n"
            "Options:\n"
            "  -c, --count int - repetitions (default: 1)\n"
            "  -v, --verbose - verbose output\n"
            "  -h, --help - Show help\n");
}

TEST_CASE("renderHelp - subcommand lists inherited options", "[help]") {
    Command root("app");
    root.withFlag(Flag("verbose", 'v', "verbose output"));
    Command build("build", "build the project");
    build.withOption(Option::of<int>("jobs", 'j', "parallel jobs").arity(Arity(1, 3)))
        .withArgument(Argument("targets", "what to build", false).arity(Arity(0, 4)));
    root.addCommand(std::move(build));

    const auto rootHelp = argtree::renderHelp(root);
    REQUIRE(contains(rootHelp, "Usage: app [command] [options]\n"));
    REQUIRE(contains(rootHelp, "Commands:\n  build - build the project\n"));

    const auto buildHelp = argtree::renderHelp(*root.findSubcommand("build"));
    REQUIRE(contains(buildHelp, "Usage: app build [options] [targets]...\n"));
    REQUIRE(contains(buildHelp, "  -j, --jobs int... - parallel jobs\n"));
    REQUIRE(contains(buildHelp, "Global Options:\n  -v, --verbose - verbose output\n"));
}

TEST_CASE("renderHelp - hidden options and string defaults", "[help]") {
    Command root("app");
    root.withOption(Option("secret", '\0', "internal").hidden(true))
        .withOption(Option("format", 'f', "output format").defaultValue(std::string("json")))
        .withFlag(Flag("color", '\0', "colorize", true));
    const auto help = argtree::renderHelp(root);
    REQUIRE_FALSE(contains(help, "secret"));
    REQUIRE(contains(help, "  -f, --format string - output format (default: \"json\")\n"));
    REQUIRE(contains(help, "  --color - colorize (default: true)\n"));
}

TEST_CASE("renderUsage - argument forms", "[help]") {
    Command root("cp");
    root.withArgument(Argument("src", "").arity(Arity::oneOrMore()))
        .withArgument(Argument("dst", "", false));
    REQUIRE(argtree::renderUsage(root) == "Usage: cp [options] <src>... [dst]\n");
}
