#include <catch2/catch.hpp>
#include "argtree/command.hpp"
#include "argtree/exit_code.hpp"

#include <sstream>
#include <string>

using argtree::Argument;
using argtree::Command;
using argtree::ExitCode;
using argtree::Flag;
using argtree::Option;

namespace {

struct Harness {
    std::ostringstream out;
    std::ostringstream err;
    Command root{"app", "test application"};

    Harness() {
        root.setOut(out).setErr(err);
        root.withArgument(Argument::of<std::string>("name", "who"))
            .withOption(Option::of<int>("count", 'c', "how many").defaultValue(1))
            .withFlag(Flag("verbose", 'v', ""))
            .action([](const argtree::ResolutionContext& ctx) {
                auto& os = ctx.command().out();
                for (int i = 0; i < ctx.option<int>("count"); ++i) os << "hi " << ctx.argument<std::string>("name") << "\n";
                return ctx.flag("verbose") ? 5 : 0;
            });
    }
};

} // namespace

TEST_CASE("Command::run - dispatches to the action", "[run]") {
    Harness h;
    REQUIRE(h.root.run({"alice", "-c", "2"}) == 0);
    REQUIRE(h.out.str() == "hi alice\nhi alice\n");
    REQUIRE(h.err.str().empty());
}

TEST_CASE("Command::run - returns the action result", "[run]") {
    Harness h;
    REQUIRE(h.root.run({"alice", "-v"}) == 5);
}

TEST_CASE("Command::run - help goes to out", "[run]") {
    Harness h;
    REQUIRE(h.root.run({"--help"}) == argtree::toInt(ExitCode::Success));
    REQUIRE(h.out.str().rfind("Usage: app [options] <name>\n", 0) == 0);
    REQUIRE(h.err.str().empty());
}

TEST_CASE("Command::run - parse errors go to err with help", "[run]") {
    Harness h;
    const int code = h.root.run({"alice", "--bogus"});
    REQUIRE(code == argtree::toInt(ExitCode::SyntaxError));
    REQUIRE(h.err.str().rfind("Error: unknown option: --bogus\n", 0) == 0);
    REQUIRE(h.err.str().find("Usage: app") != std::string::npos);
    REQUIRE(h.out.str().empty());
}

TEST_CASE("Command::run - missing argument exit code", "[run]") {
    Harness h;
    REQUIRE(h.root.run(std::vector<std::string>{}) == argtree::toInt(ExitCode::ArgumentMissing));
    REQUIRE(h.err.str().find("Error: missing required argument <name>") != std::string::npos);
}

TEST_CASE("Command::run - decode errors from the action are reported", "[run]") {
    Harness h;
    REQUIRE(h.root.run({"alice", "--count", "lots"}) == argtree::toInt(ExitCode::InvalidCharacter));
    REQUIRE(h.err.str().find("Error: count: invalid int value \"lots\"") != std::string::npos);
}

TEST_CASE("Command::run - node without action shows help", "[run]") {
    std::ostringstream out;
    std::ostringstream err;
    Command root("tool");
    root.setOut(out).setErr(err);
    Command sub("sub", "does a thing");
    sub.action([](const argtree::ResolutionContext&) { return 3; });
    root.addCommand(std::move(sub));

    REQUIRE(root.run(std::vector<std::string>{}) == 0);
    REQUIRE(out.str().find("Commands:\n  sub - does a thing\n") != std::string::npos);

    REQUIRE(root.run({"sub"}) == 3);
}

TEST_CASE("Command::run - configuration setters reach the parser", "[run]") {
    Harness h;
    h.root.allowUnknownOptions();
    REQUIRE(h.root.run({"alice", "--bogus"}) == 0);
    REQUIRE(h.out.str() == "hi alice\n");
}

TEST_CASE("exitCodeFor - error mapping", "[run]") {
    using argtree::ErrorCode;
    REQUIRE(argtree::exitCodeFor(ErrorCode::Overflow) == ExitCode::Overflow);
    REQUIRE(argtree::exitCodeFor(ErrorCode::NoValueSet) == ExitCode::NoValueSet);
    REQUIRE(argtree::exitCodeFor(ErrorCode::NoActionDefined) == ExitCode::NoActionDefined);
    REQUIRE(argtree::exitCodeFor(ErrorCode::InvalidEnumValue) == ExitCode::InvalidEnumValue);
    REQUIRE(argtree::exitCodeFor(ErrorCode::InvalidJsonFormat) == ExitCode::InvalidJsonFormat);
    REQUIRE(argtree::exitCodeFor(ErrorCode::MissingField) == ExitCode::MissingRequiredField);
    REQUIRE(argtree::exitCodeFor(ErrorCode::ArgumentNotFound) == ExitCode::ArgumentNotFound);
}
