#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "argtree/argtree.hpp"

namespace demo {

struct Worker {
    std::string name;
    std::uint32_t id{0};
};

// Unknown fields are ignored; both fields are required.
void fromJson(const argtree::json::Value& v, Worker& w) {
    w.name = argtree::json::get<std::string>(v, "name");
    w.id = argtree::json::get<std::uint32_t>(v, "id");
}

argtree::json::Value toJson(const Worker& w) {
    auto v = argtree::json::Value::object();
    v.set("name", argtree::json::Value::string(w.name));
    v.set("id", argtree::json::Value::number(std::to_string(w.id)));
    return v;
}

} // namespace demo

// demo sub "hello world" '{"name":"Jane","id":456}' '{"name":"Joan","id":789}' --worker '{"name":"John","id":123}' -i 32
// demo sub "hello world" '{"name":"Jane","id":456}' -w='{"name":"John","id":123}'
// demo sub -h
int main(int argc, char** argv) {
    argtree::Command rootCmd("demo", "A demo command");
    rootCmd
        .withOption(argtree::Option::of<int>("int", 'i', "An integer option").defaultValue(7))
        .withFlag(argtree::Flag("verbose", 'v', "Enable verbose output"));

    argtree::Command subCmd("sub", "A subcommand");
    subCmd
        .withOption(argtree::Option::of<demo::Worker>("worker", 'w', "A worker struct option (JSON)"))
        .withArgument(argtree::Argument::of<std::string>("input", "A string argument"))
        .withArgument(argtree::Argument::of<demo::Worker>("worker_arg", "A worker struct argument", false)
                          .arity(argtree::Arity(1, 2)))
        .action([](const argtree::ResolutionContext& ctx) {
            auto& out = ctx.command().out();
            out << "Sub command action called!\n";
            out << "Global integer option: " << ctx.option<int>("int") << "\n";
            if (ctx.flag("verbose")) out << "Verbose output enabled\n";

            if (ctx.hasOption("worker")) {
                const auto w = ctx.option<demo::Worker>("worker");
                out << "Worker from option: name=" << w.name << ", id=" << w.id << "\n";
            } else {
                out << "No worker option provided.\n";
            }

            out << "Input argument: " << ctx.argument<std::string>("input") << "\n";

            const auto workers = ctx.arguments<demo::Worker>("worker_arg");
            for (std::size_t i = 0; i < workers.size(); ++i) {
                out << "Worker_arg[" << i << "]: name=" << workers[i].name << ", id=" << workers[i].id << "\n";
            }
            out << "Action completed successfully!\n";
            return 0;
        });

    rootCmd.addCommand(std::move(subCmd));
    return rootCmd.run(argc, argv);
}
