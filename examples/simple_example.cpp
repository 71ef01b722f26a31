#include <iostream>
#include <string>

#include "argtree/argtree.hpp"

int main(int argc, char** argv) {
    argtree::Command rootCmd("demo", "A demo command");
    rootCmd
        .withOption(argtree::Option::of<int>("int", 'i', "An integer option").defaultValue(42))
        .withArgument(argtree::Argument::of<std::string>("input", "A string argument", /*required=*/false))
        .withFlag(argtree::Flag("verbose", 'v', "Enable verbose output"))
        .action([](const argtree::ResolutionContext& ctx) {
            std::cout << "Command executed successfully\n";
            std::cout << "Integer option value: " << ctx.option<int>("int") << "\n";
            std::cout << "Verbose flag value: " << (ctx.flag("verbose") ? "true" : "false") << "\n";
            std::cout << "Input argument value: " << ctx.argumentOr<std::string>("input", "no input") << "\n";
            return 0;
        });

    return rootCmd.run(argc, argv);
}
