#include <iostream>
#include <string>
#include <vector>

#include "argtree/argtree.hpp"

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Writes `arg` with backslash escapes interpreted. Returns false on \c.
bool writeEscaped(std::ostream& os, const std::string& arg) {
    for (std::size_t j = 0; j < arg.size(); ++j) {
        if (arg[j] != '\\' || j + 1 >= arg.size()) {
            os << arg[j];
            continue;
        }
        const char esc = arg[++j];
        switch (esc) {
        case 'a': os << '\a'; break;
        case 'b': os << '\b'; break;
        case 'c': return false;
        case 'e':
        case 'E': os << '\x1b'; break;
        case 'f': os << '\f'; break;
        case 'n': os << '\n'; break;
        case 'r': os << '\r'; break;
        case 't': os << '\t'; break;
        case 'v': os << '\v'; break;
        case '\\': os << '\\'; break;
        case 'x': {
            int value = 0;
            int digits = 0;
            while (digits < 2 && j + 1 < arg.size() && hexDigit(arg[j + 1]) >= 0) {
                value = value * 16 + hexDigit(arg[++j]);
                ++digits;
            }
            if (digits == 0) os << "\\x";
            else os << static_cast<char>(value);
            break;
        }
        case '0': {
            int value = 0;
            int digits = 0;
            while (digits < 3 && j + 1 < arg.size() && arg[j + 1] >= '0' && arg[j + 1] <= '7') {
                value = value * 8 + (arg[++j] - '0');
                ++digits;
            }
            os << static_cast<char>(value);
            break;
        }
        default: os << '\\' << esc;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    argtree::Command rootCmd("echo", "Echo the input arguments");
    rootCmd
        .withFlag(argtree::Flag("", 'n', "Do not print the trailing newline"))
        .withFlag(argtree::Flag("", 'e', "Enable interpretation of backslash escapes"))
        .withArgument(argtree::Argument("strings", "Strings to echo", false).arity(argtree::Arity(0, 255)))
        .allowOptionsAfterArgs(false)
        .action([](const argtree::ResolutionContext& ctx) {
            auto& out = ctx.command().out();
            const bool escapes = ctx.flag("e");
            const auto* strings = ctx.rawArgument("strings");
            bool first = true;
            if (strings) {
                for (const auto& s : *strings) {
                    if (!first) out << ' ';
                    first = false;
                    if (!escapes) {
                        out << s;
                    } else if (!writeEscaped(out, s)) {
                        return 0;
                    }
                }
            }
            if (!ctx.flag("n")) out << '\n';
            return 0;
        });

    return rootCmd.run(argc, argv);
}
