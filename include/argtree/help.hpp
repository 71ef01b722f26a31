#ifndef ARGTREE_HELP_HPP
#define ARGTREE_HELP_HPP

#include <string>

namespace argtree {

class Command;
class Flag;
class Option;

// "Usage: app build [command] [options] <target> [extra...]\n"
std::string renderUsage(const Command& cmd);

// Usage line, description, then the Arguments, Commands, Options and Global
// Options sections. Empty sections are left out.
std::string renderHelp(const Command& cmd);

std::string formatOptionForHelp(const Option& option);
std::string formatFlagForHelp(const Flag& flag);

} // namespace argtree

#endif // ARGTREE_HELP_HPP
