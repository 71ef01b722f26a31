#ifndef ARGTREE_COMMAND_HPP
#define ARGTREE_COMMAND_HPP

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "context.hpp"
#include "parameter.hpp"
#include "parser.hpp"

namespace argtree {

// A node of the command tree. Owns its declarations and subcommands; the
// parent pointer is a back reference kept up to date by addCommand().
class Command {
public:
    using Action = std::function<int(const ResolutionContext&)>;

    explicit Command(std::string name, std::string description = {});

    Command(Command&& other) noexcept;
    Command& operator=(Command&& other) noexcept;
    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    // Declarations. All of them throw ConfigError on a name or key clash; -h
    // and --help are reserved.
    Command& withOption(Option option);
    Command& withFlag(Flag flag);
    // Throws ConfigError when a required argument follows an optional one.
    Command& withArgument(Argument argument);
    Command& addCommand(Command cmd);
    Command& action(Action fn);

    Command& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Command& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    Command& allowUnknownOptions(bool v = true) {
        parserOptions_.allowUnknownOptions = v;
        return *this;
    }

    Command& doubleHyphenDelimiter(bool v = true) {
        parserOptions_.doubleHyphenDelimiter = v;
        return *this;
    }

    Command& allowOptionsAfterArgs(bool v = true) {
        parserOptions_.allowOptionsAfterArgs = v;
        return *this;
    }

    Command& suggestions(bool v = true) {
        parserOptions_.suggestOptions = v;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::vector<Option>& options() const { return options_; }
    [[nodiscard]] const std::vector<Flag>& flags() const { return flags_; }
    [[nodiscard]] const std::vector<Argument>& arguments() const { return arguments_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Command>>& subcommands() const { return subcommands_; }
    [[nodiscard]] const Command* parent() const { return parent_; }
    [[nodiscard]] bool isRoot() const { return parent_ == nullptr; }
    [[nodiscard]] bool runnable() const { return static_cast<bool>(action_); }
    [[nodiscard]] const Action& actionFn() const { return action_; }
    [[nodiscard]] const Parser::Options& parserOptions() const { return parserOptions_; }

    // "app build"
    [[nodiscard]] std::string commandPath() const;

    // Searched on this node, then on its ancestors.
    [[nodiscard]] const Option* findOption(std::string_view longName) const;
    [[nodiscard]] const Option* findOptionByShort(char shortName) const;
    [[nodiscard]] const Flag* findFlag(std::string_view name) const;
    [[nodiscard]] const Flag* findFlagByShort(char shortName) const;
    // Direct children / local declarations only.
    [[nodiscard]] const Command* findSubcommand(std::string_view name) const;
    [[nodiscard]] const Argument* findArgument(std::string_view name) const;

    // Long option and flag names visible from this node, for suggestions.
    [[nodiscard]] std::vector<std::string> visibleOptionNames() const;

    std::ostream& out() const {
        if (out_) return *out_;
        if (parent_) return parent_->out();
        return std::cout;
    }

    std::ostream& err() const {
        if (err_) return *err_;
        if (parent_) return parent_->err();
        return std::cerr;
    }

    // Parses, prints help or errors, dispatches to the action. Returns the
    // process exit status.
    int run(int argc, char** argv);
    int run(const std::vector<std::string>& args);

private:
    void reparent(Command* parent);
    void checkOptionNames(const std::string& longName, char shortName) const;
    // Rejects "--c" on one level and a short-only "-c" on another in this subtree.
    void checkKeysAgainstAncestors(const Command& ancestor) const;
    const Option* findLocalOption(std::string_view longName) const;
    const Flag* findLocalFlag(std::string_view name) const;

    std::string name_;
    std::string description_;
    std::vector<Option> options_;
    std::vector<Flag> flags_;
    std::vector<Argument> arguments_;
    std::vector<std::unique_ptr<Command>> subcommands_;
    Action action_;
    Command* parent_{nullptr};
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
    Parser::Options parserOptions_;
};

} // namespace argtree

#endif // ARGTREE_COMMAND_HPP
