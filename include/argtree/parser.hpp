#ifndef ARGTREE_PARSER_HPP
#define ARGTREE_PARSER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "context.hpp"
#include "error.hpp"

namespace argtree {

class Command;
class Flag;
class Option;

// Outcome of one parse: the terminal command, the context chain from the root
// down to it, and any user input errors.
class ParseResult {
public:
    enum class Status { Ok, Help, Failed };

    ParseResult(ParseResult&&) = default;
    ParseResult& operator=(ParseResult&&) = default;
    ParseResult(const ParseResult&) = delete;
    ParseResult& operator=(const ParseResult&) = delete;

    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] bool ok() const { return status_ == Status::Ok; }
    [[nodiscard]] bool helpRequested() const { return status_ == Status::Help; }
    [[nodiscard]] bool failed() const { return status_ == Status::Failed; }

    [[nodiscard]] const Command& command() const { return *command_; }
    // Context of the terminal command.
    [[nodiscard]] const ResolutionContext& context() const { return *contexts_.back(); }
    [[nodiscard]] const std::vector<std::unique_ptr<ResolutionContext>>& contexts() const { return contexts_; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    // Runs the terminal command's action. Throws Error{NoActionDefined}.
    int invoke() const;

private:
    friend class Parser;
    ParseResult() = default;

    Status status_{Status::Ok};
    const Command* command_{nullptr};
    std::vector<std::unique_ptr<ResolutionContext>> contexts_;
    std::vector<Diagnostic> diagnostics_;
};

// Walks a token stream against a command tree. The tree is only read.
class Parser {
public:
    struct Options {
        bool allowUnknownOptions{false};
        bool doubleHyphenDelimiter{true}; // "--" ends option parsing
        bool allowOptionsAfterArgs{true};
        bool suggestOptions{true};
        std::size_t suggestionsMinimumDistance{2};
    };

    explicit Parser(const Command& root) : Parser(root, Options{}) {}
    Parser(const Command& root, Options options) : root_(&root), options_(options) {}

    [[nodiscard]] const Options& options() const { return options_; }

    // Tokens without the program name.
    [[nodiscard]] ParseResult parse(const std::vector<std::string>& tokens) const;
    // Skips argv[0].
    [[nodiscard]] ParseResult parse(int argc, char** argv) const;

private:
    struct ScanState;

    void scanLong(ScanState& st, const std::string& token) const;
    void scanShort(ScanState& st, const std::string& token) const;
    void assignPositional(ScanState& st, const std::string& token) const;
    void descend(ScanState& st, const Command& child) const;
    void setFlag(ScanState& st, const Flag& flag, const std::optional<std::string>& raw) const;
    void gather(ScanState& st, const Option& option, std::optional<std::string> seed, bool pull) const;
    std::vector<std::string> earlierValues(const ScanState& st, const Option& option) const;
    void unknownOption(ScanState& st, const std::string& token, const std::string& name) const;
    void finish(ScanState& st) const;

    const Command* root_;
    Options options_;
};

} // namespace argtree

#endif // ARGTREE_PARSER_HPP
