#include "argtree/parser.hpp"

#include <algorithm>
#include <iterator>

#include "argtree/codec.hpp"
#include "argtree/command.hpp"
#include "argtree/utils.hpp"

namespace argtree {

namespace {

bool looksLikeOption(const std::string& token) { return token.size() > 1 && token[0] == '-'; }

std::string plural(std::size_t n, const char* word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

std::string bound(std::size_t n) { return n == Arity::kUnbounded ? "unbounded" : std::to_string(n); }

} // namespace

struct Parser::ScanState {
    const std::vector<std::string>& tokens;
    std::size_t next{0}; // index of the next unread token

    const Command* command{nullptr};
    ResolutionContext* context{nullptr};
    std::size_t cursor{0}; // current positional argument on `command`

    bool positionalOnly{false};
    bool seenPositional{false};
    bool help{false};

    std::vector<std::unique_ptr<ResolutionContext>> chain;
    std::vector<Diagnostic> diagnostics;

    explicit ScanState(const std::vector<std::string>& t) : tokens(t) {}

    void fail(ErrorCode code, std::string name, std::string value, std::string message,
              std::size_t expected = 0, std::size_t actual = 0) {
        Diagnostic d;
        d.code = code;
        d.name = std::move(name);
        d.value = std::move(value);
        d.expected = expected;
        d.actual = actual;
        d.message = std::move(message);
        diagnostics.push_back(std::move(d));
    }
};

int ParseResult::invoke() const {
    if (!command_->runnable()) {
        throw Error(ErrorCode::NoActionDefined, "no action defined for \"" + command_->commandPath() + "\"",
                    command_->name());
    }
    return command_->actionFn()(context());
}

ParseResult Parser::parse(int argc, char** argv) const {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) tokens.emplace_back(argv[i]);
    return parse(tokens);
}

ParseResult Parser::parse(const std::vector<std::string>& tokens) const {
    ScanState st(tokens);
    st.chain.push_back(std::make_unique<ResolutionContext>(*root_));
    st.command = root_;
    st.context = st.chain.back().get();

    while (st.next < tokens.size()) {
        const std::string& token = tokens[st.next++];

        if (st.positionalOnly) {
            assignPositional(st, token);
            continue;
        }
        if (options_.doubleHyphenDelimiter && token == "--") {
            st.positionalOnly = true;
            continue;
        }
        if (looksLikeOption(token)) {
            if (!options_.allowOptionsAfterArgs && st.seenPositional) {
                assignPositional(st, token);
            } else if (token.size() > 2 && token[1] == '-') {
                scanLong(st, token);
            } else {
                scanShort(st, token);
            }
            continue;
        }
        if (const auto* child = st.command->findSubcommand(token)) {
            descend(st, *child);
            continue;
        }
        assignPositional(st, token);
    }

    finish(st);

    ParseResult result;
    result.command_ = st.command;
    result.contexts_ = std::move(st.chain);
    result.diagnostics_ = std::move(st.diagnostics);
    if (st.help) {
        result.status_ = ParseResult::Status::Help;
    } else if (!result.diagnostics_.empty()) {
        result.status_ = ParseResult::Status::Failed;
    }
    return result;
}

void Parser::descend(ScanState& st, const Command& child) const {
    st.chain.push_back(std::make_unique<ResolutionContext>(child, st.context));
    st.context = st.chain.back().get();
    st.command = &child;
    st.cursor = 0;
}

void Parser::scanLong(ScanState& st, const std::string& token) const {
    const auto body = token.substr(2);
    const auto eq = body.find('=');
    const std::string name = eq == std::string::npos ? body : body.substr(0, eq);
    std::optional<std::string> seed;
    if (eq != std::string::npos) seed = body.substr(eq + 1);

    if (name == "help") {
        st.help = true;
        return;
    }
    if (const auto* flag = st.command->findFlag(name)) {
        setFlag(st, *flag, seed);
        return;
    }
    if (const auto* option = st.command->findOption(name)) {
        gather(st, *option, std::move(seed), true);
        return;
    }
    unknownOption(st, token, name);
}

void Parser::scanShort(ScanState& st, const std::string& token) const {
    const auto body = token.substr(1);
    if (body == "h") {
        st.help = true;
        return;
    }

    const auto eq = body.find('=');
    if (eq != std::string::npos) {
        // -x=value: one value, nothing pulled from the following tokens.
        const auto name = body.substr(0, eq);
        std::string value = body.substr(eq + 1);
        if (name.size() == 1) {
            if (const auto* flag = st.command->findFlagByShort(name[0])) {
                setFlag(st, *flag, value);
                return;
            }
            if (const auto* option = st.command->findOptionByShort(name[0])) {
                gather(st, *option, std::move(value), false);
                return;
            }
            if (name[0] == 'h') {
                st.help = true;
                return;
            }
        }
        unknownOption(st, "-" + name, name);
        return;
    }

    if (body.size() > 1) {
        // -xVALUE when x takes values, otherwise a cluster of flags.
        if (const auto* option = st.command->findOptionByShort(body[0])) {
            gather(st, *option, body.substr(1), false);
            return;
        }
        for (const char c : body) {
            if (const auto* flag = st.command->findFlagByShort(c)) {
                setFlag(st, *flag, std::nullopt);
            } else if (c == 'h') {
                st.help = true;
            } else {
                unknownOption(st, std::string("-") + c, std::string(1, c));
            }
        }
        return;
    }

    const char c = body[0];
    if (const auto* flag = st.command->findFlagByShort(c)) {
        setFlag(st, *flag, std::nullopt);
        return;
    }
    if (const auto* option = st.command->findOptionByShort(c)) {
        gather(st, *option, std::nullopt, true);
        return;
    }
    if (!options_.allowOptionsAfterArgs) {
        assignPositional(st, token);
        return;
    }
    unknownOption(st, token, body);
}

void Parser::setFlag(ScanState& st, const Flag& flag, const std::optional<std::string>& raw) const {
    bool value = !flag.defaultValue();
    if (raw && !detail::parseBool(*raw, value)) {
        st.fail(ErrorCode::InvalidFlagValue, flag.key(), *raw,
                "invalid value \"" + *raw + "\" for flag " + flag.displayName());
        return;
    }
    st.context->setFlag(flag.key(), value);
}

void Parser::gather(ScanState& st, const Option& option, std::optional<std::string> seed, bool pull) const {
    const auto& arity = option.arity();
    std::vector<std::string> values;
    if (seed) values.push_back(std::move(*seed));
    while (pull && values.size() < arity.max() && st.next < st.tokens.size() &&
           !looksLikeOption(st.tokens[st.next])) {
        values.push_back(st.tokens[st.next++]);
    }

    const auto name = option.displayName();
    if (values.size() < arity.min()) {
        st.fail(ErrorCode::InsufficientValues, option.key(), values.empty() ? std::string{} : values.back(),
                "option " + name + " requires at least " + plural(arity.min(), "value") + ", got " +
                    std::to_string(values.size()),
                arity.min(), values.size());
        return;
    }
    if (values.empty()) return;

    auto all = earlierValues(st, option);
    const auto total = all.size() + values.size();
    if (total > arity.max()) {
        st.fail(ErrorCode::TooManyValues, option.key(), values.back(),
                "option " + name + " accepts at most " + bound(arity.max()) + " value(s), got " +
                    std::to_string(total),
                arity.max(), total);
        return;
    }
    all.insert(all.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
    st.context->setOption(option.key(), std::move(all));
}

// Values already given for `option`, possibly before one or more descents.
// Walks from the current context up to the context of the declaring command.
std::vector<std::string> Parser::earlierValues(const ScanState& st, const Option& option) const {
    std::vector<const std::vector<std::string>*> found;
    for (const auto* ctx = st.context; ctx; ctx = ctx->parent()) {
        if (ctx->hasLocalOption(option.key())) found.push_back(ctx->rawOption(option.key()));
        const auto& declared = ctx->command().options();
        const bool owner = std::any_of(declared.begin(), declared.end(),
                                       [&option](const Option& o) { return &o == &option; });
        if (owner) break;
    }
    std::vector<std::string> out;
    for (auto it = found.rbegin(); it != found.rend(); ++it) out.insert(out.end(), (*it)->begin(), (*it)->end());
    return out;
}

void Parser::unknownOption(ScanState& st, const std::string& token, const std::string& name) const {
    if (options_.allowUnknownOptions) return;
    std::string message = "unknown option: " + token;
    if (options_.suggestOptions && name.size() > 1) {
        const auto sugg = utils::suggest(name, st.command->visibleOptionNames(), 3,
                                         options_.suggestionsMinimumDistance);
        if (!sugg.empty()) {
            message += "\n\nDid you mean this?\n";
            for (const auto& s : sugg) message += "  --" + s + "\n";
        }
    }
    st.fail(ErrorCode::UnknownOption, name, token, std::move(message));
}

void Parser::assignPositional(ScanState& st, const std::string& token) const {
    const auto& args = st.command->arguments();
    if (st.cursor >= args.size()) {
        std::string message;
        if (args.empty() && !st.command->subcommands().empty()) {
            message = "unknown command \"" + token + "\" for \"" + st.command->commandPath() + "\"";
            std::vector<std::string> names;
            for (const auto& c : st.command->subcommands()) names.push_back(c->name());
            const auto sugg = options_.suggestOptions
                                  ? utils::suggest(token, names, 3, options_.suggestionsMinimumDistance)
                                  : std::vector<std::string>{};
            if (!sugg.empty()) {
                message += "\n\nDid you mean this?\n";
                for (const auto& s : sugg) message += "  " + s + "\n";
            }
        } else {
            message = "unexpected argument \"" + token + "\" for \"" + st.command->commandPath() + "\"";
        }
        st.fail(ErrorCode::UnexpectedPositional, {}, token, std::move(message));
        return;
    }

    const auto& arg = args[st.cursor];
    const auto max = arg.arity().max();
    const auto count = st.context->localArgumentCount(arg.name());
    if (count >= max) {
        st.fail(ErrorCode::TooManyValues, arg.name(), token,
                "argument " + arg.displayName() + " accepts at most " + bound(max) + " value(s)", max, count + 1);
        return;
    }
    st.context->appendArgument(arg.name(), token);
    st.seenPositional = true;
    if (count + 1 == max) ++st.cursor;
}

void Parser::finish(ScanState& st) const {
    if (st.help) return;

    for (const auto& arg : st.command->arguments()) {
        const auto count = st.context->localArgumentCount(arg.name());
        if (count >= arg.arity().min()) continue;
        // A declared default stands in for an absent optional argument.
        if (count == 0 && (arg.hasValues() || arg.hasDefaults())) continue;
        if (arg.required()) {
            st.fail(ErrorCode::RequiredArgumentMissing, arg.name(), {},
                    "missing required argument " + arg.displayName(), arg.arity().min(), count);
        } else {
            st.fail(ErrorCode::InsufficientValues, arg.name(), {},
                    "argument " + arg.displayName() + " requires at least " + plural(arg.arity().min(), "value") +
                        ", got " + std::to_string(count),
                    arg.arity().min(), count);
        }
    }

    // Each node's own context receives its declarations' defaults, so lookups
    // from deeper contexts fall back to them through the parent chain.
    for (auto& ctx : st.chain) {
        const Command& cmd = ctx->command();
        for (const auto& o : cmd.options()) {
            if (ctx->hasLocalOption(o.key())) continue;
            if (o.hasValues()) ctx->setOption(o.key(), o.values());
            else if (o.hasDefaults()) ctx->setOption(o.key(), o.defaults());
        }
        for (const auto& f : cmd.flags()) {
            if (!ctx->hasLocalFlag(f.key())) ctx->setFlag(f.key(), f.defaultValue());
        }
        for (const auto& a : cmd.arguments()) {
            if (ctx->hasLocalArgument(a.name())) continue;
            if (a.hasValues()) ctx->setArgument(a.name(), a.values());
            else if (a.hasDefaults()) ctx->setArgument(a.name(), a.defaults());
        }
    }
}

} // namespace argtree
