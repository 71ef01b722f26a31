#include "argtree/command.hpp"

#include <algorithm>

#include "argtree/exit_code.hpp"
#include "argtree/help.hpp"

namespace argtree {

namespace {

// A long name "c" and a short-only "-c" share the context key "c".
template <typename P>
bool mixedKeyClash(const P& a, const P& b) {
    return a.key() == b.key() && a.longName().empty() != b.longName().empty();
}

template <typename P>
void checkMixedKeys(const std::vector<P>& inner, const std::vector<P>& outer, const std::string& where) {
    for (const auto& a : inner) {
        for (const auto& b : outer) {
            if (mixedKeyClash(a, b)) {
                throw ConfigError(where + ": " + a.displayName() + " and " + b.displayName() +
                                  " share the key \"" + a.key() + "\"");
            }
        }
    }
}

} // namespace

Command::Command(std::string name, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)) {
    if (name_.empty()) throw ConfigError("command needs a name");
}

Command::Command(Command&& other) noexcept
    : name_(std::move(other.name_)),
      description_(std::move(other.description_)),
      options_(std::move(other.options_)),
      flags_(std::move(other.flags_)),
      arguments_(std::move(other.arguments_)),
      subcommands_(std::move(other.subcommands_)),
      action_(std::move(other.action_)),
      parent_(other.parent_),
      out_(other.out_),
      err_(other.err_),
      parserOptions_(other.parserOptions_) {
    for (auto& c : subcommands_) c->reparent(this);
}

Command& Command::operator=(Command&& other) noexcept {
    if (this == &other) return *this;
    name_ = std::move(other.name_);
    description_ = std::move(other.description_);
    options_ = std::move(other.options_);
    flags_ = std::move(other.flags_);
    arguments_ = std::move(other.arguments_);
    subcommands_ = std::move(other.subcommands_);
    action_ = std::move(other.action_);
    parent_ = other.parent_;
    out_ = other.out_;
    err_ = other.err_;
    parserOptions_ = other.parserOptions_;
    for (auto& c : subcommands_) c->reparent(this);
    return *this;
}

void Command::reparent(Command* parent) {
    parent_ = parent;
    for (auto& c : subcommands_) c->reparent(this);
}

void Command::checkOptionNames(const std::string& longName, char shortName) const {
    if (longName == "help" || shortName == 'h') {
        throw ConfigError(commandPath() + ": -h/--help is reserved");
    }
    const std::string key = longName.empty() ? std::string(1, shortName) : longName;
    const auto sameKey = [&key](const auto& p) { return p.key() == key; };
    if (std::any_of(options_.begin(), options_.end(), sameKey) ||
        std::any_of(flags_.begin(), flags_.end(), sameKey)) {
        throw ConfigError(commandPath() + ": duplicate option \"" + key + "\"");
    }
    if (shortName == '\0') return;
    const auto sameShort = [shortName](const auto& p) { return p.shortName() == shortName; };
    if (std::any_of(options_.begin(), options_.end(), sameShort) ||
        std::any_of(flags_.begin(), flags_.end(), sameShort)) {
        throw ConfigError(commandPath() + ": duplicate short option -" + std::string(1, shortName));
    }
}

Command& Command::withOption(Option option) {
    checkOptionNames(option.longName(), option.shortName());
    options_.push_back(std::move(option));
    return *this;
}

Command& Command::withFlag(Flag flag) {
    checkOptionNames(flag.longName(), flag.shortName());
    flags_.push_back(std::move(flag));
    return *this;
}

Command& Command::withArgument(Argument argument) {
    if (findArgument(argument.name())) {
        throw ConfigError(commandPath() + ": duplicate argument " + argument.displayName());
    }
    if (argument.required()) {
        for (const auto& a : arguments_) {
            if (!a.required()) {
                throw ConfigError(commandPath() + ": required argument " + argument.displayName() +
                                  " cannot follow optional argument " + a.displayName());
            }
        }
    }
    arguments_.push_back(std::move(argument));
    return *this;
}

void Command::checkKeysAgainstAncestors(const Command& ancestor) const {
    for (const auto* a = &ancestor; a; a = a->parent_) {
        checkMixedKeys(options_, a->options_, name_);
        checkMixedKeys(flags_, a->flags_, name_);
    }
    for (const auto& c : subcommands_) c->checkKeysAgainstAncestors(ancestor);
}

Command& Command::addCommand(Command cmd) {
    if (findSubcommand(cmd.name())) throw ConfigError(commandPath() + ": duplicate command " + cmd.name());
    cmd.checkKeysAgainstAncestors(*this);
    auto child = std::make_unique<Command>(std::move(cmd));
    child->reparent(this);
    subcommands_.push_back(std::move(child));
    return *this;
}

Command& Command::action(Action fn) {
    action_ = std::move(fn);
    return *this;
}

std::string Command::commandPath() const {
    std::vector<const Command*> chain;
    for (auto* c = this; c; c = c->parent_) chain.push_back(c);
    std::string out;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!out.empty()) out += " ";
        out += (*it)->name_;
    }
    return out;
}

const Option* Command::findLocalOption(std::string_view longName) const {
    if (longName.empty()) return nullptr;
    for (const auto& o : options_) {
        if (o.longName() == longName) return &o;
    }
    return nullptr;
}

const Flag* Command::findLocalFlag(std::string_view name) const {
    if (name.empty()) return nullptr;
    for (const auto& f : flags_) {
        if (f.longName() == name) return &f;
    }
    return nullptr;
}

const Option* Command::findOption(std::string_view longName) const {
    for (auto* c = this; c; c = c->parent_) {
        if (const auto* o = c->findLocalOption(longName)) return o;
    }
    return nullptr;
}

const Option* Command::findOptionByShort(char shortName) const {
    if (shortName == '\0') return nullptr;
    for (auto* c = this; c; c = c->parent_) {
        for (const auto& o : c->options_) {
            if (o.shortName() == shortName) return &o;
        }
    }
    return nullptr;
}

const Flag* Command::findFlag(std::string_view name) const {
    for (auto* c = this; c; c = c->parent_) {
        if (const auto* f = c->findLocalFlag(name)) return f;
    }
    return nullptr;
}

const Flag* Command::findFlagByShort(char shortName) const {
    if (shortName == '\0') return nullptr;
    for (auto* c = this; c; c = c->parent_) {
        for (const auto& f : c->flags_) {
            if (f.shortName() == shortName) return &f;
        }
    }
    return nullptr;
}

const Command* Command::findSubcommand(std::string_view name) const {
    for (const auto& c : subcommands_) {
        if (c->name_ == name) return c.get();
    }
    return nullptr;
}

const Argument* Command::findArgument(std::string_view name) const {
    for (const auto& a : arguments_) {
        if (a.name() == name) return &a;
    }
    return nullptr;
}

std::vector<std::string> Command::visibleOptionNames() const {
    std::vector<std::string> out{"help"};
    for (auto* c = this; c; c = c->parent_) {
        for (const auto& o : c->options_) {
            if (!o.hidden() && !o.longName().empty()) out.push_back(o.longName());
        }
        for (const auto& f : c->flags_) {
            if (!f.hidden() && !f.longName().empty()) out.push_back(f.longName());
        }
    }
    return out;
}

int Command::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return run(args);
}

int Command::run(const std::vector<std::string>& args) {
    const Parser parser(*this, parserOptions_);
    const auto result = parser.parse(args);
    const Command& cmd = result.command();

    if (result.helpRequested()) {
        cmd.out() << renderHelp(cmd);
        return toInt(ExitCode::Success);
    }

    if (result.failed()) {
        for (const auto& d : result.diagnostics()) {
            cmd.err() << "Error: " << d.message;
            if (d.message.empty() || d.message.back() != '\n') cmd.err() << "\n";
        }
        cmd.err() << "\n" << renderHelp(cmd);
        return toInt(exitCodeFor(result.diagnostics().front().code));
    }

    if (!cmd.runnable()) {
        cmd.out() << renderHelp(cmd);
        return toInt(ExitCode::Success);
    }

    try {
        return result.invoke();
    } catch (const Error& e) {
        cmd.err() << "Error: " << e.what() << "\n";
        return toInt(exitCodeFor(e.code()));
    }
}

} // namespace argtree
