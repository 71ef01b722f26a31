#include "argtree/parameter.hpp"

namespace argtree {

namespace {

std::string stripDashes(std::string name) {
    std::size_t i = 0;
    while (i < name.size() && name[i] == '-') ++i;
    return name.substr(i);
}

void checkShortName(char c) {
    if (c == '\0') return;
    if (c == '-' || c == '=' || c == ' ') throw ConfigError(std::string("invalid short name '") + c + "'");
}

const std::vector<std::string>& emptyList() {
    static const std::vector<std::string> empty;
    return empty;
}

} // namespace

const std::vector<std::string>& Parameter::defaults() const { return defaults_ ? *defaults_ : emptyList(); }

const std::vector<std::string>& Parameter::values() const { return values_ ? *values_ : emptyList(); }

void Parameter::checkCount(const Arity& arity, const char* what, std::size_t count) const {
    if (arity.isSatisfied(count)) return;
    throw ConfigError(displayName() + ": " + std::to_string(count) + " " + what + " do not satisfy arity " +
                      arity.str());
}

void Parameter::setDefaults(std::vector<std::string> values) {
    if (isRequired()) throw ConfigError(displayName() + ": a required argument cannot have a default");
    if (defaults_) throw ConfigError(displayName() + ": defaults already set");
    checkCount(arity_, "default value(s)", values.size());
    defaults_ = std::move(values);
}

void Parameter::setValues(std::vector<std::string> values) {
    checkCount(arity_, "value(s)", values.size());
    values_ = std::move(values);
}

const std::vector<std::string>& Parameter::effectiveValues() const {
    if (values_) return *values_;
    if (defaults_) return *defaults_;
    if (isRequired()) {
        throw Error(ErrorCode::RequiredMissing, "missing required value for " + displayName(), displayName());
    }
    throw Error(ErrorCode::NoValueSet, "no value set for " + displayName(), displayName());
}

void Parameter::setArity(Arity arity) {
    if (defaults_) checkCount(arity, "default value(s)", defaults_->size());
    if (values_) checkCount(arity, "value(s)", values_->size());
    arity_ = arity;
}

Option::Option(std::string longName, char shortName, std::string description)
    : Parameter(std::move(description), Arity::zeroOrOne()),
      longName_(stripDashes(std::move(longName))),
      shortName_(shortName) {
    if (longName_.empty() && shortName_ == '\0') throw ConfigError("option needs a long or short name");
    checkShortName(shortName_);
}

std::string Option::key() const { return longName_.empty() ? std::string(1, shortName_) : longName_; }

std::string Option::displayName() const {
    return longName_.empty() ? std::string("-") + shortName_ : "--" + longName_;
}

Argument::Argument(std::string name, std::string description, bool required)
    : Parameter(std::move(description), required ? Arity::exactlyOne() : Arity::zeroOrOne()),
      name_(std::move(name)),
      required_(required) {
    if (name_.empty()) throw ConfigError("argument needs a name");
}

Argument& Argument::arity(Arity a) {
    if (required_ && a.min() == 0) {
        throw ConfigError(displayName() + ": a required argument must accept at least one value");
    }
    if (a.max() == 0) throw ConfigError(displayName() + ": an argument must accept at least one value");
    setArity(a);
    return *this;
}

Flag::Flag(std::string longName, char shortName, std::string description, bool defaultValue)
    : longName_(stripDashes(std::move(longName))),
      shortName_(shortName),
      description_(std::move(description)),
      defaultValue_(defaultValue) {
    if (longName_.empty() && shortName_ == '\0') throw ConfigError("flag needs a long or short name");
    checkShortName(shortName_);
}

std::string Flag::key() const { return longName_.empty() ? std::string(1, shortName_) : longName_; }

std::string Flag::displayName() const {
    return longName_.empty() ? std::string("-") + shortName_ : "--" + longName_;
}

} // namespace argtree
