#ifndef ARGTREE_PARAMETER_HPP
#define ARGTREE_PARAMETER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arity.hpp"
#include "codec.hpp"

namespace argtree {

// Common part of options and positional arguments: arity, declared type and
// raw string storage for defaults and explicitly assigned values.
class Parameter {
public:
    virtual ~Parameter() = default;

    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const Arity& arity() const { return arity_; }
    [[nodiscard]] const std::string& typeName() const { return typeName_; }
    [[nodiscard]] bool hidden() const { return hidden_; }

    // Name used in messages: "--jobs", "-j" or "<input>".
    [[nodiscard]] virtual std::string displayName() const = 0;

    [[nodiscard]] bool hasDefaults() const { return defaults_.has_value(); }
    [[nodiscard]] const std::vector<std::string>& defaults() const;
    [[nodiscard]] bool hasValues() const { return values_.has_value(); }
    [[nodiscard]] const std::vector<std::string>& values() const;

    // Throws ConfigError when defaults were already set, when the count violates
    // the arity, or when the parameter is a required argument.
    void setDefaults(std::vector<std::string> values);
    // Throws ConfigError when the count violates the arity.
    void setValues(std::vector<std::string> values);
    void clearValues() { values_.reset(); }

    // Explicit values, else defaults. Throws Error{NoValueSet}, or
    // Error{RequiredMissing} for a required argument.
    [[nodiscard]] const std::vector<std::string>& effectiveValues() const;

    [[nodiscard]] bool isSatisfied(std::size_t count) const { return arity_.isSatisfied(count); }

protected:
    Parameter(std::string description, Arity arity) : description_(std::move(description)), arity_(arity) {}

    void setArity(Arity arity);
    [[nodiscard]] virtual bool isRequired() const { return false; }
    void checkCount(const Arity& arity, const char* what, std::size_t count) const;

    std::string description_;
    Arity arity_;
    std::string typeName_{"string"};
    bool hidden_{false};
    std::optional<std::vector<std::string>> defaults_;
    std::optional<std::vector<std::string>> values_;
};

// Named option: --jobs 4, -j4, --jobs=4.
class Option : public Parameter {
public:
    // Either name may be empty (short name '\0'), not both. Leading dashes on
    // the long name are dropped.
    Option(std::string longName, char shortName, std::string description);

    template <typename T>
    static Option of(std::string longName, char shortName, std::string description) {
        Option o(std::move(longName), shortName, std::move(description));
        o.typeName_ = argtree::typeName<T>();
        return o;
    }

    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] char shortName() const { return shortName_; }
    [[nodiscard]] bool hasShortName() const { return shortName_ != '\0'; }
    // Storage key in a ResolutionContext: the long name, else the short character.
    [[nodiscard]] std::string key() const;
    [[nodiscard]] std::string displayName() const override;

    Option& arity(Arity a) {
        setArity(a);
        return *this;
    }

    Option& hidden(bool v) {
        hidden_ = v;
        return *this;
    }

    Option& typeName(std::string name) {
        typeName_ = std::move(name);
        return *this;
    }
    using Parameter::typeName;
    using Parameter::arity;
    using Parameter::hidden;

    template <typename T>
    Option& defaultValue(const T& v) {
        setDefaults({encode(v)});
        return *this;
    }

    template <typename T>
    Option& defaultValues(const std::vector<T>& vs) {
        std::vector<std::string> raw;
        raw.reserve(vs.size());
        for (const auto& v : vs) raw.push_back(encode(v));
        setDefaults(std::move(raw));
        return *this;
    }

private:
    std::string longName_;
    char shortName_{'\0'};
};

// Positional argument. Position is given by registration order on a command.
class Argument : public Parameter {
public:
    // Required arguments take exactly one value, optional ones zero or one.
    Argument(std::string name, std::string description, bool required = true);

    template <typename T>
    static Argument of(std::string name, std::string description, bool required = true) {
        Argument a(std::move(name), std::move(description), required);
        a.typeName_ = argtree::typeName<T>();
        return a;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] bool required() const { return required_; }
    [[nodiscard]] std::string displayName() const override { return "<" + name_ + ">"; }

    // Throws ConfigError when the argument could never take a value, or when a
    // required argument would accept zero values.
    Argument& arity(Arity a);
    using Parameter::arity;

    Argument& typeName(std::string name) {
        typeName_ = std::move(name);
        return *this;
    }
    using Parameter::typeName;

    template <typename T>
    Argument& defaultValue(const T& v) {
        setDefaults({encode(v)});
        return *this;
    }

    template <typename T>
    Argument& defaultValues(const std::vector<T>& vs) {
        std::vector<std::string> raw;
        raw.reserve(vs.size());
        for (const auto& v : vs) raw.push_back(encode(v));
        setDefaults(std::move(raw));
        return *this;
    }

protected:
    [[nodiscard]] bool isRequired() const override { return required_; }

private:
    std::string name_;
    bool required_;
};

// Boolean switch. Presence flips the default, --name=false sets it explicitly.
class Flag {
public:
    Flag(std::string longName, char shortName, std::string description, bool defaultValue = false);

    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] char shortName() const { return shortName_; }
    [[nodiscard]] bool hasShortName() const { return shortName_ != '\0'; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] bool defaultValue() const { return defaultValue_; }
    [[nodiscard]] bool hidden() const { return hidden_; }
    [[nodiscard]] std::string key() const;
    [[nodiscard]] std::string displayName() const;

    Flag& hidden(bool v) {
        hidden_ = v;
        return *this;
    }

private:
    std::string longName_;
    char shortName_{'\0'};
    std::string description_;
    bool defaultValue_{false};
    bool hidden_{false};
};

} // namespace argtree

#endif // ARGTREE_PARAMETER_HPP
