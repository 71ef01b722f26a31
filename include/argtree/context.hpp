#ifndef ARGTREE_CONTEXT_HPP
#define ARGTREE_CONTEXT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "error.hpp"

namespace argtree {

class Command;

// Values resolved for one command node of a parse. Lookups that miss locally
// continue in the parent context, so a subcommand action sees its ancestors'
// options, flags and arguments.
class ResolutionContext {
public:
    explicit ResolutionContext(const Command& command, const ResolutionContext* parent = nullptr)
        : command_(&command), parent_(parent) {}

    [[nodiscard]] const Command& command() const { return *command_; }
    [[nodiscard]] const ResolutionContext* parent() const { return parent_; }

    // Raw string values, searched locally then up the chain. nullptr when absent.
    [[nodiscard]] const std::vector<std::string>* rawOption(std::string_view name) const;
    [[nodiscard]] const std::vector<std::string>* rawArgument(std::string_view name) const;

    [[nodiscard]] bool hasOption(std::string_view name) const { return rawOption(name) != nullptr; }
    [[nodiscard]] bool hasArgument(std::string_view name) const { return rawArgument(name) != nullptr; }
    [[nodiscard]] bool hasLocalOption(std::string_view name) const;
    [[nodiscard]] bool hasLocalArgument(std::string_view name) const;
    [[nodiscard]] bool hasLocalFlag(std::string_view name) const;
    [[nodiscard]] std::size_t localOptionCount(std::string_view name) const;
    [[nodiscard]] std::size_t localArgumentCount(std::string_view name) const;

    // False when the flag is unknown anywhere in the chain.
    [[nodiscard]] bool flag(std::string_view name) const;

    void setOption(const std::string& name, std::vector<std::string> values);
    void appendOption(const std::string& name, std::vector<std::string> values);
    void setArgument(const std::string& name, std::vector<std::string> values);
    void appendArgument(const std::string& name, std::string value);
    void setFlag(const std::string& name, bool value) { flags_[name] = value; }

    template <typename T>
    T option(std::string_view name) const {
        const auto& raw = requireOption(name);
        return decodeAs<T>(name, raw.front());
    }

    template <typename T>
    std::vector<T> options(std::string_view name) const {
        return decodeAll<T>(name, requireOption(name));
    }

    template <typename T>
    T optionOr(std::string_view name, T fallback) const {
        const auto* raw = rawOption(name);
        if (!raw || raw->empty()) return fallback;
        return decodeAs<T>(name, raw->front());
    }

    template <typename T>
    T argument(std::string_view name) const {
        const auto& raw = requireArgument(name);
        return decodeAs<T>(name, raw.front());
    }

    template <typename T>
    std::vector<T> arguments(std::string_view name) const {
        return decodeAll<T>(name, requireArgument(name));
    }

    template <typename T>
    T argumentOr(std::string_view name, T fallback) const {
        const auto* raw = rawArgument(name);
        if (!raw || raw->empty()) return fallback;
        return decodeAs<T>(name, raw->front());
    }

private:
    // Throw Error{OptionNotFound} / Error{ArgumentNotFound}.
    const std::vector<std::string>& requireOption(std::string_view name) const;
    const std::vector<std::string>& requireArgument(std::string_view name) const;

    template <typename T>
    static T decodeAs(std::string_view name, const std::string& raw) {
        try {
            return Codec<T>::decode(raw);
        } catch (const Error& e) {
            throw Error(e.code(), std::string(name) + ": " + e.what(), std::string(name));
        }
    }

    template <typename T>
    static std::vector<T> decodeAll(std::string_view name, const std::vector<std::string>& raw) {
        std::vector<T> out;
        out.reserve(raw.size());
        for (const auto& r : raw) out.push_back(decodeAs<T>(name, r));
        return out;
    }

    using ValueMap = std::unordered_map<std::string, std::vector<std::string>>;

    static const std::vector<std::string>* findIn(const ValueMap& map, std::string_view name);

    const Command* command_;
    const ResolutionContext* parent_;
    ValueMap options_;
    ValueMap arguments_;
    std::unordered_map<std::string, bool> flags_;
};

} // namespace argtree

#endif // ARGTREE_CONTEXT_HPP
