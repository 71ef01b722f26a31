#include "argtree/context.hpp"

#include <iterator>

namespace argtree {

const std::vector<std::string>* ResolutionContext::findIn(const ValueMap& map, std::string_view name) {
    const auto it = map.find(std::string(name));
    if (it == map.end()) return nullptr;
    return &it->second;
}

const std::vector<std::string>* ResolutionContext::rawOption(std::string_view name) const {
    for (const auto* ctx = this; ctx; ctx = ctx->parent_) {
        if (const auto* v = findIn(ctx->options_, name)) return v;
    }
    return nullptr;
}

const std::vector<std::string>* ResolutionContext::rawArgument(std::string_view name) const {
    for (const auto* ctx = this; ctx; ctx = ctx->parent_) {
        if (const auto* v = findIn(ctx->arguments_, name)) return v;
    }
    return nullptr;
}

bool ResolutionContext::hasLocalOption(std::string_view name) const { return findIn(options_, name) != nullptr; }

bool ResolutionContext::hasLocalArgument(std::string_view name) const {
    return findIn(arguments_, name) != nullptr;
}

bool ResolutionContext::hasLocalFlag(std::string_view name) const {
    return flags_.find(std::string(name)) != flags_.end();
}

std::size_t ResolutionContext::localOptionCount(std::string_view name) const {
    const auto* v = findIn(options_, name);
    return v ? v->size() : 0;
}

std::size_t ResolutionContext::localArgumentCount(std::string_view name) const {
    const auto* v = findIn(arguments_, name);
    return v ? v->size() : 0;
}

bool ResolutionContext::flag(std::string_view name) const {
    const std::string key(name);
    for (const auto* ctx = this; ctx; ctx = ctx->parent_) {
        const auto it = ctx->flags_.find(key);
        if (it != ctx->flags_.end()) return it->second;
    }
    return false;
}

void ResolutionContext::setOption(const std::string& name, std::vector<std::string> values) {
    options_[name] = std::move(values);
}

void ResolutionContext::appendOption(const std::string& name, std::vector<std::string> values) {
    auto& slot = options_[name];
    slot.insert(slot.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
}

void ResolutionContext::setArgument(const std::string& name, std::vector<std::string> values) {
    arguments_[name] = std::move(values);
}

void ResolutionContext::appendArgument(const std::string& name, std::string value) {
    arguments_[name].push_back(std::move(value));
}

const std::vector<std::string>& ResolutionContext::requireOption(std::string_view name) const {
    const auto* raw = rawOption(name);
    if (!raw || raw->empty()) {
        throw Error(ErrorCode::OptionNotFound, "option \"" + std::string(name) + "\" has no value",
                    std::string(name));
    }
    return *raw;
}

const std::vector<std::string>& ResolutionContext::requireArgument(std::string_view name) const {
    const auto* raw = rawArgument(name);
    if (!raw || raw->empty()) {
        throw Error(ErrorCode::ArgumentNotFound, "argument \"" + std::string(name) + "\" has no value",
                    std::string(name));
    }
    return *raw;
}

} // namespace argtree
