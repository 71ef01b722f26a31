#ifndef ARGTREE_ARITY_HPP
#define ARGTREE_ARITY_HPP

#include <cstddef>
#include <limits>
#include <string>

#include "error.hpp"

namespace argtree {

// Closed interval [min, max] of values a parameter accepts.
class Arity {
public:
    static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

    Arity(std::size_t min, std::size_t max) : min_(min), max_(max) {
        if (min_ > max_) {
            throw ConfigError("invalid arity: min " + std::to_string(min_) + " is greater than max " +
                              std::to_string(max_));
        }
    }

    static Arity zero() { return {0, 0}; }
    static Arity zeroOrOne() { return {0, 1}; }
    static Arity zeroOrMore() { return {0, kUnbounded}; }
    static Arity exactlyOne() { return {1, 1}; }
    static Arity oneOrMore() { return {1, kUnbounded}; }
    static Arity many() { return {kUnbounded, kUnbounded}; }

    [[nodiscard]] std::size_t min() const { return min_; }
    [[nodiscard]] std::size_t max() const { return max_; }
    [[nodiscard]] bool unbounded() const { return max_ == kUnbounded; }
    [[nodiscard]] bool isSatisfied(std::size_t n) const { return min_ <= n && n <= max_; }

    // "1", "0..1", "1..*"
    [[nodiscard]] std::string str() const {
        const std::string hi = unbounded() ? "*" : std::to_string(max_);
        if (min_ == max_) return hi;
        return std::to_string(min_) + ".." + hi;
    }

    bool operator==(const Arity& o) const { return min_ == o.min_ && max_ == o.max_; }
    bool operator!=(const Arity& o) const { return !(*this == o); }

private:
    std::size_t min_;
    std::size_t max_;
};

} // namespace argtree

#endif // ARGTREE_ARITY_HPP
