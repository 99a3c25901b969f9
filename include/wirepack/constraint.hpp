#pragma once

#include "wirepack/types.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstdint>

namespace wirepack {

/**
 * Post-unpack validation constraint.
 *
 * Constraints are checked after a field's value has been assigned during
 * unpack; the first violation aborts the whole unpack with
 * ErrorCode::validation_failed. They are never checked on pack, and values are
 * never clamped.
 *
 * min, max, in and not_in apply to integer fields (bit-fields included);
 * pattern applies to byte-string fields and uses std::regex_search semantics.
 *
 * Example:
 * @code
 *   builder.field("version", &Header::version, wirepack::integer(8))
 *          .validate(wirepack::Constraint::in({4, 6}))
 *          .validate(wirepack::Constraint::min(4).with_message("IPv4 or later only"));
 * @endcode
 */
class Constraint {
public:
    static Constraint min(int64_t bound) { return Constraint(ConstraintKind::min, bound); }

    static Constraint max(int64_t bound) { return Constraint(ConstraintKind::max, bound); }

    static Constraint in(std::initializer_list<int64_t> allowed) {
        Constraint constraint(ConstraintKind::in, 0);
        constraint.set_.assign(allowed);
        return constraint;
    }

    static Constraint not_in(std::initializer_list<int64_t> disallowed) {
        Constraint constraint(ConstraintKind::not_in, 0);
        constraint.set_.assign(disallowed);
        return constraint;
    }

    /**
     * @throws std::regex_error if the expression is malformed
     */
    static Constraint pattern(std::string expression) {
        Constraint constraint(ConstraintKind::pattern, 0);
        constraint.regex_ = std::regex(expression);
        constraint.expression_ = std::move(expression);
        return constraint;
    }

    /// Replace the generated violation text with a fixed message
    Constraint with_message(std::string message) && {
        message_ = std::move(message);
        return std::move(*this);
    }

    [[nodiscard]] ConstraintKind kind() const noexcept { return kind_; }

    [[nodiscard]] bool applies_to(ValueCategory category) const noexcept {
        if (kind_ == ConstraintKind::pattern) {
            return category == ValueCategory::bytes;
        }
        return category == ValueCategory::integer;
    }

    [[nodiscard]] const std::optional<std::string>& message() const noexcept { return message_; }

    /**
     * Check an integer value.
     * @return Description of the violation, or std::nullopt if the value passes
     */
    [[nodiscard]] std::optional<std::string> violation(IntegerValue value) const {
        switch (kind_) {
            case ConstraintKind::min:
                if (value.compare(bound_) < 0) {
                    return "Value " + value.to_string() + " is less than minimum " +
                           std::to_string(bound_);
                }
                break;
            case ConstraintKind::max:
                if (value.compare(bound_) > 0) {
                    return "Value " + value.to_string() + " is greater than maximum " +
                           std::to_string(bound_);
                }
                break;
            case ConstraintKind::in:
                if (!contains(value)) {
                    return "Value " + value.to_string() + " is not in allowed set";
                }
                break;
            case ConstraintKind::not_in:
                if (contains(value)) {
                    return "Value " + value.to_string() + " is in disallowed set";
                }
                break;
            case ConstraintKind::pattern:
                break;
        }
        return std::nullopt;
    }

    /**
     * Check a byte-string value.
     * @return Description of the violation, or std::nullopt if the value passes
     */
    [[nodiscard]] std::optional<std::string> violation(std::string_view bytes) const {
        if (kind_ == ConstraintKind::pattern &&
            !std::regex_search(bytes.begin(), bytes.end(), regex_)) {
            return "Value '" + std::string(bytes) + "' does not match pattern '" + expression_ +
                   "'";
        }
        return std::nullopt;
    }

    /// Short form used in diagnostics, e.g. "min=10" or "in={1,2,3}"
    [[nodiscard]] std::string to_string() const {
        switch (kind_) {
            case ConstraintKind::min:
                return "min=" + std::to_string(bound_);
            case ConstraintKind::max:
                return "max=" + std::to_string(bound_);
            case ConstraintKind::in:
            case ConstraintKind::not_in: {
                std::string text = kind_ == ConstraintKind::in ? "in={" : "not_in={";
                for (std::size_t i = 0; i < set_.size(); ++i) {
                    text += (i > 0 ? "," : "") + std::to_string(set_[i]);
                }
                return text + "}";
            }
            case ConstraintKind::pattern:
                return "pattern=" + expression_;
        }
        return "unknown";
    }

private:
    Constraint(ConstraintKind kind, int64_t bound) : kind_(kind), bound_(bound) {}

    [[nodiscard]] bool contains(IntegerValue value) const noexcept {
        return std::any_of(set_.begin(), set_.end(),
                           [&](int64_t candidate) { return value.compare(candidate) == 0; });
    }

    ConstraintKind kind_;
    int64_t bound_{0};
    std::vector<int64_t> set_{};
    std::string expression_{};
    std::regex regex_{};
    std::optional<std::string> message_{};
};

} // namespace wirepack
