#pragma once

#include "wirepack/types.hpp"

#include <string>

#include <cstdint>

namespace wirepack {

/**
 * Guard deciding whether a field is present on the wire.
 *
 * Evaluated before the guarded field is processed, against the fields already
 * packed or decoded in this call. A guard naming a field that was skipped or not
 * yet processed is false, and a false guard makes the field contribute zero
 * bytes. Pack and unpack therefore take the same decision for the same record.
 *
 * Example:
 * @code
 *   builder.field("type", &Message::type, wirepack::integer(8))
 *          .field("extension", &Message::extension, wirepack::integer(16))
 *          .when("type", wirepack::CompareOp::eq, 1);
 * @endcode
 */
struct Condition {
    std::string field;
    CompareOp op{CompareOp::eq};
    int64_t value{0};

    [[nodiscard]] constexpr bool holds(IntegerValue current) const noexcept {
        const auto order = current.compare(value);
        switch (op) {
            case CompareOp::eq:
                return order == 0;
            case CompareOp::ne:
                return order != 0;
            case CompareOp::lt:
                return order < 0;
            case CompareOp::gt:
                return order > 0;
            case CompareOp::le:
                return order <= 0;
            case CompareOp::ge:
                return order >= 0;
        }
        return false;
    }

    [[nodiscard]] std::string to_string() const {
        return "if " + field + " " + compare_op_string(op) + " " + std::to_string(value);
    }
};

} // namespace wirepack
