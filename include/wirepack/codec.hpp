#pragma once

#include "wirepack/detail/bitfield.hpp"
#include "wirepack/detail/buffer_io.hpp"
#include "wirepack/error.hpp"
#include "wirepack/expected.hpp"
#include "wirepack/layout.hpp"
#include "wirepack/schema.hpp"
#include "wirepack/security_limits.hpp"

#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace wirepack {

namespace detail {

// Whether value survives encoding in `bits` bits (1..64). Values of signed
// members must lie in the two's complement range of `bits`, since unpack
// sign-extends them.
constexpr bool fits_width(IntegerValue value, unsigned bits) noexcept {
    if (bits >= 64) {
        return true;
    }
    if (value.is_signed) {
        const auto signed_value = static_cast<int64_t>(value.raw);
        const int64_t lowest = -(int64_t{1} << (bits - 1));
        const int64_t highest = (int64_t{1} << (bits - 1)) - 1;
        return signed_value >= lowest && signed_value <= highest;
    }
    return value.raw <= calculate_mask(bits);
}

inline void warn_truncation([[maybe_unused]] const std::string& field,
                            [[maybe_unused]] IntegerValue value, [[maybe_unused]] unsigned bits) {
#ifndef NDEBUG
    std::fprintf(stderr,
                 "WARNING: value %s of field '%s' exceeds %u-bit width. "
                 "Value will be truncated to %llu.\n",
                 value.to_string().c_str(), field.c_str(), bits,
                 static_cast<unsigned long long>(value.raw & calculate_mask(bits)));
#endif
}

// Errors raised below field level carry no field name; attribute them here.
inline MarshalError with_field(MarshalError error, const std::string& name) {
    if (error.field.empty()) {
        error.field = name;
    }
    return error;
}

// A guarded field is present only if its guard names a field processed earlier
// in this call and the comparison holds.
template <typename R>
bool is_present(const Schema<R>& schema, const FieldDescriptor<R>& field, const R& record,
                const std::vector<bool>& processed) {
    if (!field.condition) {
        return true;
    }
    const auto index = schema.index_of(field.condition->field);
    if (!index || !processed[*index]) {
        return false;
    }
    const auto& guard = schema.fields()[*index];
    if (guard.access.category != ValueCategory::integer) {
        return false;
    }
    return field.condition->holds(guard.access.read_integer(record));
}

template <typename R>
MarshalResult<void> check_constraints(const FieldDescriptor<R>& field, const R& record) {
    for (const auto& constraint : field.constraints) {
        std::optional<std::string> violation;
        if (field.access.category == ValueCategory::integer) {
            violation = constraint.violation(field.access.read_integer(record));
        } else if (field.access.category == ValueCategory::bytes) {
            violation = constraint.violation(field.access.read_bytes(record));
        }
        if (!violation) {
            continue;
        }

        MarshalError error{.code = ErrorCode::validation_failed,
                           .field = field.name,
                           .constraint = constraint.kind()};
        if (constraint.message()) {
            error.detail = *constraint.message();
            error.custom_message = true;
        } else {
            error.detail = std::move(*violation);
        }
        return unexpected(std::move(error));
    }
    return {};
}

// Encode one non-bit-field field
template <typename R>
MarshalResult<void> pack_field(const FieldDescriptor<R>& field, const R& record,
                               std::vector<uint8_t>& out) {
    const auto& layout = field.layout;
    return std::visit(
        [&](const auto& kind) -> MarshalResult<void> {
            using K = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<K, NoLayout>) {
                return make_marshal_error(ErrorCode::missing_layout, field.name);
            } else if constexpr (std::is_same_v<K, FixedWidthInteger>) {
                auto encoding = encoding_of(kind, layout.endian);
                if (!encoding) {
                    return make_marshal_error(ErrorCode::unsupported_width, field.name, kind.bits);
                }
                const auto value = field.access.read_integer(record);
                if (!fits_width(value, kind.bits)) {
                    warn_truncation(field.name, value, kind.bits);
                }
                append_integer(out, value.raw, encoding->width, layout.endian);
                return {};
            } else if constexpr (std::is_same_v<K, FixedLengthBytes>) {
                const auto bytes = field.access.read_bytes(record);
                if (bytes.size() != kind.length) {
                    return make_marshal_error(ErrorCode::length_mismatch, field.name,
                                              bytes.size(), kind.length);
                }
                out.insert(out.end(), bytes.begin(), bytes.end());
                return {};
            } else if constexpr (std::is_same_v<K, VariableLengthBytes>) {
                const auto bytes = field.access.read_bytes(record);
                out.insert(out.end(), bytes.begin(), bytes.end());
                return {};
            } else if constexpr (std::is_same_v<K, NestedRecord>) {
                auto status = field.access.pack_record(record, out);
                if (!status) {
                    return unexpected(with_field(status.error(), field.name));
                }
                return {};
            } else {
                // Bit-fields are grouped by pack_fields()
                return {};
            }
        },
        layout.kind);
}

// Decode one non-bit-field field starting at offset; offset is advanced past it
template <typename R>
MarshalResult<void> unpack_field(const FieldDescriptor<R>& field, R& record,
                                 std::span<const uint8_t> input, std::size_t& offset,
                                 std::size_t nesting_depth, const SecurityLimits& limits) {
    const auto& layout = field.layout;
    return std::visit(
        [&](const auto& kind) -> MarshalResult<void> {
            using K = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<K, NoLayout>) {
                return make_marshal_error(ErrorCode::missing_layout, field.name);
            } else if constexpr (std::is_same_v<K, FixedWidthInteger>) {
                auto encoding = encoding_of(kind, layout.endian);
                if (!encoding) {
                    return make_marshal_error(ErrorCode::unsupported_width, field.name, kind.bits);
                }
                if (offset + encoding->width > input.size()) {
                    return make_marshal_error(ErrorCode::buffer_overflow, field.name,
                                              offset + encoding->width, input.size());
                }
                field.access.write_integer(
                    record, read_integer(input.data() + offset, encoding->width, layout.endian),
                    kind.bits);
                offset += encoding->width;
                return {};
            } else if constexpr (std::is_same_v<K, FixedLengthBytes>) {
                if (offset + kind.length > input.size()) {
                    return make_marshal_error(ErrorCode::buffer_overflow, field.name,
                                              offset + kind.length, input.size());
                }
                field.access.write_bytes(record, input.subspan(offset, kind.length));
                offset += kind.length;
                return {};
            } else if constexpr (std::is_same_v<K, VariableLengthBytes>) {
                field.access.write_bytes(record, input.subspan(offset));
                offset = input.size();
                return {};
            } else if constexpr (std::is_same_v<K, NestedRecord>) {
                auto consumed = field.access.unpack_record(record, input.subspan(offset),
                                                           nesting_depth + 1, limits);
                if (!consumed) {
                    return unexpected(with_field(consumed.error(), field.name));
                }
                offset += *consumed;
                return {};
            } else {
                // Bit-fields are grouped by unpack_fields()
                return {};
            }
        },
        layout.kind);
}

/**
 * Append the wire form of record to out.
 *
 * Consecutive present bit-fields share one group; the group is flushed when
 * the next present non-bit-field field is reached and after the last field.
 */
template <typename R>
MarshalResult<void> pack_fields(const R& record, std::vector<uint8_t>& out) {
    const auto& schema = R::schema();
    const auto& fields = schema.fields();
    std::vector<bool> processed(fields.size(), false);
    BitFieldPacker group;

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        if (!is_present(schema, field, record, processed)) {
            continue;
        }

        if (const auto* bit_field = std::get_if<BitField>(&field.layout.kind)) {
            const auto value = field.access.read_integer(record);
            if (is_supported(*bit_field) && !fits_width(value, bit_field->bits)) {
                warn_truncation(field.name, value, bit_field->bits);
            }
            if (auto added = group.add(*bit_field, value.raw); !added) {
                return unexpected(with_field(added.error(), field.name));
            }
        } else {
            group.flush(out);
            if (auto status = pack_field(field, record, out); !status) {
                return status;
            }
        }
        processed[i] = true;
    }

    group.flush(out);
    return {};
}

/**
 * Populate record from input.
 *
 * Both security gates run before any field is read. Trailing bytes after the
 * last field are left unread.
 *
 * @return Number of input bytes consumed
 */
template <typename R>
MarshalResult<std::size_t> unpack_fields(R& record, std::span<const uint8_t> input,
                                         std::size_t nesting_depth, const SecurityLimits& limits) {
    if (input.size() > limits.max_buffer_size()) {
        return make_marshal_error(ErrorCode::buffer_overflow, {}, input.size(),
                                  limits.max_buffer_size());
    }
    if (nesting_depth > limits.max_nesting_depth()) {
        return make_marshal_error(ErrorCode::nesting_depth_exceeded, {}, nesting_depth,
                                  limits.max_nesting_depth());
    }

    const auto& schema = R::schema();
    const auto& fields = schema.fields();
    std::vector<bool> processed(fields.size(), false);
    BitFieldUnpacker group;
    std::size_t offset = 0;

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        if (!is_present(schema, field, record, processed)) {
            continue;
        }

        if (const auto* bit_field = std::get_if<BitField>(&field.layout.kind)) {
            auto value = group.extract(*bit_field, input, offset);
            if (!value) {
                return unexpected(with_field(value.error(), field.name));
            }
            field.access.write_integer(record, *value, bit_field->bits);
        } else {
            group.reset();
            auto status = unpack_field(field, record, input, offset, nesting_depth, limits);
            if (!status) {
                return unexpected(status.error());
            }
        }
        processed[i] = true;

        if (auto valid = check_constraints(field, record); !valid) {
            return unexpected(valid.error());
        }
    }

    return offset;
}

} // namespace detail

/**
 * @brief Serialize a record to its wire form
 *
 * Fields are emitted in declaration order. Fields whose guard is false are
 * skipped. The record is not modified.
 *
 * @return Packed bytes, or the first error encountered
 */
template <Record R>
[[nodiscard]] MarshalResult<std::vector<uint8_t>> pack(const R& record) {
    std::vector<uint8_t> out;
    if (auto status = detail::pack_fields(record, out); !status) {
        return unexpected(status.error());
    }
    return out;
}

/**
 * @brief Deserialize a record from a byte buffer
 *
 * Rejects buffers larger than limits.max_buffer_size() and calls whose
 * nesting_depth exceeds limits.max_nesting_depth() before reading anything.
 * Fields skipped by their guard keep their default value.
 *
 * @param bytes Input buffer (untrusted)
 * @param limits Security limits applied to this call and every nested record
 * @param nesting_depth Depth of this record; 0 for a top-level call
 * @return Populated record, or the first error encountered
 */
template <Record R>
[[nodiscard]] MarshalResult<R> unpack(std::span<const uint8_t> bytes,
                                      const SecurityLimits& limits = {},
                                      std::size_t nesting_depth = 0) {
    R record{};
    auto consumed = detail::unpack_fields(record, bytes, nesting_depth, limits);
    if (!consumed) {
        return unexpected(consumed.error());
    }
    return record;
}

/**
 * @brief Number of bytes pack() would produce for record
 */
template <Record R>
[[nodiscard]] MarshalResult<std::size_t> packed_size(const R& record) {
    auto packed = pack(record);
    if (!packed) {
        return unexpected(packed.error());
    }
    return packed->size();
}

} // namespace wirepack
