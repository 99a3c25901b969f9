#pragma once

#include "wirepack/error.hpp"
#include "wirepack/security_limits.hpp"
#include "wirepack/types.hpp"

#include <concepts>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace wirepack::detail {

// Defined in codec.hpp; declared here so nested-record accessors can recurse.
template <typename R>
MarshalResult<void> pack_fields(const R& record, std::vector<uint8_t>& out);

template <typename R>
MarshalResult<std::size_t> unpack_fields(R& record, std::span<const uint8_t> input,
                                         std::size_t nesting_depth, const SecurityLimits& limits);

template <typename T>
concept IntegerMember = std::integral<T> || std::is_enum_v<T>;

template <typename T>
concept ByteStringMember = std::same_as<T, std::string> || std::same_as<T, std::vector<uint8_t>>;

template <IntegerMember T>
constexpr IntegerValue to_integer_value(T value) noexcept {
    if constexpr (std::is_enum_v<T>) {
        return to_integer_value(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (std::same_as<T, bool>) {
        return IntegerValue{value ? 1u : 0u, false};
    } else if constexpr (std::is_signed_v<T>) {
        return IntegerValue{static_cast<uint64_t>(static_cast<int64_t>(value)), true};
    } else {
        return IntegerValue{static_cast<uint64_t>(value), false};
    }
}

// Number of value bits a member can hold; bool holds one
template <IntegerMember T>
constexpr unsigned member_bits() noexcept {
    if constexpr (std::is_enum_v<T>) {
        return member_bits<std::underlying_type_t<T>>();
    } else if constexpr (std::same_as<T, bool>) {
        return 1;
    } else {
        return sizeof(T) * 8;
    }
}

// Replicate bit (bits - 1) into every higher bit
constexpr uint64_t sign_extend(uint64_t raw, unsigned bits) noexcept {
    if (bits == 0 || bits >= 64) {
        return raw;
    }
    const uint64_t sign_bit = uint64_t{1} << (bits - 1);
    if (raw & sign_bit) {
        return raw | ~((sign_bit << 1) - 1);
    }
    return raw;
}

// Convert a `bits`-wide wire value to T; signed members are sign-extended
template <IntegerMember T>
constexpr T from_raw(uint64_t raw, unsigned bits) noexcept {
    if constexpr (std::is_enum_v<T>) {
        return static_cast<T>(from_raw<std::underlying_type_t<T>>(raw, bits));
    } else if constexpr (std::same_as<T, bool>) {
        return raw != 0;
    } else if constexpr (std::is_signed_v<T>) {
        return static_cast<T>(static_cast<int64_t>(sign_extend(raw, bits)));
    } else {
        return static_cast<T>(raw);
    }
}

/**
 * Type-erased accessors for one record member.
 *
 * Only the accessors matching `category` are populated.
 */
template <typename R>
struct FieldAccess {
    ValueCategory category{ValueCategory::integer};

    std::function<IntegerValue(const R&)> read_integer{};
    std::function<void(R&, uint64_t, unsigned)> write_integer{};

    std::function<std::string_view(const R&)> read_bytes{};
    std::function<void(R&, std::span<const uint8_t>)> write_bytes{};

    std::function<MarshalResult<void>(const R&, std::vector<uint8_t>&)> pack_record{};
    std::function<MarshalResult<std::size_t>(R&, std::span<const uint8_t>, std::size_t,
                                             const SecurityLimits&)>
        unpack_record{};
};

template <typename R, IntegerMember M>
FieldAccess<R> make_integer_access(M R::*member) {
    FieldAccess<R> access;
    access.category = ValueCategory::integer;
    access.read_integer = [member](const R& record) { return to_integer_value(record.*member); };
    access.write_integer = [member](R& record, uint64_t raw, unsigned bits) {
        record.*member = from_raw<M>(raw, bits);
    };
    return access;
}

template <typename R, ByteStringMember M>
FieldAccess<R> make_bytes_access(M R::*member) {
    FieldAccess<R> access;
    access.category = ValueCategory::bytes;
    access.read_bytes = [member](const R& record) {
        const M& value = record.*member;
        return std::string_view(reinterpret_cast<const char*>(value.data()), value.size());
    };
    access.write_bytes = [member](R& record, std::span<const uint8_t> bytes) {
        (record.*member).assign(bytes.begin(), bytes.end());
    };
    return access;
}

template <typename R, typename M>
FieldAccess<R> make_record_access(M R::*member) {
    FieldAccess<R> access;
    access.category = ValueCategory::record;
    access.pack_record = [member](const R& record, std::vector<uint8_t>& out) {
        return pack_fields<M>(record.*member, out);
    };
    access.unpack_record = [member](R& record, std::span<const uint8_t> input,
                                    std::size_t nesting_depth, const SecurityLimits& limits) {
        return unpack_fields<M>(record.*member, input, nesting_depth, limits);
    };
    return access;
}

} // namespace wirepack::detail
