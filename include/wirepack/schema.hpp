#pragma once

#include "wirepack/condition.hpp"
#include "wirepack/constraint.hpp"
#include "wirepack/detail/field_access.hpp"
#include "wirepack/layout.hpp"
#include "wirepack/types.hpp"

#include <algorithm>
#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace wirepack {

template <typename R>
class Schema;

/**
 * A record type: default constructible, copyable, and exposing its wire layout
 * through `static const Schema<T>& schema()`.
 */
template <typename T>
concept Record = std::default_initializable<T> && std::copy_constructible<T> && requires {
    { T::schema() } -> std::same_as<const Schema<T>&>;
};

/**
 * Layout, guard, constraints and accessors of one declared field.
 */
template <typename R>
struct FieldDescriptor {
    std::string name;
    FieldLayout layout{};
    std::optional<Condition> condition{};
    std::vector<Constraint> constraints{};
    detail::FieldAccess<R> access{};
};

/**
 * Ordered field table of a record type.
 *
 * Declaration order is wire order and is never rearranged. A schema is
 * immutable once built and is usually held in a function-local static.
 */
template <typename R>
class Schema {
public:
    explicit Schema(std::vector<FieldDescriptor<R>> fields) : fields_(std::move(fields)) {}

    [[nodiscard]] const std::vector<FieldDescriptor<R>>& fields() const noexcept {
        return fields_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const noexcept {
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i].name == name) {
                return i;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] const FieldDescriptor<R>* find(std::string_view name) const noexcept {
        auto index = index_of(name);
        return index ? &fields_[*index] : nullptr;
    }

private:
    std::vector<FieldDescriptor<R>> fields_;
};

/**
 * Fluent builder for a Schema.
 *
 * field() appends a field; when() and validate() decorate the most recently
 * appended one. Builder misuse throws std::invalid_argument while the schema is
 * being built. A field declared without a layout is accepted here and reported
 * as ErrorCode::missing_layout when the record is packed or unpacked.
 *
 * Example:
 * @code
 *   struct Message {
 *       uint8_t type{};
 *       uint16_t extension{};
 *       std::string payload;
 *
 *       static const wirepack::Schema<Message>& schema() {
 *           static const auto instance = wirepack::SchemaBuilder<Message>()
 *               .field("type", &Message::type, wirepack::integer(8))
 *               .validate(wirepack::Constraint::max(3))
 *               .field("extension", &Message::extension, "v")
 *               .when("type", wirepack::CompareOp::eq, 1)
 *               .field("payload", &Message::payload, wirepack::variable_bytes())
 *               .build();
 *           return instance;
 *       }
 *   };
 * @endcode
 */
template <typename R>
class SchemaBuilder {
public:
    template <typename M>
    SchemaBuilder& field(std::string name, M R::*member, FieldLayout layout) {
        check_name(name);
        auto access = make_access(member);
        if (!compatible(layout, access.category)) {
            throw std::invalid_argument("layout " + layout_code(layout) + " of field '" + name +
                                        "' does not fit a " +
                                        value_category_string(access.category) + " member");
        }
        if constexpr (detail::IntegerMember<M>) {
            if (!holds_width(layout, detail::member_bits<M>())) {
                throw std::invalid_argument("layout " + layout_code(layout) + " of field '" +
                                            name + "' is wider than its " +
                                            std::to_string(detail::member_bits<M>()) +
                                            "-bit member");
            }
        }
        fields_.push_back(FieldDescriptor<R>{.name = std::move(name),
                                             .layout = layout,
                                             .access = std::move(access)});
        return *this;
    }

    /// Field declared by width token ("16", "n", "A6", "A*", ...)
    template <typename M>
    SchemaBuilder& field(std::string name, M R::*member, std::string_view token,
                         Endian endian = Endian::big) {
        return field(std::move(name), member, parse_layout_token(token, endian));
    }

    /// Field declared without a layout
    template <typename M>
    SchemaBuilder& field(std::string name, M R::*member) {
        return field(std::move(name), member, FieldLayout{});
    }

    /**
     * Guard the most recent field. The guarded-on field must be an integer field
     * declared earlier.
     */
    SchemaBuilder& when(std::string field_name, CompareOp op, int64_t value) {
        auto& target = last("when");
        if (target.condition) {
            throw std::invalid_argument("field '" + target.name + "' already has a condition");
        }
        auto index = index_of(field_name);
        if (!index || *index + 1 == fields_.size()) {
            throw std::invalid_argument("condition of field '" + target.name +
                                        "' must name an earlier field, got '" + field_name + "'");
        }
        if (fields_[*index].access.category != ValueCategory::integer) {
            throw std::invalid_argument("condition of field '" + target.name +
                                        "' must name an integer field");
        }
        target.condition = Condition{std::move(field_name), op, value};
        return *this;
    }

    /// Attach a constraint to the most recent field (repeatable)
    SchemaBuilder& validate(Constraint constraint) {
        auto& target = last("validate");
        if (!constraint.applies_to(target.access.category)) {
            throw std::invalid_argument(std::string("constraint ") + constraint.to_string() +
                                        " does not apply to field '" + target.name + "'");
        }
        target.constraints.push_back(std::move(constraint));
        return *this;
    }

    [[nodiscard]] Schema<R> build() { return Schema<R>(std::move(fields_)); }

private:
    template <typename M>
    static detail::FieldAccess<R> make_access(M R::*member) {
        if constexpr (detail::IntegerMember<M>) {
            return detail::make_integer_access(member);
        } else if constexpr (detail::ByteStringMember<M>) {
            return detail::make_bytes_access(member);
        } else {
            static_assert(Record<M>, "member must be an integer, enum, std::string, "
                                     "std::vector<uint8_t>, or a type with its own schema");
            return detail::make_record_access(member);
        }
    }

    static bool compatible(const FieldLayout& layout, ValueCategory category) noexcept {
        return std::visit(
            [category](const auto& kind) {
                using K = std::decay_t<decltype(kind)>;
                if constexpr (std::is_same_v<K, FixedWidthInteger> || std::is_same_v<K, BitField>) {
                    return category == ValueCategory::integer;
                } else if constexpr (std::is_same_v<K, FixedLengthBytes> ||
                                     std::is_same_v<K, VariableLengthBytes>) {
                    return category == ValueCategory::bytes;
                } else if constexpr (std::is_same_v<K, NestedRecord>) {
                    return category == ValueCategory::record;
                } else {
                    return true;
                }
            },
            layout.kind);
    }

    // Widths above 64 bits are left for pack/unpack to report as unsupported
    static bool holds_width(const FieldLayout& layout, unsigned member_bits) noexcept {
        if (const auto* fixed = std::get_if<FixedWidthInteger>(&layout.kind)) {
            return fixed->bits > 64 || fixed->bits <= member_bits;
        }
        if (const auto* bit_field = std::get_if<BitField>(&layout.kind)) {
            return bit_field->bits > 64 || bit_field->bits <= member_bits;
        }
        return true;
    }

    void check_name(const std::string& name) const {
        if (name.empty()) {
            throw std::invalid_argument("field name must not be empty");
        }
        if (index_of(name)) {
            throw std::invalid_argument("duplicate field name '" + name + "'");
        }
    }

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const noexcept {
        auto it = std::find_if(fields_.begin(), fields_.end(),
                               [name](const FieldDescriptor<R>& f) { return f.name == name; });
        if (it == fields_.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - fields_.begin());
    }

    FieldDescriptor<R>& last(const char* operation) {
        if (fields_.empty()) {
            throw std::invalid_argument(std::string(operation) + "() called before any field()");
        }
        return fields_.back();
    }

    std::vector<FieldDescriptor<R>> fields_;
};

} // namespace wirepack
