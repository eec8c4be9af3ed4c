#pragma once

#include "result.hpp"

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace reqbind {

using bytes = std::vector<std::byte>;

template <typename T> class schema;

// Specialize to describe a record type that cannot carry a static
// `describe(schema<T>&)` member.
template <typename T> struct record_traits {};

template <typename T>
concept record_type = requires(schema<T>& s) { T::describe(s); } ||
                      requires(schema<T>& s) { record_traits<T>::describe(s); };

// Opt-in conversion capabilities, recognized by shape.
template <typename T>
concept token_parser = requires(T& v, std::string_view src) {
    { v.parse(src) } -> std::same_as<result<void>>;
};

template <typename T>
concept text_unmarshaler = requires(T& v, std::string_view src) {
    { v.unmarshal_text(src) } -> std::same_as<result<void>>;
};

template <typename T>
concept sequence_parser = requires(T& v, std::span<const std::string> src) {
    { v.parse_sequence(src) } -> std::same_as<result<void>>;
};

template <typename T>
concept json_unmarshaler = requires(T& v, std::string_view raw) {
    { v.unmarshal_json(raw) } -> std::same_as<result<void>>;
};

template <typename T>
concept integer_kind = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char> &&
                       !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> &&
                       !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

template <typename T>
concept float_kind = std::same_as<T, float> || std::same_as<T, double>;

template <typename T>
concept text_kind = std::same_as<T, std::string>;

template <typename T>
concept bytes_kind = std::same_as<T, bytes>;

// Slots that may hold nothing: the engine reads through them without
// allocating and allocates only to write.
template <typename T> struct indirect_traits {
    static constexpr bool value = false;
};

template <typename U> struct indirect_traits<std::optional<U>> {
    static constexpr bool value = true;
    using element_type = U;

    static U* peek(std::optional<U>& slot) noexcept { return slot ? &*slot : nullptr; }
    static U& alloc(std::optional<U>& slot) {
        if (!slot) {
            slot.emplace();
        }
        return *slot;
    }
    static void reset(std::optional<U>& slot) noexcept { slot.reset(); }
};

template <typename U> struct indirect_traits<std::unique_ptr<U>> {
    static constexpr bool value = true;
    using element_type = U;

    static U* peek(std::unique_ptr<U>& slot) noexcept { return slot.get(); }
    static U& alloc(std::unique_ptr<U>& slot) {
        if (!slot) {
            slot = std::make_unique<U>();
        }
        return *slot;
    }
    static void reset(std::unique_ptr<U>& slot) noexcept { slot.reset(); }
};

template <typename T>
concept indirect_kind = indirect_traits<T>::value;

template <typename T> struct sequence_traits {
    static constexpr bool value = false;
};

template <typename E, typename A> struct sequence_traits<std::vector<E, A>> {
    static constexpr bool value = !std::same_as<std::vector<E, A>, bytes>;
    using element_type = E;
};

template <typename T>
concept sequence_kind = sequence_traits<T>::value;

// Strips optional / unique_ptr layers.
template <typename T> struct unwrap {
    using type = T;
};

template <indirect_kind T> struct unwrap<T> {
    using type = typename unwrap<typename indirect_traits<T>::element_type>::type;
};

template <typename T> using unwrap_t = typename unwrap<T>::type;

template <typename T>
concept has_type_name = requires {
    { T::type_name } -> std::convertible_to<std::string_view>;
};

// Name used in conversion errors.
template <typename T> std::string type_name() {
    if constexpr (has_type_name<T>) {
        return std::string(std::string_view(T::type_name));
    } else if constexpr (std::same_as<T, bool>) {
        return "bool";
    } else if constexpr (integer_kind<T>) {
        return std::string(std::is_signed_v<T> ? "int" : "uint") + std::to_string(sizeof(T) * 8);
    } else if constexpr (float_kind<T>) {
        return "float" + std::to_string(sizeof(T) * 8);
    } else if constexpr (text_kind<T>) {
        return "string";
    } else if constexpr (bytes_kind<T>) {
        return "bytes";
    } else if constexpr (indirect_kind<T>) {
        return "*" + type_name<typename indirect_traits<T>::element_type>();
    } else if constexpr (sequence_kind<T>) {
        return "[]" + type_name<typename sequence_traits<T>::element_type>();
    } else {
        return typeid(T).name();
    }
}

} // namespace reqbind
