#pragma once

#include "json_value.hpp"
#include "limits.hpp"
#include "parse.hpp"
#include "result.hpp"
#include "traits.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reqbind {

// Byte offset of a member inside T.
template <typename T, typename Field> inline std::ptrdiff_t member_offset(Field T::*member) noexcept {
    alignas(T) unsigned char storage[sizeof(T)];
    auto* obj = reinterpret_cast<T*>(storage);
    auto base = reinterpret_cast<std::uintptr_t>(obj);
    auto mem = reinterpret_cast<std::uintptr_t>(&(obj->*member));
    return static_cast<std::ptrdiff_t>(mem - base);
}

// Type-erased access to an optional or unique_ptr holding a sub-record.
struct slot_ops {
    void* (*peek)(void* slot); // nullptr when empty
    void* (*alloc)(void* slot);
};

template <indirect_kind Slot> const slot_ops* slot_ops_for() noexcept {
    static constexpr slot_ops ops{
        [](void* slot) -> void* { return indirect_traits<Slot>::peek(*static_cast<Slot*>(slot)); },
        [](void* slot) -> void* {
            return &indirect_traits<Slot>::alloc(*static_cast<Slot*>(slot));
        },
    };
    return &ops;
}

// One hop from a record to one of its members. A step with a slot passes
// through the optional or unique_ptr stored at `offset`.
struct field_step {
    std::ptrdiff_t offset = 0;
    const slot_ops* slot = nullptr;
};

// Type-erased conversions for one destination cell type.
struct value_ops {
    std::string (*type_name)();
    bool sequence;      // routed to the sequence parser
    bool bulk;          // exposes parse_sequence
    bool custom_scalar; // exposes parse or unmarshal_text
    void (*zero)(void* cell);
    result<void> (*parse_tokens)(std::span<const std::string> tokens, void* cell);
    result<void> (*parse_token)(std::string_view token, void* cell);
    result<void> (*decode_json)(std::string_view raw, void* cell, const decode_limits& limits);
};

template <typename F> const value_ops* value_ops_for() noexcept {
    using inner = unwrap_t<F>;
    static constexpr value_ops ops{
        &type_name<F>,
        sequence_kind<inner>,
        sequence_parser<inner>,
        token_parser<inner> || text_unmarshaler<inner>,
        [](void* cell) { *static_cast<F*>(cell) = F{}; },
        [](std::span<const std::string> tokens, void* cell) {
            return parse_sequence(tokens, *static_cast<F*>(cell));
        },
        [](std::string_view token, void* cell) { return parse_scalar(token, *static_cast<F*>(cell)); },
        [](std::string_view raw, void* cell, const decode_limits& limits) {
            return json::decode_value(raw, *static_cast<F*>(cell), limits);
        },
    };
    return &ops;
}

struct member_decl;
using member_list = std::vector<member_decl>;

// One declared member of a record, in declaration order.
struct member_decl {
    std::string tag;
    bool visible = true;
    std::ptrdiff_t offset = 0;
    const slot_ops* slot = nullptr; // set when the member is an optional or unique_ptr
    const value_ops* ops = nullptr;
    const member_list& (*embedded)() = nullptr; // set when the member holds a record
};

template <record_type T> const member_list& declared_members();

template <typename F> struct member_record {
    static constexpr bool value = false;
};

template <typename F>
    requires record_type<F>
struct member_record<F> {
    static constexpr bool value = true;
    using type = F;
};

template <typename F>
    requires(indirect_kind<F> && record_type<typename indirect_traits<F>::element_type>)
struct member_record<F> {
    static constexpr bool value = true;
    using type = typename indirect_traits<F>::element_type;
};

// Describing a record needs only this header. Decoding one needs decoder.hpp
// (or any header that includes it), which defines the JSON record decoder the
// type-erased tables call.
//
// Collects the members of T. Filled by T::describe (or
// record_traits<T>::describe):
//
//     static void describe(reqbind::schema<user>& s) {
//         s.field(&user::name, "name");
//         s.embed(&user::address);
//     }
template <typename T> class schema {
public:
    // A decodable member. The tag's name part (before any comma) is the
    // external name; "-" excludes the member.
    template <typename Field> schema& field(Field T::*member, std::string_view tag) {
        members_.push_back(make(member, tag));
        return *this;
    }

    // A record member whose fields are promoted into T when the tag has no
    // name. The member may be the record itself, an optional or a unique_ptr.
    template <typename Field> schema& embed(Field T::*member, std::string_view tag = {}) {
        static_assert(member_record<Field>::value, "embed() requires a record member");
        members_.push_back(make(member, tag));
        return *this;
    }

    // A member that is never decoded, whatever its tag says.
    template <typename Field> schema& internal(Field T::*member, std::string_view tag = {}) {
        member_decl decl;
        decl.tag.assign(tag);
        decl.visible = false;
        decl.offset = member_offset(member);
        members_.push_back(std::move(decl));
        return *this;
    }

    [[nodiscard]] member_list take() noexcept { return std::move(members_); }

private:
    template <typename Field>
    static member_decl make(Field T::*member, std::string_view tag) {
        member_decl decl;
        decl.tag.assign(tag);
        decl.offset = member_offset(member);
        decl.ops = value_ops_for<Field>();
        if constexpr (indirect_kind<Field>) {
            decl.slot = slot_ops_for<Field>();
        }
        if constexpr (member_record<Field>::value) {
            decl.embedded = &declared_members<typename member_record<Field>::type>;
        }
        return decl;
    }

    member_list members_;
};

template <record_type T> member_list describe_record() {
    schema<T> s;
    if constexpr (requires { T::describe(s); }) {
        T::describe(s);
    } else {
        record_traits<T>::describe(s);
    }
    return s.take();
}

// Built once per type on first use.
template <record_type T> const member_list& declared_members() {
    static const member_list members = describe_record<T>();
    return members;
}

} // namespace reqbind
