#include "reqbind/core/decoder.hpp"
#include "reqbind/core/parse.hpp"

#include <unordered_map>

namespace reqbind::detail {

namespace {

void* step_into(void* base, const field_step& step) noexcept {
    return static_cast<char*>(base) + step.offset;
}

} // namespace

void* peek_at(void* root, std::span<const field_step> path) noexcept {
    void* cur = root;
    for (const auto& step : path) {
        cur = step_into(cur, step);
        if (step.slot) {
            cur = step.slot->peek(cur);
            if (!cur) {
                return nullptr;
            }
        }
    }
    return cur;
}

void* alloc_at(void* root, std::span<const field_step> path) {
    void* cur = root;
    for (const auto& step : path) {
        cur = step_into(cur, step);
        if (step.slot) {
            cur = step.slot->alloc(cur);
        }
    }
    return cur;
}

void zero_at(void* root, const resolved_field& field) {
    void* cell = peek_at(root, field.path);
    if (cell) {
        field.ops->zero(cell);
    }
}

result<void> decode_form_field(const form& src, void* root, const resolved_field& field) {
    const auto* tokens = src.find(field.name);
    if (!tokens) {
        return {};
    }

    const auto& ops = *field.ops;
    if (!ops.bulk) {
        bool null_like = ops.sequence ? is_null_equivalent(*tokens)
                                      : tokens->empty() || (!ops.custom_scalar && tokens->size() == 1 &&
                                                            tokens->front().empty());
        if (null_like) {
            zero_at(root, field);
            return {};
        }
    }

    void* cell = alloc_at(root, field.path);
    if (ops.bulk || ops.sequence) {
        return ops.parse_tokens(*tokens, cell);
    }
    return ops.parse_token(tokens->front(), cell);
}

result<void> decode_form_fields(const form& src, void* root, const field_list& fields) {
    if (src.empty()) {
        return {};
    }
    for (const auto& field : fields) {
        auto res = decode_form_field(src, root, field);
        if (!res) {
            return res;
        }
    }
    return {};
}

result<void> decode_json_fields(std::string_view raw,
                                void* root,
                                const field_list& fields,
                                std::string_view record_name,
                                const decode_limits& limits) {
    raw = json::trim(raw);
    if (raw.empty() || json::is_null(raw)) {
        return {};
    }
    if (!json::is_object(raw)) {
        return std::unexpected(
            conversion_failed(json::excerpt(raw), record_name, "expected JSON object"));
    }

    auto members = json::split_object(raw, limits);
    if (!members) {
        return std::unexpected(members.error());
    }

    // Later duplicates win.
    std::unordered_map<std::string_view, std::string_view> values;
    values.reserve(members->size());
    for (const auto& member : *members) {
        values.insert_or_assign(std::string_view(member.key), member.value);
    }

    for (const auto& field : fields) {
        auto it = values.find(field.name);
        if (it == values.end()) {
            continue;
        }
        if (json::is_null(it->second)) {
            zero_at(root, field);
            continue;
        }
        void* cell = alloc_at(root, field.path);
        auto res = field.ops->decode_json(it->second, cell, limits);
        if (!res) {
            return res;
        }
    }
    return {};
}

} // namespace reqbind::detail
