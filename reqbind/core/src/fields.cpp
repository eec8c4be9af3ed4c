#include "reqbind/core/fields.hpp"
#include "reqbind/core/log.hpp"

#include <mutex>
#include <unordered_set>

namespace reqbind {

namespace {

void collect(const member_list& members,
             const std::vector<field_step>& prefix,
             field_list& out) {
    for (const auto& member : members) {
        if (!member.visible) {
            continue;
        }

        auto name = tag_name(member.tag);
        if (!name.empty()) {
            resolved_field field;
            field.name.assign(name);
            field.path = prefix;
            field.path.push_back(field_step{member.offset, nullptr});
            field.ops = member.ops;
            out.push_back(std::move(field));
            continue;
        }

        // An explicitly excluded member is never recursed into.
        if (member.tag.substr(0, member.tag.find(',')) == "-" || !member.embedded) {
            continue;
        }

        auto nested = prefix;
        nested.push_back(field_step{member.offset, member.slot});
        collect(member.embedded(), nested, out);
    }
}

} // namespace

std::string_view tag_name(std::string_view tag) noexcept {
    auto comma = tag.find(',');
    if (comma != std::string_view::npos) {
        tag = tag.substr(0, comma);
    }
    if (tag == "-") {
        return {};
    }
    return tag;
}

field_list resolve_members(const member_list& members, std::string_view record_name) {
    field_list out;
    collect(members, {}, out);

    std::unordered_set<std::string_view> seen;
    for (const auto& field : out) {
        if (!seen.insert(field.name).second) {
            log::warn("reqbind",
                      std::string(record_name) + " declares field \"" + field.name +
                          "\" more than once; every occurrence is decoded");
        }
    }
    return out;
}

field_cache& field_cache::instance() {
    static field_cache cache;
    return cache;
}

const field_list&
field_cache::resolve(std::type_index type, const member_list& members, std::string (*record_name)()) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(type);
        if (it != entries_.end()) {
            return *it->second;
        }
    }

    auto fields = std::make_unique<const field_list>(resolve_members(members, record_name()));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.try_emplace(type, std::move(fields)).first;
    return *it->second;
}

size_t field_cache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace reqbind
