#include <recsql/runtime/group.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <type_traits>
#include <variant>

namespace recsql::runtime {

namespace {

struct GroupKey {
    std::vector<Scalar> values;
};

struct GroupKeyHash {
    auto operator()(const GroupKey& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            // Mix in the alternative so that e.g. int 1 and bool true land apart.
            hash_combine(value.index());
            hash_combine(std::visit(
                [](const auto& v) { return detail::GroupHash<std::decay_t<decltype(v)>>{}(v); },
                value));
        }
        return seed;
    }
};

struct GroupKeyEq {
    auto operator()(const GroupKey& a, const GroupKey& b) const -> bool {
        if (a.values.size() != b.values.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.values.size(); ++i) {
            const auto& x = a.values[i];
            const auto& y = b.values[i];
            if (x.index() != y.index()) {
                return false;
            }
            bool same = std::visit(
                [&](const auto& v) {
                    using T = std::decay_t<decltype(v)>;
                    return detail::GroupEq<T>{}(v, std::get<T>(y));
                },
                x);
            if (!same) {
                return false;
            }
        }
        return true;
    }
};

/// Key of `record` over `fields`; nullopt when a field holds a non-scalar.
auto extract_group_key(const Record& record, const std::vector<std::string>& fields)
    -> std::optional<GroupKey> {
    GroupKey key;
    key.values.reserve(fields.size());
    for (const auto& field : fields) {
        const auto* value = record.find(field);
        if (value == nullptr) {
            key.values.emplace_back(std::monostate{});
            continue;
        }
        auto scalar = to_scalar(*value);
        if (!scalar) {
            return std::nullopt;
        }
        key.values.push_back(std::move(*scalar));
    }
    return key;
}

struct Group {
    GroupKey key;
    std::vector<Record> members;
};

}  // namespace

auto group_by_fields(std::string sequence_field, std::vector<std::string> fields)
    -> Filter<Record, Record> {
    return [sequence_field = std::move(sequence_field),
            fields = std::move(fields)](Seq<Record> input) -> Seq<Record> {
        return Seq<Record>{[sequence_field, fields,
                            input = std::move(input)](const Yield<Record>& yield) {
            robin_hood::unordered_flat_map<GroupKey, std::size_t, GroupKeyHash, GroupKeyEq> slot_of;
            std::vector<Group> groups;
            std::size_t dropped = 0;

            input([&](const Record& record) {
                auto key = extract_group_key(record, fields);
                if (!key) {
                    dropped += 1;
                    return true;
                }
                auto it = slot_of.find(*key);
                if (it == slot_of.end()) {
                    it = slot_of.emplace(*key, groups.size()).first;
                    groups.push_back(Group{.key = std::move(*key), .members = {}});
                }
                groups[it->second].members.push_back(record);
                return true;
            });

            spdlog::debug("group_by_fields: {} groups, {} records dropped for non-scalar keys",
                          groups.size(), dropped);

            for (auto& group : groups) {
                RecordBuilder builder;
                builder.reserve(fields.size() + 1);
                for (std::size_t i = 0; i < fields.size(); ++i) {
                    builder.set(fields[i], to_value(group.key.values[i]));
                }
                builder.set(sequence_field, replay(std::make_shared<const std::vector<Record>>(
                                                std::move(group.members))));
                if (!yield(builder.build())) {
                    return;
                }
            }
        }};
    };
}

}  // namespace recsql::runtime
