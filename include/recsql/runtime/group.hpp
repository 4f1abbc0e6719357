#pragma once

#include <recsql/core/seq.hpp>
#include <recsql/core/value.hpp>

#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace recsql::runtime {

namespace detail {

// Grouping keys treat every NaN as one value and keep -0.0 apart from 0.0.
template <typename K>
struct GroupHash {
    auto operator()(const K& key) const -> std::size_t {
        if constexpr (std::is_floating_point_v<K>) {
            if (std::isnan(key)) {
                return 0x7ff8000000000000ULL;
            }
            if (key == K{0}) {
                return std::signbit(key) ? 1 : 0;
            }
        }
        return std::hash<K>{}(key);
    }
};

template <typename K>
struct GroupEq {
    auto operator()(const K& a, const K& b) const -> bool {
        if constexpr (std::is_floating_point_v<K>) {
            if (std::isnan(a) || std::isnan(b)) {
                return std::isnan(a) && std::isnan(b);
            }
            return a == b && std::signbit(a) == std::signbit(b);
        } else {
            return a == b;
        }
    }
};

}  // namespace detail

// ─── Grouping ─────────────────────────────────────────────────────────────────
//  Both entry points consume their whole input before emitting anything.  One
//  group record is produced per distinct key, in first-seen key order; its
//  `sequence_field` replays the group's members (any number of times).

/// Group by the value of `key_fn`, stored on the group record under `key_field`.
///
/// `K` must be hashable with std::hash and convertible to Value.  Floating keys
/// put all NaNs in one group and keep -0.0 apart from 0.0.
template <typename K>
[[nodiscard]] auto group_by(std::string sequence_field, std::string key_field,
                            std::function<K(const Record&)> key_fn) -> Filter<Record, Record> {
    return [sequence_field = std::move(sequence_field), key_field = std::move(key_field),
            key_fn = std::move(key_fn)](Seq<Record> input) -> Seq<Record> {
        return Seq<Record>{[sequence_field, key_field, key_fn,
                            input = std::move(input)](const Yield<Record>& yield) {
            std::unordered_map<K, std::size_t, detail::GroupHash<K>, detail::GroupEq<K>> slot_of;
            std::vector<std::pair<K, std::vector<Record>>> groups;
            input([&](const Record& record) {
                K key = key_fn(record);
                auto [it, inserted] = slot_of.try_emplace(key, groups.size());
                if (inserted) {
                    groups.emplace_back(std::move(key), std::vector<Record>{});
                }
                groups[it->second].second.push_back(record);
                return true;
            });

            for (auto& [key, members] : groups) {
                RecordBuilder builder;
                builder.reserve(2);
                builder.set(key_field, Value(key));
                builder.set(sequence_field,
                            replay(std::make_shared<const std::vector<Record>>(std::move(members))));
                if (!yield(builder.build())) {
                    return;
                }
            }
        }};
    };
}

/// Group by equality of the named fields, all of which are copied onto the group record.
///
/// A record whose key field holds a record, list or sequence is dropped.  An
/// absent key field groups as null.
[[nodiscard]] auto group_by_fields(std::string sequence_field, std::vector<std::string> fields)
    -> Filter<Record, Record>;

}  // namespace recsql::runtime
