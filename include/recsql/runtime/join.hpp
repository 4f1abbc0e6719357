#pragma once

#include <recsql/core/seq.hpp>
#include <recsql/core/value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recsql::runtime {

/// Join type.
enum class JoinKind : std::uint8_t {
    Inner,
    Left,
    Right,
    Full,
};

[[nodiscard]] auto join_kind_name(JoinKind kind) noexcept -> const char*;

/// Decides whether a left and a right record belong together.
class JoinPredicate {
   public:
    virtual ~JoinPredicate() = default;

    [[nodiscard]] virtual auto match(const Record& left, const Record& right) const -> bool = 0;
};

/// Optional capability of a JoinPredicate enabling the hash strategy.
///
/// Records that match must extract equal keys.  Equal keys need not imply a
/// match: every hash hit is re-checked with JoinPredicate::match.
class KeyExtractor {
   public:
    virtual ~KeyExtractor() = default;

    /// nullopt when the record has no usable key (e.g. a key field is absent).
    [[nodiscard]] virtual auto extract_key(const Record& record) const
        -> std::optional<std::string> = 0;
};

using JoinPredicatePtr = std::shared_ptr<const JoinPredicate>;
using JoinCondition = std::function<bool(const Record& left, const Record& right)>;

/// Separator placed between key parts by on_fields() key extraction.
inline constexpr char kKeySeparator = '\0';

/// Equality on every named field.  Also a KeyExtractor, so joins use the hash strategy.
[[nodiscard]] auto on_fields(std::vector<std::string> fields) -> JoinPredicatePtr;

template <typename... Names>
[[nodiscard]] auto on_fields(std::string first, Names&&... rest) -> JoinPredicatePtr {
    return on_fields(std::vector<std::string>{std::move(first), std::string(rest)...});
}

/// Arbitrary condition.  Not a KeyExtractor, so joins fall back to the nested loop.
[[nodiscard]] auto on_condition(JoinCondition condition) -> JoinPredicatePtr;

// ─── Join filters ─────────────────────────────────────────────────────────────
//  The returned filter is applied to the left sequence.  Matched pairs are
//  merged left-then-right (right wins on field-name collisions); unmatched
//  records of the preserved side(s) are passed through unchanged.

[[nodiscard]] auto join(Seq<Record> right, JoinPredicatePtr predicate, JoinKind kind)
    -> Filter<Record, Record>;

[[nodiscard]] auto inner_join(Seq<Record> right, JoinPredicatePtr predicate)
    -> Filter<Record, Record>;
[[nodiscard]] auto left_join(Seq<Record> right, JoinPredicatePtr predicate)
    -> Filter<Record, Record>;
[[nodiscard]] auto right_join(Seq<Record> right, JoinPredicatePtr predicate)
    -> Filter<Record, Record>;
[[nodiscard]] auto full_join(Seq<Record> right, JoinPredicatePtr predicate)
    -> Filter<Record, Record>;

}  // namespace recsql::runtime
