#include <recsql/core/format.hpp>
#include <recsql/runtime/join.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace recsql::runtime {

namespace {

// values_equal, except that -0.0 and 0.0 differ as they do in the key text.
auto same_key_value(const Value& lhs, const Value& rhs) -> bool {
    if (!values_equal(lhs, rhs)) {
        return false;
    }
    if (lhs.kind() == ValueKind::Double) {
        return std::signbit(std::get<double>(lhs)) == std::signbit(std::get<double>(rhs));
    }
    return true;
}

class FieldsPredicate final : public JoinPredicate, public KeyExtractor {
   public:
    explicit FieldsPredicate(std::vector<std::string> fields) : fields_(std::move(fields)) {}

    [[nodiscard]] auto match(const Record& left, const Record& right) const -> bool override {
        for (const auto& field : fields_) {
            const auto* lhs = left.find(field);
            const auto* rhs = right.find(field);
            if (lhs == nullptr || rhs == nullptr || !is_scalar(*lhs) ||
                !same_key_value(*lhs, *rhs)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] auto extract_key(const Record& record) const
        -> std::optional<std::string> override {
        std::string key;
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            const auto* value = record.find(fields_[i]);
            if (value == nullptr || !is_scalar(*value)) {
                return std::nullopt;
            }
            if (i > 0) {
                key.push_back(kKeySeparator);
            }
            key.append(format_value(*value));
        }
        return key;
    }

   private:
    std::vector<std::string> fields_;
};

class ConditionPredicate final : public JoinPredicate {
   public:
    explicit ConditionPredicate(JoinCondition condition) : condition_(std::move(condition)) {}

    [[nodiscard]] auto match(const Record& left, const Record& right) const -> bool override {
        return condition_ && condition_(left, right);
    }

   private:
    JoinCondition condition_;
};

// ─── Candidate indexes ────────────────────────────────────────────────────────
//  An index enumerates, for one left record, the positions of the right
//  records worth testing.  The callback returns false to stop; the index
//  reports whether enumeration ran to completion.

class ScanIndex {
   public:
    explicit ScanIndex(std::size_t size) : size_(size) {}

    template <typename Fn>
    auto for_each_candidate(const Record& /*left*/, Fn&& fn) const -> bool {
        for (std::size_t j = 0; j < size_; ++j) {
            if (!fn(j)) {
                return false;
            }
        }
        return true;
    }

   private:
    std::size_t size_;
};

class HashIndex {
   public:
    HashIndex(const KeyExtractor& extractor, const std::vector<Record>& rights)
        : extractor_(extractor) {
        buckets_.reserve(rights.size());
        for (std::size_t j = 0; j < rights.size(); ++j) {
            auto key = extractor_.extract_key(rights[j]);
            if (!key) {
                unkeyed_ += 1;
                continue;
            }
            buckets_[std::move(*key)].push_back(j);
        }
    }

    template <typename Fn>
    auto for_each_candidate(const Record& left, Fn&& fn) const -> bool {
        auto key = extractor_.extract_key(left);
        if (!key) {
            return true;
        }
        auto it = buckets_.find(*key);
        if (it == buckets_.end()) {
            return true;
        }
        for (auto j : it->second) {
            if (!fn(j)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] auto bucket_count() const noexcept -> std::size_t { return buckets_.size(); }
    [[nodiscard]] auto unkeyed() const noexcept -> std::size_t { return unkeyed_; }

   private:
    const KeyExtractor& extractor_;
    robin_hood::unordered_flat_map<std::string, std::vector<std::size_t>> buckets_;
    std::size_t unkeyed_ = 0;
};

// Shared by both strategies so that output and emission order never depend on
// which index was chosen.  Inner/Left stream the left side; Right/Full
// materialize it to run the unmatched passes afterwards.
template <typename Index>
void run_join(JoinKind kind, const Seq<Record>& left, const std::vector<Record>& rights,
              const Index& index, const JoinPredicate& predicate, const Yield<Record>& yield) {
    if (kind == JoinKind::Inner || kind == JoinKind::Left) {
        left([&](const Record& l) -> bool {
            bool matched = false;
            bool completed = index.for_each_candidate(l, [&](std::size_t j) -> bool {
                if (!predicate.match(l, rights[j])) {
                    return true;
                }
                matched = true;
                return yield(l.merged(rights[j]));
            });
            if (!completed) {
                return false;
            }
            if (!matched && kind == JoinKind::Left) {
                return yield(l);
            }
            return true;
        });
        return;
    }

    auto lefts = collect(left);
    std::vector<bool> left_matched(lefts.size(), false);
    std::vector<bool> right_matched(rights.size(), false);

    for (std::size_t i = 0; i < lefts.size(); ++i) {
        const auto& l = lefts[i];
        bool completed = index.for_each_candidate(l, [&](std::size_t j) -> bool {
            if (!predicate.match(l, rights[j])) {
                return true;
            }
            left_matched[i] = true;
            right_matched[j] = true;
            return yield(l.merged(rights[j]));
        });
        if (!completed) {
            return;
        }
    }

    if (kind == JoinKind::Full) {
        for (std::size_t i = 0; i < lefts.size(); ++i) {
            if (!left_matched[i] && !yield(lefts[i])) {
                return;
            }
        }
    }
    for (std::size_t j = 0; j < rights.size(); ++j) {
        if (!right_matched[j] && !yield(rights[j])) {
            return;
        }
    }
}

}  // namespace

auto join_kind_name(JoinKind kind) noexcept -> const char* {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
        case JoinKind::Right:
            return "right";
        case JoinKind::Full:
            return "full";
    }
    return "unknown";
}

auto on_fields(std::vector<std::string> fields) -> JoinPredicatePtr {
    return std::make_shared<const FieldsPredicate>(std::move(fields));
}

auto on_condition(JoinCondition condition) -> JoinPredicatePtr {
    return std::make_shared<const ConditionPredicate>(std::move(condition));
}

auto join(Seq<Record> right, JoinPredicatePtr predicate, JoinKind kind) -> Filter<Record, Record> {
    if (!predicate) {
        predicate = on_condition(nullptr);
    }
    return [right = std::move(right), predicate = std::move(predicate),
            kind](Seq<Record> left) -> Seq<Record> {
        return Seq<Record>{[right, predicate, kind,
                            left = std::move(left)](const Yield<Record>& yield) {
            const auto* extractor = dynamic_cast<const KeyExtractor*>(predicate.get());
            auto rights = collect(right);
            if (extractor != nullptr) {
                HashIndex index{*extractor, rights};
                spdlog::debug("{} join: hash strategy, {} right records in {} buckets ({} unkeyed)",
                              join_kind_name(kind), rights.size(), index.bucket_count(),
                              index.unkeyed());
                run_join(kind, left, rights, index, *predicate, yield);
                return;
            }
            spdlog::debug("{} join: nested-loop strategy, {} right records", join_kind_name(kind),
                          rights.size());
            run_join(kind, left, rights, ScanIndex{rights.size()}, *predicate, yield);
        }};
    };
}

auto inner_join(Seq<Record> right, JoinPredicatePtr predicate) -> Filter<Record, Record> {
    return join(std::move(right), std::move(predicate), JoinKind::Inner);
}

auto left_join(Seq<Record> right, JoinPredicatePtr predicate) -> Filter<Record, Record> {
    return join(std::move(right), std::move(predicate), JoinKind::Left);
}

auto right_join(Seq<Record> right, JoinPredicatePtr predicate) -> Filter<Record, Record> {
    return join(std::move(right), std::move(predicate), JoinKind::Right);
}

auto full_join(Seq<Record> right, JoinPredicatePtr predicate) -> Filter<Record, Record> {
    return join(std::move(right), std::move(predicate), JoinKind::Full);
}

}  // namespace recsql::runtime
