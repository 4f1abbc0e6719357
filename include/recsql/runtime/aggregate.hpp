#pragma once

#include <recsql/core/convert.hpp>
#include <recsql/core/seq.hpp>
#include <recsql/core/value.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace recsql::runtime {

/// Reduces the members of one group to a single value.
using AggregateFn = std::function<Value(const std::vector<Record>&)>;

/// Result field name -> function.  Results are written in name order.
using Aggregations = std::map<std::string, AggregateFn>;

/// Replace `sequence_field` of every input record with the named aggregation results.
///
/// Records without a sequence of records under `sequence_field` pass through
/// unchanged.
[[nodiscard]] auto aggregate(std::string sequence_field, Aggregations functions)
    -> Filter<Record, Record>;

namespace agg {

/// Number of members, as int64.
[[nodiscard]] auto count() -> AggregateFn;

/// Sum, as double, of every member value at `field` that converts to double.
[[nodiscard]] auto sum(std::string field) -> AggregateFn;

/// Mean of the convertible values at `field`; 0.0 when there are none.
[[nodiscard]] auto avg(std::string field) -> AggregateFn;

/// First member value at `field`, of any type; null when no member has it.
[[nodiscard]] auto first(std::string field) -> AggregateFn;

/// Last member value at `field`, of any type; null when no member has it.
[[nodiscard]] auto last(std::string field) -> AggregateFn;

/// Every present value at `field`, in member order, as a ValueList.
[[nodiscard]] auto collect(std::string field) -> AggregateFn;

template <typename T>
inline constexpr bool is_orderable_target_v =
    std::is_same_v<T, std::int64_t> || std::is_same_v<T, double> ||
    std::is_same_v<T, std::string> || std::is_same_v<T, Timestamp>;

template <typename T>
concept OrderableTarget = is_orderable_target_v<T>;

namespace detail {

template <OrderableTarget T, typename Better>
[[nodiscard]] auto extreme(std::string field, Better better) -> AggregateFn {
    return [field = std::move(field), better](const std::vector<Record>& records) -> Value {
        std::optional<T> best;
        for (const auto& record : records) {
            auto value = recsql::get<T>(record, field);
            if (value && (!best || better(*value, *best))) {
                best = std::move(value);
            }
        }
        return Value(best.value_or(T{}));
    };
}

}  // namespace detail

/// Smallest member value at `field` converting to T; T{} when none converts.
template <OrderableTarget T>
[[nodiscard]] auto min(std::string field) -> AggregateFn {
    return detail::extreme<T>(std::move(field), [](const T& a, const T& b) { return a < b; });
}

/// Largest member value at `field` converting to T; T{} when none converts.
template <OrderableTarget T>
[[nodiscard]] auto max(std::string field) -> AggregateFn {
    return detail::extreme<T>(std::move(field), [](const T& a, const T& b) { return b < a; });
}

}  // namespace agg

}  // namespace recsql::runtime
