#include <recsql/runtime/aggregate.hpp>

#include <cstddef>
#include <utility>

namespace recsql::runtime {

auto aggregate(std::string sequence_field, Aggregations functions) -> Filter<Record, Record> {
    return [sequence_field = std::move(sequence_field),
            functions = std::move(functions)](Seq<Record> input) -> Seq<Record> {
        return Seq<Record>{[sequence_field, functions,
                            input = std::move(input)](const Yield<Record>& yield) {
            input([&](const Record& record) {
                RecordBuilder builder{record};
                builder.erase(sequence_field);
                const auto* members = record.find(sequence_field);
                if (members != nullptr) {
                    if (const auto* seq = std::get_if<RecordSeq>(members)) {
                        auto materialized = recsql::collect(*seq);
                        for (const auto& [name, fn] : functions) {
                            builder.set(name, fn ? fn(materialized) : Value{});
                        }
                    }
                }
                return yield(builder.build());
            });
        }};
    };
}

namespace agg {

auto count() -> AggregateFn {
    return [](const std::vector<Record>& records) -> Value {
        return static_cast<std::int64_t>(records.size());
    };
}

auto sum(std::string field) -> AggregateFn {
    return [field = std::move(field)](const std::vector<Record>& records) -> Value {
        double total = 0.0;
        for (const auto& record : records) {
            if (auto value = recsql::get<double>(record, field)) {
                total += *value;
            }
        }
        return total;
    };
}

auto avg(std::string field) -> AggregateFn {
    return [field = std::move(field)](const std::vector<Record>& records) -> Value {
        double total = 0.0;
        std::size_t n = 0;
        for (const auto& record : records) {
            if (auto value = recsql::get<double>(record, field)) {
                total += *value;
                n += 1;
            }
        }
        if (n == 0) {
            return 0.0;
        }
        return total / static_cast<double>(n);
    };
}

auto first(std::string field) -> AggregateFn {
    return [field = std::move(field)](const std::vector<Record>& records) -> Value {
        for (const auto& record : records) {
            if (const auto* value = record.find(field)) {
                return *value;
            }
        }
        return Value{};
    };
}

auto last(std::string field) -> AggregateFn {
    return [field = std::move(field)](const std::vector<Record>& records) -> Value {
        for (auto it = records.rbegin(); it != records.rend(); ++it) {
            if (const auto* value = it->find(field)) {
                return *value;
            }
        }
        return Value{};
    };
}

auto collect(std::string field) -> AggregateFn {
    return [field = std::move(field)](const std::vector<Record>& records) -> Value {
        std::vector<Value> values;
        values.reserve(records.size());
        for (const auto& record : records) {
            if (const auto* value = record.find(field)) {
                values.push_back(*value);
            }
        }
        return ValueList{std::move(values)};
    };
}

}  // namespace agg

}  // namespace recsql::runtime
