#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

namespace recsql {

/// Consumer callback. Returning false asks the producer to stop immediately.
template <typename T>
using Yield = std::function<bool(const T&)>;

/// A lazy, cooperative sequence.
///
/// Nothing is produced until the sequence is invoked with a consumer; each
/// element is handed to the consumer in turn, and the producer returns as soon
/// as the consumer declines the next one.  A default-constructed Seq is empty.
template <typename T>
class Seq {
   public:
    using value_type = T;
    using Producer = std::function<void(const Yield<T>&)>;

    Seq() = default;

    explicit Seq(Producer producer) : producer_(std::move(producer)) {}

    /// Drive the sequence, passing every element to `yield` until it returns false.
    void operator()(const Yield<T>& yield) const {
        if (producer_) {
            producer_(yield);
        }
    }

   private:
    Producer producer_;
};

/// A pipeline stage turning one sequence into another.
template <typename T, typename U>
using Filter = std::function<Seq<U>(Seq<T>)>;

/// Replay a shared, immutable list.  The list stays alive as long as the sequence does.
template <typename T>
[[nodiscard]] auto replay(std::shared_ptr<const std::vector<T>> values) -> Seq<T> {
    return Seq<T>{[values = std::move(values)](const Yield<T>& yield) {
        for (const auto& value : *values) {
            if (!yield(value)) {
                return;
            }
        }
    }};
}

template <typename T>
[[nodiscard]] auto from(std::vector<T> values) -> Seq<T> {
    return replay(std::make_shared<const std::vector<T>>(std::move(values)));
}

template <typename T>
[[nodiscard]] auto from(std::initializer_list<T> values) -> Seq<T> {
    return from(std::vector<T>(values));
}

/// Materialize every element of `seq`.
template <typename T>
[[nodiscard]] auto collect(const Seq<T>& seq) -> std::vector<T> {
    std::vector<T> out;
    seq([&out](const T& value) {
        out.push_back(value);
        return true;
    });
    return out;
}

// ─── Composition ──────────────────────────────────────────────────────────────

template <typename T, typename U, typename V>
[[nodiscard]] auto pipe(Filter<T, U> f1, Filter<U, V> f2) -> Filter<T, V> {
    return [f1 = std::move(f1), f2 = std::move(f2)](Seq<T> input) -> Seq<V> {
        return f2(f1(std::move(input)));
    };
}

template <typename T, typename U, typename V, typename W>
[[nodiscard]] auto pipe(Filter<T, U> f1, Filter<U, V> f2, Filter<V, W> f3) -> Filter<T, W> {
    return [f1 = std::move(f1), f2 = std::move(f2), f3 = std::move(f3)](Seq<T> input) -> Seq<W> {
        return f3(f2(f1(std::move(input))));
    };
}

/// Apply same-typed stages left to right.  An empty chain is the identity.
template <typename T>
[[nodiscard]] auto chain(std::vector<Filter<T, T>> filters) -> Filter<T, T> {
    return [filters = std::move(filters)](Seq<T> input) -> Seq<T> {
        for (const auto& filter : filters) {
            input = filter(std::move(input));
        }
        return input;
    };
}

}  // namespace recsql
