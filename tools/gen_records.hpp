#pragma once
// gen_records: synthetic record sets for join and group benchmarks.
//
// Orders reference customers by `customer`.  Only the first
// `match_rate * customers` customer rows carry a key an order can hit; the rest
// use negative keys and stay unmatched.

#include <recsql/core/time.hpp>
#include <recsql/core/value.hpp>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

inline auto gen_orders(std::int64_t n, std::int64_t customers) -> std::vector<recsql::Record> {
    if (n < 0)
        throw std::invalid_argument("gen_orders: n must be non-negative");
    if (customers <= 0)
        throw std::invalid_argument("gen_orders: customers must be positive");

    static constexpr std::array<const char*, 4> kRegions = {"north", "south", "east", "west"};

    std::vector<recsql::Record> out;
    out.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        recsql::RecordBuilder builder;
        builder.reserve(5);
        builder.set("order_id", i);
        builder.set("customer", i % customers);
        builder.set("amount", 10.0 + static_cast<double>(i % 100));
        builder.set("region", std::string(kRegions[static_cast<std::size_t>(i % 4)]));
        builder.set("ts", recsql::timestamp_from_seconds(1'700'000'000LL + i * 60).value());
        out.push_back(builder.build());
    }
    return out;
}

inline auto gen_customers(std::int64_t n, double match_rate) -> std::vector<recsql::Record> {
    if (n < 0)
        throw std::invalid_argument("gen_customers: n must be non-negative");
    if (match_rate < 0.0 || match_rate > 1.0)
        throw std::invalid_argument("gen_customers: match_rate must be within [0, 1]");

    auto keyed = static_cast<std::int64_t>(static_cast<double>(n) * match_rate);
    std::vector<recsql::Record> out;
    out.reserve(static_cast<std::size_t>(n));
    for (std::int64_t j = 0; j < n; ++j) {
        recsql::RecordBuilder builder;
        builder.reserve(3);
        builder.set("customer", j < keyed ? j : -(j + 1));
        builder.set("tier", std::string(j % 3 == 0 ? "gold" : "silver"));
        builder.set("credit", 1000.0 + static_cast<double>(j % 7) * 250.0);
        out.push_back(builder.build());
    }
    return out;
}
