#include "gen_records.hpp"
#include "log_level.hpp"

#include <recsql/recsql.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace {

struct BenchConfig {
    std::int64_t left_rows = 10'000;
    std::int64_t right_rows = 1'000;
    double match_rate = 0.5;
    std::size_t iters = 3;
    std::string kind = "all";
    std::vector<std::string> aggs;
    bool print = false;
    bool verbose = false;
};

auto selected_kinds(const std::string& kind) -> std::vector<recsql::runtime::JoinKind> {
    using recsql::runtime::JoinKind;
    if (kind == "inner")
        return {JoinKind::Inner};
    if (kind == "left")
        return {JoinKind::Left};
    if (kind == "right")
        return {JoinKind::Right};
    if (kind == "full")
        return {JoinKind::Full};
    return {JoinKind::Inner, JoinKind::Left, JoinKind::Right, JoinKind::Full};
}

void configure_logging(bool verbose) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::info);
    // No -v: fall back to the RECSQL_LOG_LEVEL environment variable.
    if (const char* env = std::getenv("RECSQL_LOG_LEVEL"); env != nullptr) {
        if (auto level = parse_log_level(env)) {
            spdlog::set_level(*level);
        } else {
            spdlog::warn("unknown RECSQL_LOG_LEVEL '{}', keeping info", env);
        }
    }
}

struct JoinTiming {
    double avg_ms = 0.0;
    std::size_t rows = 0;
};

auto time_join(const recsql::Filter<recsql::Record, recsql::Record>& filter,
               const recsql::RecordSeq& left, std::size_t iters) -> JoinTiming {
    std::size_t rows = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) {
        rows = 0;
        filter(left)([&rows](const recsql::Record&) {
            rows += 1;
            return true;
        });
    }
    auto end = std::chrono::steady_clock::now();
    auto total_ms =
        std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start).count();
    return JoinTiming{.avg_ms = total_ms / static_cast<double>(iters), .rows = rows};
}

auto run(const BenchConfig& config) -> int {
    using namespace recsql::runtime;

    auto registry = AggregateRegistry::with_builtins();
    auto specs = config.aggs;
    if (specs.empty()) {
        specs = {"orders=count", "total=sum:amount", "avg_amount=avg:amount",
                 "largest=max:amount"};
    }
    Aggregations aggregations;
    for (const auto& spec : specs) {
        auto resolved = registry.resolve(spec);
        if (!resolved) {
            fmt::print("error: {}\n", resolved.error());
            return 1;
        }
        aggregations.insert_or_assign(std::move(resolved->first), std::move(resolved->second));
    }

    auto orders =
        recsql::from(gen_orders(config.left_rows, std::max<std::int64_t>(config.right_rows, 1)));
    auto customers = recsql::from(gen_customers(config.right_rows, config.match_rate));
    spdlog::info("generated {} orders and {} customers (match rate {:.2f})", config.left_rows,
                 config.right_rows, config.match_rate);

    auto by_customer = on_fields("customer");
    auto by_condition = on_condition([](const recsql::Record& l, const recsql::Record& r) {
        const auto* a = l.find("customer");
        const auto* b = r.find("customer");
        return a != nullptr && b != nullptr && recsql::values_equal(*a, *b);
    });

    for (auto kind : selected_kinds(config.kind)) {
        auto hashed = time_join(join(customers, by_customer, kind), orders, config.iters);
        auto nested = time_join(join(customers, by_condition, kind), orders, config.iters);
        fmt::print("bench {:<5} join: hash avg_ms={:.3f} rows={}, nested avg_ms={:.3f} rows={}\n",
                   join_kind_name(kind), hashed.avg_ms, hashed.rows, nested.avg_ms, nested.rows);
        if (hashed.rows != nested.rows) {
            fmt::print("error: {} join strategies disagree ({} vs {} rows)\n",
                       join_kind_name(kind), hashed.rows, nested.rows);
            return 1;
        }
    }

    auto summarize = recsql::pipe(inner_join(customers, by_customer),
                                  group_by_fields("orders", {"tier", "region"}),
                                  aggregate("orders", aggregations));

    auto start = std::chrono::steady_clock::now();
    auto summary = recsql::collect(summarize(orders));
    auto end = std::chrono::steady_clock::now();
    fmt::print("bench group+aggregate: ms={:.3f}, groups={}\n",
               std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start)
                   .count(),
               summary.size());

    if (config.print) {
        recsql::print(summary);
    }
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"recsql join / group / aggregate benchmark"};

    BenchConfig config;
    app.add_option("--left-rows", config.left_rows, "Number of order records (left side)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--right-rows", config.right_rows, "Number of customer records (right side)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--match-rate", config.match_rate,
                   "Fraction of customers whose key can be matched")
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--iters", config.iters, "Measured iterations per join")
        ->check(CLI::PositiveNumber);
    app.add_option("--kind", config.kind, "Join kind to time")
        ->check(CLI::IsMember({"inner", "left", "right", "full", "all"}));
    app.add_option("--agg", config.aggs,
                   "Aggregate spec alias=func[:field] (repeatable; "
                   "count, sum, avg, min, max, first, last, collect)");
    app.add_flag("--print", config.print, "Print the aggregated summary table");
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    configure_logging(config.verbose);

    try {
        return run(config);
    } catch (const std::exception& e) {
        fmt::print("error: {}\n", e.what());
        return 1;
    }
}
