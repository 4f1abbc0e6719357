#include <recsql/recsql.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>

auto main() -> int {
    using namespace recsql;
    using namespace recsql::runtime;

    auto employees = from<Record>({
        Record{{"name", std::string("Ada")}, {"dept_id", std::int64_t{1}}, {"salary", 100.0}},
        Record{{"name", std::string("Bob")}, {"dept_id", std::int64_t{1}}, {"salary", 200.0}},
        Record{{"name", std::string("Cy")}, {"dept_id", std::int64_t{2}}, {"salary", 150.0}},
        Record{{"name", std::string("Dee")}, {"dept_id", std::int64_t{9}}, {"salary", 90.0}},
    });
    auto departments = from<Record>({
        Record{{"dept_id", std::int64_t{1}}, {"dept", std::string("Eng")}},
        Record{{"dept_id", std::int64_t{2}}, {"dept", std::string("Sales")}},
        Record{{"dept_id", std::int64_t{3}}, {"dept", std::string("Legal")}},
    });

    fmt::print("=== Full join on dept_id ===\n");
    recsql::print(collect(full_join(departments, on_fields("dept_id"))(employees)));

    fmt::print("\n=== Payroll by department ===\n");
    auto payroll = pipe(inner_join(departments, on_fields("dept_id")),
                        group_by_fields("staff", {"dept"}),
                        aggregate("staff", {
                                               {"headcount", agg::count()},
                                               {"total", agg::sum("salary")},
                                               {"average", agg::avg("salary")},
                                               {"top", agg::max<double>("salary")},
                                               {"names", agg::collect("name")},
                                           }));
    recsql::print(collect(payroll(employees)));

    return 0;
}
