#pragma once

#include <recsql/core/value.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace recsql {

/// Default textual representation of a value.  Hash join keys are built from it.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// One-line rendering: `{id: 1, name: Zed}`.
[[nodiscard]] auto format_record(const Record& record) -> std::string;

/// Print records as an aligned table.  Columns are the union of field names in
/// first-seen order; records lacking a column leave the cell blank.
void print(const std::vector<Record>& records, std::ostream& out = std::cout);

}  // namespace recsql
