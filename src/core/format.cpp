#include <recsql/core/format.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <unordered_map>

namespace recsql {

auto format_value(const Value& value) -> std::string {
    // Keep NaN/Inf explicit and print doubles in their shortest round-trip form,
    // so that distinct doubles never share a rendering.
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, Record>) {
                return format_record(v);
            } else if constexpr (std::is_same_v<T, ValueList>) {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) {
                        out.append(", ");
                    }
                    out.append(format_value(v[i]));
                }
                out.push_back(']');
                return out;
            } else {
                return "<seq>";
            }
        },
        value.base());
}

auto format_record(const Record& record) -> std::string {
    std::string out = "{";
    bool first = true;
    for (const auto& field : record.fields()) {
        if (!first) {
            out.append(", ");
        }
        first = false;
        out.append(field.name);
        out.append(": ");
        out.append(format_value(field.value));
    }
    out.push_back('}');
    return out;
}

void print(const std::vector<Record>& records, std::ostream& out) {
    if (records.empty()) {
        out << "(no records)\n";
        return;
    }

    std::vector<std::string> names;
    std::unordered_map<std::string, std::size_t> column_of;
    for (const auto& record : records) {
        for (const auto& field : record.fields()) {
            if (column_of.emplace(field.name, names.size()).second) {
                names.push_back(field.name);
            }
        }
    }

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(names.size(),
                                                std::vector<std::string>(records.size()));
    std::vector<std::size_t> widths(names.size());
    for (std::size_t c = 0; c < names.size(); ++c) {
        widths[c] = names[c].size();
    }
    for (std::size_t r = 0; r < records.size(); ++r) {
        for (const auto& field : records[r].fields()) {
            auto c = column_of.at(field.name);
            cells[c][r] = format_value(field.value);
            widths[c] = std::max(widths[c], cells[c][r].size());
        }
    }

    // Header row.
    for (std::size_t c = 0; c < names.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", names[c], widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < names.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < records.size(); ++r) {
        for (std::size_t c = 0; c < names.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

}  // namespace recsql
