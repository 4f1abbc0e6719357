#include <recsql/runtime/aggregate_registry.hpp>

#include <algorithm>

namespace recsql::runtime {

auto AggregateRegistry::with_builtins() -> AggregateRegistry {
    AggregateRegistry registry;
    registry.register_factory(
        "count", [](const std::string&) { return agg::count(); }, false);
    registry.register_factory("sum", [](const std::string& field) { return agg::sum(field); });
    registry.register_factory("avg", [](const std::string& field) { return agg::avg(field); });
    registry.register_factory("min",
                              [](const std::string& field) { return agg::min<double>(field); });
    registry.register_factory("max",
                              [](const std::string& field) { return agg::max<double>(field); });
    registry.register_factory("first", [](const std::string& field) { return agg::first(field); });
    registry.register_factory("last", [](const std::string& field) { return agg::last(field); });
    registry.register_factory("collect",
                              [](const std::string& field) { return agg::collect(field); });
    return registry;
}

auto AggregateRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(registry_.size());
    for (const auto& [name, entry] : registry_) {
        out.push_back(name);
    }
    std::ranges::sort(out);
    return out;
}

auto AggregateRegistry::make(const std::string& name, const std::string& field) const
    -> std::expected<AggregateFn, std::string> {
    const auto* entry = find(name);
    if (entry == nullptr) {
        return std::unexpected("unknown aggregate function: " + name);
    }
    if (entry->requires_field && field.empty()) {
        return std::unexpected("aggregate function " + name + " requires a field");
    }
    return entry->factory(field);
}

auto AggregateRegistry::resolve(std::string_view spec) const
    -> std::expected<std::pair<std::string, AggregateFn>, std::string> {
    auto eq = spec.find('=');
    if (eq == std::string_view::npos) {
        return std::unexpected("aggregate spec must look like alias=func[:field]: " +
                               std::string(spec));
    }
    std::string alias(spec.substr(0, eq));
    if (alias.empty()) {
        return std::unexpected("aggregate spec is missing an alias: " + std::string(spec));
    }

    auto call = spec.substr(eq + 1);
    std::string field;
    if (auto colon = call.find(':'); colon != std::string_view::npos) {
        field = std::string(call.substr(colon + 1));
        call = call.substr(0, colon);
    }
    if (call.empty()) {
        return std::unexpected("aggregate spec is missing a function: " + std::string(spec));
    }

    auto fn = make(std::string(call), field);
    if (!fn) {
        return std::unexpected(fn.error());
    }
    return std::make_pair(std::move(alias), std::move(*fn));
}

}  // namespace recsql::runtime
