#pragma once

#include <recsql/runtime/aggregate.hpp>

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace recsql::runtime {

/// Builds an aggregation over `field` (empty for functions that take no field).
using AggregateFactory = std::function<AggregateFn(const std::string& field)>;

struct AggregateEntry {
    AggregateFactory factory;
    /// False for functions such as count that ignore the field.
    bool requires_field = true;
};

/// Named aggregation functions, resolvable from text such as `total=sum:amount`.
class AggregateRegistry {
   public:
    AggregateRegistry() = default;

    /// Registry holding count, sum, avg, min, max, first, last and collect.
    /// min and max compare as double.
    [[nodiscard]] static auto with_builtins() -> AggregateRegistry;

    /// Register (or replace) an aggregation factory.
    void register_factory(std::string name, AggregateFactory factory, bool requires_field = true) {
        registry_.insert_or_assign(
            std::move(name),
            AggregateEntry{.factory = std::move(factory), .requires_field = requires_field});
    }

    [[nodiscard]] auto find(const std::string& name) const -> const AggregateEntry* {
        if (auto it = registry_.find(name); it != registry_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return registry_.contains(name);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return registry_.size(); }

    /// Registered names, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Instantiate `name` over `field`.
    [[nodiscard]] auto make(const std::string& name, const std::string& field) const
        -> std::expected<AggregateFn, std::string>;

    /// Parse `alias=func[:field]` into the result field name and its function.
    [[nodiscard]] auto resolve(std::string_view spec) const
        -> std::expected<std::pair<std::string, AggregateFn>, std::string>;

   private:
    std::unordered_map<std::string, AggregateEntry> registry_;
};

}  // namespace recsql::runtime
