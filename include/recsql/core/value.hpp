#pragma once

#include <recsql/core/seq.hpp>
#include <recsql/core/time.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace recsql {

class Record;
class Value;
class ValueList;
struct Field;

using RecordSeq = Seq<Record>;

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Double,
    String,
    Timestamp,
    Record,
    List,
    Sequence,
};

/// An immutable bag of named values.
///
/// Copies share storage; every modifier returns a new Record and leaves the
/// original untouched.  Fields keep their insertion order.  Equality ignores
/// field order.
class Record {
   public:
    Record() = default;
    Record(std::initializer_list<Field> fields);
    explicit Record(std::vector<Field> fields);

    /// Returns nullptr when the field is absent.
    [[nodiscard]] auto find(const std::string& name) const -> const Value*;
    [[nodiscard]] auto has(const std::string& name) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    /// Fields in insertion order.
    [[nodiscard]] auto fields() const -> const std::vector<Field>&;

    /// Copy with `name` set to `value` (replaced in place when already present).
    [[nodiscard]] auto with(std::string name, Value value) const -> Record;
    [[nodiscard]] auto without(const std::string& name) const -> Record;

    /// Copy of this record overlaid with every field of `over`; `over` wins on collision.
    [[nodiscard]] auto merged(const Record& over) const -> Record;

    friend auto operator==(const Record& a, const Record& b) -> bool;

   private:
    friend class RecordBuilder;
    struct Data;

    explicit Record(std::shared_ptr<const Data> data) : data_(std::move(data)) {}

    std::shared_ptr<const Data> data_;
};

/// An immutable, ordered list of values (the result of `agg::collect`).
class ValueList {
   public:
    ValueList() = default;
    explicit ValueList(std::vector<Value> values);

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }
    [[nodiscard]] auto values() const -> const std::vector<Value>&;
    [[nodiscard]] auto operator[](std::size_t idx) const -> const Value&;

    friend auto operator==(const ValueList& a, const ValueList& b) -> bool;

   private:
    std::shared_ptr<const std::vector<Value>> values_;
};

/// Scalars are the only values usable as grouping keys.
using Scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string, Timestamp>;

using ValueBase = std::variant<std::monostate, bool, std::int64_t, double, std::string, Timestamp,
                               Record, ValueList, RecordSeq>;

/// A dynamically typed field value.  std::monostate is null.
class Value : public ValueBase {
   public:
    using ValueBase::ValueBase;
    using ValueBase::operator=;

    Value() = default;

    [[nodiscard]] auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(index());
    }
    [[nodiscard]] auto is_null() const noexcept -> bool { return kind() == ValueKind::Null; }

    [[nodiscard]] auto base() const noexcept -> const ValueBase& { return *this; }
};

struct Field {
    std::string name;
    Value value;
};

/// Mutable construction side of Record.  `build()` freezes the accumulated fields.
class RecordBuilder {
   public:
    RecordBuilder();
    explicit RecordBuilder(const Record& base);

    auto set(std::string name, Value value) -> RecordBuilder&;
    auto erase(const std::string& name) -> RecordBuilder&;
    void reserve(std::size_t capacity);

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto build() -> Record;

   private:
    std::shared_ptr<Record::Data> data_;
};

/// Same alternative and equal payload.  Sequences never compare equal.
[[nodiscard]] auto values_equal(const Value& a, const Value& b) -> bool;

[[nodiscard]] auto is_scalar(const Value& value) noexcept -> bool;

/// Returns nullopt for records, lists and sequences.
[[nodiscard]] auto to_scalar(const Value& value) -> std::optional<Scalar>;

[[nodiscard]] auto to_value(const Scalar& scalar) -> Value;

[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> const char*;

}  // namespace recsql
