#include <recsql/core/value.hpp>

#include <type_traits>
#include <unordered_map>

namespace recsql {

struct Record::Data {
    std::vector<Field> fields;
    std::unordered_map<std::string, std::size_t> index;

    void set(std::string name, Value value) {
        if (auto it = index.find(name); it != index.end()) {
            fields[it->second].value = std::move(value);
            return;
        }
        index.emplace(name, fields.size());
        fields.push_back(Field{.name = std::move(name), .value = std::move(value)});
    }

    void erase(const std::string& name) {
        auto it = index.find(name);
        if (it == index.end()) {
            return;
        }
        fields.erase(fields.begin() + static_cast<std::ptrdiff_t>(it->second));
        index.clear();
        for (std::size_t i = 0; i < fields.size(); ++i) {
            index.emplace(fields[i].name, i);
        }
    }
};

namespace {

auto empty_fields() -> const std::vector<Field>& {
    static const std::vector<Field> kEmpty;
    return kEmpty;
}

auto empty_values() -> const std::vector<Value>& {
    static const std::vector<Value> kEmpty;
    return kEmpty;
}

}  // namespace

// ─── Record ───────────────────────────────────────────────────────────────────

Record::Record(std::initializer_list<Field> fields) : Record(std::vector<Field>(fields)) {}

Record::Record(std::vector<Field> fields) {
    auto data = std::make_shared<Data>();
    data->fields.reserve(fields.size());
    for (auto& field : fields) {
        data->set(std::move(field.name), std::move(field.value));
    }
    data_ = std::move(data);
}

auto Record::find(const std::string& name) const -> const Value* {
    if (!data_) {
        return nullptr;
    }
    if (auto it = data_->index.find(name); it != data_->index.end()) {
        return &data_->fields[it->second].value;
    }
    return nullptr;
}

auto Record::has(const std::string& name) const -> bool {
    return data_ && data_->index.contains(name);
}

auto Record::size() const noexcept -> std::size_t {
    return data_ ? data_->fields.size() : 0;
}

auto Record::fields() const -> const std::vector<Field>& {
    return data_ ? data_->fields : empty_fields();
}

auto Record::with(std::string name, Value value) const -> Record {
    return RecordBuilder{*this}.set(std::move(name), std::move(value)).build();
}

auto Record::without(const std::string& name) const -> Record {
    if (!has(name)) {
        return *this;
    }
    return RecordBuilder{*this}.erase(name).build();
}

auto Record::merged(const Record& over) const -> Record {
    RecordBuilder builder{*this};
    builder.reserve(size() + over.size());
    for (const auto& field : over.fields()) {
        builder.set(field.name, field.value);
    }
    return builder.build();
}

auto operator==(const Record& a, const Record& b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& field : a.fields()) {
        const auto* other = b.find(field.name);
        if (other == nullptr || !values_equal(field.value, *other)) {
            return false;
        }
    }
    return true;
}

// ─── RecordBuilder ────────────────────────────────────────────────────────────

RecordBuilder::RecordBuilder() : data_(std::make_shared<Record::Data>()) {}

RecordBuilder::RecordBuilder(const Record& base)
    : data_(base.data_ ? std::make_shared<Record::Data>(*base.data_)
                       : std::make_shared<Record::Data>()) {}

auto RecordBuilder::set(std::string name, Value value) -> RecordBuilder& {
    data_->set(std::move(name), std::move(value));
    return *this;
}

auto RecordBuilder::erase(const std::string& name) -> RecordBuilder& {
    data_->erase(name);
    return *this;
}

void RecordBuilder::reserve(std::size_t capacity) {
    data_->fields.reserve(capacity);
    data_->index.reserve(capacity);
}

auto RecordBuilder::size() const noexcept -> std::size_t {
    return data_->fields.size();
}

auto RecordBuilder::build() -> Record {
    // Hand the accumulated data over; the builder starts fresh afterwards.
    auto frozen = std::move(data_);
    data_ = std::make_shared<Record::Data>();
    return Record{std::shared_ptr<const Record::Data>(std::move(frozen))};
}

// ─── ValueList ────────────────────────────────────────────────────────────────

ValueList::ValueList(std::vector<Value> values)
    : values_(std::make_shared<const std::vector<Value>>(std::move(values))) {}

auto ValueList::size() const noexcept -> std::size_t {
    return values_ ? values_->size() : 0;
}

auto ValueList::values() const -> const std::vector<Value>& {
    return values_ ? *values_ : empty_values();
}

auto ValueList::operator[](std::size_t idx) const -> const Value& {
    return values().at(idx);
}

auto operator==(const ValueList& a, const ValueList& b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!values_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

// ─── Free functions ───────────────────────────────────────────────────────────

auto values_equal(const Value& a, const Value& b) -> bool {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            if constexpr (std::is_same_v<T, RecordSeq>) {
                return false;
            } else {
                return lhs == std::get<T>(b);
            }
        },
        a.base());
}

auto is_scalar(const Value& value) noexcept -> bool {
    switch (value.kind()) {
        case ValueKind::Record:
        case ValueKind::List:
        case ValueKind::Sequence:
            return false;
        default:
            return true;
    }
}

auto to_scalar(const Value& value) -> std::optional<Scalar> {
    return std::visit(
        [](const auto& v) -> std::optional<Scalar> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Record> || std::is_same_v<T, ValueList> ||
                          std::is_same_v<T, RecordSeq>) {
                return std::nullopt;
            } else {
                return Scalar{std::in_place_type<T>, v};
            }
        },
        value.base());
}

auto to_value(const Scalar& scalar) -> Value {
    return std::visit(
        [](const auto& v) -> Value {
            using T = std::decay_t<decltype(v)>;
            return Value{std::in_place_type<T>, v};
        },
        scalar);
}

auto kind_name(ValueKind kind) noexcept -> const char* {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::String:
            return "string";
        case ValueKind::Timestamp:
            return "timestamp";
        case ValueKind::Record:
            return "record";
        case ValueKind::List:
            return "list";
        case ValueKind::Sequence:
            return "sequence";
    }
    return "unknown";
}

}  // namespace recsql
