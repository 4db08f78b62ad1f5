#pragma once

/// @file value.hpp
/// @brief Host-neutral value model consumed by comparers and constraints
///
/// Every actual and expected value is converted into a `Value` before it reaches the
/// comparer chain. Scalars are stored inline; composites live in shared nodes whose
/// address is the value's identity, which is what cycle detection keys on.

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace assertlab::core {

/// Whether a described type is ordinary data or declarative metadata
enum class TypeCategory { plain, attribute };

/// Minimal type metadata carried by records
struct TypeDescriptor {
    std::string name;
    TypeCategory category = TypeCategory::plain;

    bool is_attribute() const { return category == TypeCategory::attribute; }
    bool operator==(const TypeDescriptor&) const = default;
};

/// Tag base for metadata types attached to records through `attributes()`
struct Attribute {};

/// Describe T. Uses `T::type_name` when present, otherwise the RTTI name.
template <typename T>
TypeDescriptor type_of() {
    TypeDescriptor descriptor;
    if constexpr (requires { T::type_name; }) {
        descriptor.name = std::string(T::type_name);
    } else {
        descriptor.name = typeid(T).name();
    }
    descriptor.category =
        std::is_base_of_v<Attribute, T> ? TypeCategory::attribute : TypeCategory::plain;
    return descriptor;
}

class Value;
struct Sequence;
struct Dictionary;
struct Tuple;
struct Record;
class StructurallyEquatable;

/// Kinds of value; order matches Value::Storage alternatives
enum class ValueKind {
    null,
    boolean,
    integer,
    unsigned_integer,
    floating,
    string,
    duration,
    sequence,
    dictionary,
    tuple,
    record,
    structural
};

inline const char* to_string(ValueKind kind) {
    switch (kind) {
    case ValueKind::null:
        return "null";
    case ValueKind::boolean:
        return "boolean";
    case ValueKind::integer:
        return "integer";
    case ValueKind::unsigned_integer:
        return "unsigned integer";
    case ValueKind::floating:
        return "floating point";
    case ValueKind::string:
        return "string";
    case ValueKind::duration:
        return "duration";
    case ValueKind::sequence:
        return "sequence";
    case ValueKind::dictionary:
        return "dictionary";
    case ValueKind::tuple:
        return "tuple";
    case ValueKind::record:
        return "record";
    case ValueKind::structural:
        return "structural";
    }
    return "unknown";
}

class Value {
  public:
    using Storage =
        std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string,
                     std::chrono::nanoseconds, std::shared_ptr<Sequence>,
                     std::shared_ptr<Dictionary>, std::shared_ptr<Tuple>,
                     std::shared_ptr<Record>, std::shared_ptr<const StructurallyEquatable>>;

    Value() = default;
    Value(std::nullptr_t) {}
    explicit Value(bool value) : storage_(value) {}
    explicit Value(std::int64_t value) : storage_(value) {}
    explicit Value(std::uint64_t value) : storage_(value) {}
    explicit Value(double value) : storage_(value) {}
    explicit Value(std::string value) : storage_(std::move(value)) {}
    explicit Value(std::chrono::nanoseconds value) : storage_(value) {}
    explicit Value(std::shared_ptr<Sequence> node) : storage_(std::move(node)) {}
    explicit Value(std::shared_ptr<Dictionary> node) : storage_(std::move(node)) {}
    explicit Value(std::shared_ptr<Tuple> node) : storage_(std::move(node)) {}
    explicit Value(std::shared_ptr<Record> node) : storage_(std::move(node)) {}
    explicit Value(std::shared_ptr<const StructurallyEquatable> node)
        : storage_(std::move(node)) {}

    /// Convert any supported C++ value; see ValueBuilder for the accepted shapes
    template <typename T>
    static Value from(const T& value);

    static Value sequence(std::vector<Value> items, bool unordered = false);
    static Value dictionary(std::vector<std::pair<Value, Value>> entries);
    static Value tuple(std::vector<Value> items);
    static Value pair(Value first, Value second);
    static Value record(TypeDescriptor type, std::vector<std::pair<std::string, Value>> members,
                        std::vector<Value> attributes = {});

    ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }
    const Storage& storage() const { return storage_; }

    bool is_null() const { return kind() == ValueKind::null; }
    bool is_numeric() const {
        auto k = kind();
        return k == ValueKind::integer || k == ValueKind::unsigned_integer ||
               k == ValueKind::floating;
    }
    bool is_integral() const {
        return kind() == ValueKind::integer || kind() == ValueKind::unsigned_integer;
    }
    bool is_floating() const { return kind() == ValueKind::floating; }
    bool is_string() const { return kind() == ValueKind::string; }
    bool is_duration() const { return kind() == ValueKind::duration; }
    bool is_composite() const { return kind() >= ValueKind::sequence; }

    /// Address of the shared node for composites, nullptr for scalars
    const void* identity() const;

    bool as_bool() const { return std::get<bool>(storage_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(storage_); }
    std::uint64_t as_unsigned() const { return std::get<std::uint64_t>(storage_); }
    double as_double() const { return std::get<double>(storage_); }
    const std::string& as_string() const { return std::get<std::string>(storage_); }
    std::chrono::nanoseconds as_duration() const {
        return std::get<std::chrono::nanoseconds>(storage_);
    }

    /// Numeric value widened to double; precondition: is_numeric()
    double to_double() const;

    const Sequence& as_sequence() const { return *std::get<std::shared_ptr<Sequence>>(storage_); }
    const Dictionary& as_dictionary() const {
        return *std::get<std::shared_ptr<Dictionary>>(storage_);
    }
    const Tuple& as_tuple() const { return *std::get<std::shared_ptr<Tuple>>(storage_); }
    const Record& as_record() const { return *std::get<std::shared_ptr<Record>>(storage_); }
    const StructurallyEquatable& as_structural() const {
        return *std::get<std::shared_ptr<const StructurallyEquatable>>(storage_);
    }

    /// Same node without ownership; scalars are returned as they are
    ///
    /// Use it for the edge that closes a cycle so the graph is freed with its root. A
    /// back reference, and any sub-value reached through it, must not outlive the
    /// value that owns the node.
    Value back_reference() const;

    /// Mutable node access, used to assemble self-referential graphs
    std::shared_ptr<Sequence> sequence_node() const {
        return std::get<std::shared_ptr<Sequence>>(storage_);
    }
    std::shared_ptr<Record> record_node() const {
        return std::get<std::shared_ptr<Record>>(storage_);
    }

  private:
    Storage storage_;
};

enum class SequenceOrder { ordered, unordered };

struct Sequence {
    std::vector<Value> items;
    SequenceOrder order = SequenceOrder::ordered;
};

struct Dictionary {
    std::vector<std::pair<Value, Value>> entries;
};

enum class TupleFlavor { tuple, pair };

struct Tuple {
    std::vector<Value> items;
    TupleFlavor flavor = TupleFlavor::tuple;
};

struct Record {
    TypeDescriptor type;
    std::vector<std::pair<std::string, Value>> members;
    std::vector<Value> attributes;

    const Value* find_member(std::string_view name) const {
        for (const auto& [member_name, value] : members) {
            if (member_name == name) {
                return &value;
            }
        }
        return nullptr;
    }

    const Value* find_attribute(const TypeDescriptor& attribute_type) const {
        for (const auto& attribute : attributes) {
            if (attribute.kind() == ValueKind::record &&
                attribute.as_record().type == attribute_type) {
                return &attribute;
            }
        }
        return nullptr;
    }
};

/// Equality callback handed to structurally equatable values
class ElementComparer {
  public:
    virtual ~ElementComparer() = default;
    virtual bool equal(const Value& x, const Value& y) = 0;
};

/// User types that decide structural equality themselves
///
/// Implementations receive the engine's element comparer so nested values keep the
/// active tolerance and cycle guard. `elements()` lets a compare-as-collection pass
/// treat the value as a plain collection.
class StructurallyEquatable {
  public:
    virtual ~StructurallyEquatable() = default;

    virtual bool structurally_equals(const Value& other, ElementComparer& comparer) const = 0;

    virtual std::optional<std::vector<Value>> elements() const { return std::nullopt; }

    virtual std::string describe() const = 0;
};

inline const void* Value::identity() const {
    return std::visit(
        [](const auto& held) -> const void* {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<Held, std::shared_ptr<Sequence>> ||
                          std::is_same_v<Held, std::shared_ptr<Dictionary>> ||
                          std::is_same_v<Held, std::shared_ptr<Tuple>> ||
                          std::is_same_v<Held, std::shared_ptr<Record>> ||
                          std::is_same_v<Held, std::shared_ptr<const StructurallyEquatable>>) {
                return held.get();
            } else {
                return nullptr;
            }
        },
        storage_);
}

inline double Value::to_double() const {
    switch (kind()) {
    case ValueKind::integer:
        return static_cast<double>(as_integer());
    case ValueKind::unsigned_integer:
        return static_cast<double>(as_unsigned());
    default:
        return as_double();
    }
}

inline Value Value::sequence(std::vector<Value> items, bool unordered) {
    auto node = std::make_shared<Sequence>();
    node->items = std::move(items);
    node->order = unordered ? SequenceOrder::unordered : SequenceOrder::ordered;
    return Value(std::move(node));
}

inline Value Value::dictionary(std::vector<std::pair<Value, Value>> entries) {
    auto node = std::make_shared<Dictionary>();
    node->entries = std::move(entries);
    return Value(std::move(node));
}

inline Value Value::tuple(std::vector<Value> items) {
    auto node = std::make_shared<Tuple>();
    node->items = std::move(items);
    return Value(std::move(node));
}

inline Value Value::pair(Value first, Value second) {
    auto node = std::make_shared<Tuple>();
    node->items = {std::move(first), std::move(second)};
    node->flavor = TupleFlavor::pair;
    return Value(std::move(node));
}

inline Value Value::record(TypeDescriptor type, std::vector<std::pair<std::string, Value>> members,
                           std::vector<Value> attributes) {
    auto node = std::make_shared<Record>();
    node->type = std::move(type);
    node->members = std::move(members);
    node->attributes = std::move(attributes);
    return Value(std::move(node));
}

/// Named reference returned from a type's `members()` tuple
template <typename T>
struct NamedMember {
    std::string_view name;
    const T& value;
};

template <typename T>
NamedMember<T> member(std::string_view name, const T& value) {
    return {name, value};
}

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_shared_ptr : std::false_type {};
template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
struct is_unique_ptr : std::false_type {};
template <typename T, typename D>
struct is_unique_ptr<std::unique_ptr<T, D>> : std::true_type {};

template <typename T>
struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T>
struct is_duration : std::false_type {};
template <typename R, typename P>
struct is_duration<std::chrono::duration<R, P>> : std::true_type {};

template <typename T>
concept StringLike = std::convertible_to<const T&, std::string_view> && !std::same_as<T, std::nullptr_t>;

template <typename T>
concept HasMembers = requires(const T& value) { value.members(); };

template <typename T>
concept HasAttributes = requires(const T& value) { value.attributes(); };

template <typename T>
concept MapLike = std::ranges::range<const T> && requires {
    typename T::key_type;
    typename T::mapped_type;
};

template <typename T>
concept UnorderedLike = std::ranges::range<const T> && requires { typename T::hasher; };

template <typename T>
concept TupleLike = !std::ranges::range<const T> && requires { std::tuple_size<T>::value; };

template <typename>
inline constexpr bool unsupported_type = false;

} // namespace detail

/// Converts C++ values into Value graphs
///
inline Value Value::back_reference() const {
    Value result;
    result.storage_ = std::visit(
        [](const auto& held) -> Storage {
            using Held = std::decay_t<decltype(held)>;
            if constexpr (detail::is_shared_ptr<Held>::value) {
                return Held(Held(), held.get());
            } else {
                return held;
            }
        },
        storage_);
    return result;
}

/// Shared and raw pointees are converted once per address: a second visit to the same
/// pointee returns the node already built, so cyclic pointer graphs become cyclic value
/// graphs instead of recursing forever. A visit to a pointee whose node is still being
/// filled closes a cycle and gets a back reference, so the built graph has no owning
/// cycle.
class ValueBuilder {
  public:
    template <typename T>
    Value build(const T& value) {
        if constexpr (std::is_same_v<T, Value>) {
            return value;
        } else if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate>) {
            return Value{};
        } else if constexpr (std::is_same_v<T, bool>) {
            return Value(value);
        } else if constexpr (std::is_same_v<T, char>) {
            return Value(std::string(1, value));
        } else if constexpr (std::is_enum_v<T>) {
            return build(static_cast<std::underlying_type_t<T>>(value));
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            return Value(static_cast<std::int64_t>(value));
        } else if constexpr (std::is_integral_v<T>) {
            return Value(static_cast<std::uint64_t>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            return Value(static_cast<double>(value));
        } else if constexpr (detail::StringLike<T>) {
            return Value(std::string(std::string_view(value)));
        } else if constexpr (detail::is_duration<T>::value) {
            return Value(std::chrono::duration_cast<std::chrono::nanoseconds>(value));
        } else if constexpr (std::is_base_of_v<StructurallyEquatable, T>) {
            return Value(std::shared_ptr<const StructurallyEquatable>(std::make_shared<T>(value)));
        } else if constexpr (detail::is_optional<T>::value) {
            return value.has_value() ? build(*value) : Value{};
        } else if constexpr (detail::is_shared_ptr<T>::value || detail::is_unique_ptr<T>::value) {
            return value ? build_pointee(*value) : Value{};
        } else if constexpr (std::is_pointer_v<T>) {
            return value ? build_pointee(*value) : Value{};
        } else if constexpr (detail::HasMembers<T> || detail::MapLike<T> ||
                             std::ranges::range<const T> || detail::TupleLike<T>) {
            return build_composite(value);
        } else {
            static_assert(detail::unsupported_type<T>,
                          "type cannot be converted to assertlab::core::Value");
        }
    }

  private:
    template <typename T>
    Value build_pointee(const T& pointee) {
        const void* key = static_cast<const void*>(std::addressof(pointee));
        if (auto found = shared_nodes_.find(key); found != shared_nodes_.end()) {
            return in_progress_.contains(key) ? found->second.back_reference() : found->second;
        }
        if constexpr (detail::HasMembers<T> || detail::MapLike<T> ||
                      (std::ranges::range<const T> && !detail::StringLike<T>) ||
                      detail::TupleLike<T>) {
            in_progress_.insert(key);
            Value built = build_composite(pointee, key);
            in_progress_.erase(key);
            return built;
        } else {
            Value converted = build(pointee);
            shared_nodes_.emplace(key, converted);
            return converted;
        }
    }

    /// Allocate the node, register it under `key` when given, then fill it
    template <typename T>
    Value build_composite(const T& value, const void* key = nullptr) {
        if constexpr (detail::HasMembers<T>) {
            auto node = std::make_shared<Record>();
            Value result(node);
            remember(key, result);
            node->type = type_of<T>();
            std::apply(
                [&](const auto&... members) {
                    (node->members.emplace_back(std::string(members.name), build(members.value)),
                     ...);
                },
                value.members());
            if constexpr (detail::HasAttributes<T>) {
                std::apply(
                    [&](const auto&... attributes) {
                        (node->attributes.push_back(build(attributes)), ...);
                    },
                    value.attributes());
            }
            return result;
        } else if constexpr (detail::MapLike<T>) {
            auto node = std::make_shared<Dictionary>();
            Value result(node);
            remember(key, result);
            for (const auto& [entry_key, entry_value] : value) {
                node->entries.emplace_back(build(entry_key), build(entry_value));
            }
            return result;
        } else if constexpr (std::ranges::range<const T>) {
            auto node = std::make_shared<Sequence>();
            Value result(node);
            remember(key, result);
            if constexpr (detail::UnorderedLike<T>) {
                node->order = SequenceOrder::unordered;
            }
            for (const auto& item : value) {
                node->items.push_back(build(item));
            }
            return result;
        } else {
            auto node = std::make_shared<Tuple>();
            Value result(node);
            remember(key, result);
            if constexpr (detail::is_pair<T>::value) {
                node->flavor = TupleFlavor::pair;
            }
            std::apply([&](const auto&... items) { (node->items.push_back(build(items)), ...); },
                       value);
            return result;
        }
    }

    void remember(const void* key, const Value& value) {
        if (key != nullptr) {
            shared_nodes_.emplace(key, value);
        }
    }

    std::unordered_map<const void*, Value> shared_nodes_;
    std::unordered_set<const void*> in_progress_;
};

template <typename T>
Value Value::from(const T& value) {
    ValueBuilder builder;
    return builder.build(value);
}

} // namespace assertlab::core
