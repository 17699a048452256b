#pragma once

// =============================================================================
// Serialization - fields()-driven reading and writing of archives
// =============================================================================
//
// A type takes part by listing its members:
//
//   struct worker_config_t {
//       int lanes = 0;
//       int batch_size = 0;
//
//       auto fields() const {
//           return std::make_tuple(field("lanes", lanes), field("batch_size", batch_size));
//       }
//       auto fields() {
//           return std::make_tuple(field("lanes", lanes), field("batch_size", batch_size));
//       }
//   };
//
// deserialize() returns false when a named field is absent; the member then
// keeps its default.
//
// =============================================================================

#include <concepts>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace fanout {

// =============================================================================
// Field wrapper for named serialization
// =============================================================================

template<typename T>
struct field_t {
    const char* name;
    T& value;
};

template<typename T>
constexpr field_t<T> field(const char* name, T& value) {
    return field_t<T>{name, value};
}

template<typename T>
constexpr field_t<const T> field(const char* name, const T& value) {
    return field_t<const T>{name, value};
}

// =============================================================================
// Concepts
// =============================================================================

template<typename T>
concept HasFields = requires(T t) {
    { t.fields() } -> std::same_as<decltype(t.fields())>;
};

template<typename T>
concept HasConstFields = requires(const T t) {
    { t.fields() } -> std::same_as<decltype(t.fields())>;
};

template<typename A>
concept ArchiveWriter = requires(A& ar, const char* name) {
    { ar.begin_named(name) } -> std::same_as<void>;
    { ar.write(int{}) } -> std::same_as<void>;
    { ar.write(double{}) } -> std::same_as<void>;
    { ar.write(std::string{}) } -> std::same_as<void>;
    { ar.begin_group() } -> std::same_as<void>;
    { ar.end_group() } -> std::same_as<void>;
    { ar.begin_list() } -> std::same_as<void>;
    { ar.end_list() } -> std::same_as<void>;
};

template<typename A>
concept ArchiveReader = requires(A& ar, const char* name, int& i, double& d, std::string& s) {
    { ar.begin_named(name) } -> std::same_as<void>;
    { ar.read(i) } -> std::same_as<bool>;
    { ar.read(d) } -> std::same_as<bool>;
    { ar.read(s) } -> std::same_as<bool>;
    { ar.begin_group() } -> std::same_as<bool>;
    { ar.end_group() } -> std::same_as<void>;
    { ar.begin_list() } -> std::same_as<bool>;
    { ar.end_list() } -> std::same_as<void>;
    { ar.has_field(name) } -> std::same_as<bool>;
};

// =============================================================================
// Declarations (two-arg: anonymous, three-arg: named)
// =============================================================================

template<ArchiveWriter A, typename T>
void serialize(A& ar, const char* name, const T& value);

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const T& value);

template<ArchiveWriter A>
void serialize(A& ar, const std::string& value);

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const std::vector<T>& value);

template<ArchiveWriter A, typename T>
    requires (!std::is_arithmetic_v<T>)
void serialize(A& ar, const std::vector<T>& value);

template<ArchiveWriter A, typename T>
    requires HasConstFields<T>
void serialize(A& ar, const T& value);

template<ArchiveReader A, typename T>
auto deserialize(A& ar, const char* name, T& value) -> bool;

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, T& value) -> bool;

template<ArchiveReader A>
auto deserialize(A& ar, std::string& value) -> bool;

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, std::vector<T>& value) -> bool;

template<ArchiveReader A, typename T>
    requires (!std::is_arithmetic_v<T>)
auto deserialize(A& ar, std::vector<T>& value) -> bool;

template<ArchiveReader A, typename T>
    requires HasFields<T>
auto deserialize(A& ar, T& value) -> bool;

// =============================================================================
// Named wrappers
// =============================================================================

template<ArchiveWriter A, typename T>
void serialize(A& ar, const char* name, const T& value) {
    ar.begin_named(name);
    serialize(ar, value);
}

template<ArchiveReader A, typename T>
auto deserialize(A& ar, const char* name, T& value) -> bool {
    ar.begin_named(name);
    return deserialize(ar, value);
}

// =============================================================================
// Serialize implementations
// =============================================================================

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const T& value) {
    ar.write(value);
}

template<ArchiveWriter A>
void serialize(A& ar, const std::string& value) {
    ar.write(value);
}

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const std::vector<T>& value) {
    ar.write(value);
}

template<ArchiveWriter A, typename T>
    requires (!std::is_arithmetic_v<T>)
void serialize(A& ar, const std::vector<T>& value) {
    ar.begin_list();
    for (const auto& elem : value) {
        serialize(ar, elem);
    }
    ar.end_list();
}

template<ArchiveWriter A, typename T>
    requires HasConstFields<T>
void serialize(A& ar, const T& value) {
    ar.begin_group();
    std::apply([&ar](auto&&... fields) {
        (serialize(ar, fields.name, fields.value), ...);
    }, value.fields());
    ar.end_group();
}

// =============================================================================
// Deserialize implementations
// =============================================================================

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, T& value) -> bool {
    return ar.read(value);
}

template<ArchiveReader A>
auto deserialize(A& ar, std::string& value) -> bool {
    return ar.read(value);
}

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, std::vector<T>& value) -> bool {
    return ar.read(value);
}

// Elements are read until the list's closing brace
template<ArchiveReader A, typename T>
    requires (!std::is_arithmetic_v<T>)
auto deserialize(A& ar, std::vector<T>& value) -> bool {
    if (!ar.begin_list()) return false;
    value.clear();
    while (true) {
        T elem;
        if (!deserialize(ar, elem)) break;
        value.push_back(std::move(elem));
    }
    ar.end_list();
    return true;
}

template<ArchiveReader A, typename T>
    requires HasFields<T>
auto deserialize(A& ar, T& value) -> bool {
    if (!ar.begin_group()) return false;
    std::apply([&ar](auto&&... fields) {
        (deserialize(ar, fields.name, fields.value), ...);
    }, value.fields());
    ar.end_group();
    return true;
}

} // namespace fanout
