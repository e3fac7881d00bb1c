#pragma once

#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

namespace dcomp {

// Identifier marker for Druplet and AsyncCommand classes.
//
// A type carries an identifier when IdentifierTraits is specialized for it,
// which is what DCOMP_IDENTIFIER does. The primary template is empty: an
// unmarked type has no identifier, and the consumer falls back to the type's
// own name (see ResolveIdentifier in resolver.hpp).
//
// The marker is attached outside the annotated class, so it never changes the
// class itself, and it is not inherited by derived classes.
template <typename T>
struct IdentifierTraits {};

template <typename T>
concept HasIdentifier = requires {
  {
    IdentifierTraits<std::remove_cvref_t<T>>::kValue
  } -> std::convertible_to<std::string_view>;
};

// Returns the marker value of T, or nullopt when T is not marked.
template <typename T>
constexpr auto IdentifierOf() -> std::optional<std::string_view> {
  if constexpr (HasIdentifier<T>) {
    return std::string_view{IdentifierTraits<std::remove_cvref_t<T>>::kValue};
  } else {
    return std::nullopt;
  }
}

}  // namespace dcomp

// Attaches an identifier to a class. Use at global namespace scope, once per
// class, after the class is declared and before anything introspects it:
//
//   namespace app {
//   class ImportNodes { ... };
//   }  // namespace app
//   DCOMP_IDENTIFIER(app::ImportNodes, "import-nodes");
//
// Both arguments are required. A non-class target, an empty value or a second
// marker on the same class does not compile.
#define DCOMP_IDENTIFIER(type, value)                                        \
  template <>                                                                \
  struct dcomp::IdentifierTraits<type> {                                     \
    static_assert(                                                           \
        std::is_class_v<type>, "DCOMP_IDENTIFIER target must be a class");   \
    static constexpr std::string_view kValue = value;                        \
    static_assert(                                                           \
        !kValue.empty(), "DCOMP_IDENTIFIER value must not be empty");        \
  }
