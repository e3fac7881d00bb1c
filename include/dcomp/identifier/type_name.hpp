#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace dcomp {

// Demangle an ABI type name. Names the runtime demangler rejects are returned
// unchanged.
auto Demangle(const char* mangled) -> std::string;

// Strip namespace and enclosing-class qualifiers that appear outside template
// argument lists:
//   app::Outer::Inner            -> Inner
//   app::Box<std::string>        -> Box<std::string>
//   (anonymous namespace)::Foo   -> Foo
auto SimpleName(std::string_view qualified) -> std::string_view;

// Fully qualified, demangled name of a type.
auto QualifiedTypeName(std::type_index type) -> std::string;

// Unqualified, demangled name of a type. This is the identifier a type
// resolves to when it carries no marker.
auto TypeName(std::type_index type) -> std::string;

template <typename T>
auto QualifiedTypeName() -> std::string {
  return QualifiedTypeName(std::type_index(typeid(std::remove_cvref_t<T>)));
}

template <typename T>
auto TypeName() -> std::string {
  return TypeName(std::type_index(typeid(std::remove_cvref_t<T>)));
}

}  // namespace dcomp
