#pragma once

#include <string>

#include "dcomp/identifier/identifier.hpp"
#include "dcomp/identifier/type_name.hpp"

namespace dcomp {

// Identifier of T: the DCOMP_IDENTIFIER value when T is marked, otherwise the
// unqualified name of T.
template <typename T>
auto ResolveIdentifier() -> std::string {
  if constexpr (HasIdentifier<T>) {
    return std::string(*IdentifierOf<T>());
  } else {
    return TypeName<T>();
  }
}

}  // namespace dcomp
