#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/node_hash_map.h"
#include "dcomp/common/diagnostic.hpp"
#include "dcomp/identifier/identifier.hpp"

namespace dcomp {

struct RegistryEntry {
  std::type_index type;
  std::string identifier;
  std::string type_name;
  std::string qualified_type_name;
  // True when the identifier comes from DCOMP_IDENTIFIER, false when it is
  // the type name.
  bool declared;

  auto operator==(const RegistryEntry&) const -> bool = default;
};

// Runtime lookup table between registered types and their identifiers.
// Each type and each identifier appears at most once. Entries returned by
// Find stay valid for the lifetime of the registry. Not thread-safe; populate
// it during start-up.
class IdentifierRegistry {
 public:
  IdentifierRegistry() = default;
  ~IdentifierRegistry() = default;

  IdentifierRegistry(const IdentifierRegistry&) = delete;
  auto operator=(const IdentifierRegistry&) -> IdentifierRegistry& = delete;

  IdentifierRegistry(IdentifierRegistry&&) = default;
  auto operator=(IdentifierRegistry&&) -> IdentifierRegistry& = default;

  template <typename T>
  auto Register() -> Result<RegistryEntry> {
    std::optional<std::string> declared;
    if (auto value = IdentifierOf<T>()) {
      declared = std::string(*value);
    }
    return Register(std::type_index(typeid(T)), std::move(declared));
  }

  // Register a type by its type_index. declared_identifier is the marker value
  // if the type carries one; otherwise the type name is used.
  auto Register(
      std::type_index type, std::optional<std::string> declared_identifier)
      -> Result<RegistryEntry>;

  [[nodiscard]] auto Find(std::type_index type) const -> const RegistryEntry*;

  template <typename T>
  [[nodiscard]] auto Find() const -> const RegistryEntry* {
    return Find(std::type_index(typeid(T)));
  }

  [[nodiscard]] auto FindByIdentifier(std::string_view identifier) const
      -> const RegistryEntry*;

  [[nodiscard]] auto Resolve(std::type_index type) const
      -> std::optional<std::string>;

  // All entries ordered by identifier.
  [[nodiscard]] auto Entries() const -> std::vector<RegistryEntry>;

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

 private:
  absl::node_hash_map<std::type_index, RegistryEntry> entries_;
  absl::flat_hash_map<std::string, std::type_index> by_identifier_;
};

}  // namespace dcomp
