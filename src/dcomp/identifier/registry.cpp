#include "dcomp/identifier/registry.hpp"

#include <algorithm>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include "dcomp/common/diagnostic.hpp"
#include "dcomp/common/logging.hpp"
#include "dcomp/identifier/type_name.hpp"

namespace dcomp {

auto IdentifierRegistry::Register(
    std::type_index type, std::optional<std::string> declared_identifier)
    -> Result<RegistryEntry> {
  RegistryEntry entry{
      .type = type,
      .identifier = {},
      .type_name = TypeName(type),
      .qualified_type_name = QualifiedTypeName(type),
      .declared = declared_identifier.has_value(),
  };
  entry.identifier = declared_identifier ? std::move(*declared_identifier)
                                         : entry.type_name;

  if (entry.declared && entry.identifier.empty()) {
    return std::unexpected(
        Diagnostic::Error(
            std::format(
                "declared identifier of type '{}' must not be empty",
                entry.qualified_type_name)));
  }

  if (const auto* existing = Find(type)) {
    logging::Logger()->warn(
        "type '{}' registered twice", entry.qualified_type_name);
    return std::unexpected(
        Diagnostic::Error(
            std::format(
                "type '{}' is already registered",
                entry.qualified_type_name))
            .WithNote(
                std::format(
                    "registered under identifier '{}'", existing->identifier)));
  }

  if (const auto* owner = FindByIdentifier(entry.identifier)) {
    logging::Logger()->warn(
        "identifier '{}' claimed by '{}' and '{}'", entry.identifier,
        owner->qualified_type_name, entry.qualified_type_name);
    return std::unexpected(
        Diagnostic::Error(
            std::format(
                "identifier '{}' of type '{}' is already used",
                entry.identifier, entry.qualified_type_name))
            .WithNote(
                std::format(
                    "previously registered by '{}'",
                    owner->qualified_type_name)));
  }

  logging::Logger()->debug(
      "registered '{}' as '{}' ({})", entry.qualified_type_name,
      entry.identifier, entry.declared ? "declared" : "type name");
  by_identifier_.emplace(entry.identifier, type);
  entries_.emplace(type, entry);
  return entry;
}

auto IdentifierRegistry::Find(std::type_index type) const
    -> const RegistryEntry* {
  auto it = entries_.find(type);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto IdentifierRegistry::FindByIdentifier(std::string_view identifier) const
    -> const RegistryEntry* {
  auto it = by_identifier_.find(identifier);
  if (it == by_identifier_.end()) {
    return nullptr;
  }
  return Find(it->second);
}

auto IdentifierRegistry::Resolve(std::type_index type) const
    -> std::optional<std::string> {
  if (const auto* entry = Find(type)) {
    return entry->identifier;
  }
  return std::nullopt;
}

auto IdentifierRegistry::Entries() const -> std::vector<RegistryEntry> {
  std::vector<RegistryEntry> result;
  result.reserve(entries_.size());
  for (const auto& [type, entry] : entries_) {
    result.push_back(entry);
  }
  std::ranges::sort(result, {}, &RegistryEntry::identifier);
  return result;
}

}  // namespace dcomp
