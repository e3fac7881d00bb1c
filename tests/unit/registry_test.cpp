#include <gtest/gtest.h>

#include <string>
#include <typeindex>
#include <typeinfo>

#include "dcomp/common/diagnostic.hpp"
#include "dcomp/identifier/registry.hpp"

namespace registry_test {

class ImportNodes {};
class ExportNodes {};
class Alpha {};
class Beta {};
class Gamma {};
class Impostor {};
class LowerCase {};
class UpperCase {};

template <int N>
class Filler {};

}  // namespace registry_test

DCOMP_IDENTIFIER(registry_test::ImportNodes, "import-nodes");
DCOMP_IDENTIFIER(registry_test::Alpha, "shared");
DCOMP_IDENTIFIER(registry_test::Beta, "shared");
// Claims the name another, unmarked type resolves to.
DCOMP_IDENTIFIER(registry_test::Impostor, "Gamma");
DCOMP_IDENTIFIER(registry_test::LowerCase, "case");
DCOMP_IDENTIFIER(registry_test::UpperCase, "Case");

namespace dcomp {
namespace {

using registry_test::Alpha;
using registry_test::Beta;
using registry_test::ExportNodes;
using registry_test::Filler;
using registry_test::Gamma;
using registry_test::ImportNodes;
using registry_test::Impostor;
using registry_test::LowerCase;
using registry_test::UpperCase;

class RegistryTest : public ::testing::Test {
 protected:
  IdentifierRegistry registry_;
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(RegistryTest, RegisterMarkedType) {
  auto entry = registry_.Register<ImportNodes>();
  ASSERT_TRUE(entry.has_value()) << entry.error().primary.message;
  EXPECT_EQ(entry->identifier, "import-nodes");
  EXPECT_EQ(entry->type_name, "ImportNodes");
  EXPECT_EQ(entry->qualified_type_name, "registry_test::ImportNodes");
  EXPECT_TRUE(entry->declared);
  EXPECT_EQ(entry->type, std::type_index(typeid(ImportNodes)));
  EXPECT_EQ(registry_.Size(), 1);
}

TEST_F(RegistryTest, RegisterUnmarkedTypeUsesTypeName) {
  auto entry = registry_.Register<ExportNodes>();
  ASSERT_TRUE(entry.has_value()) << entry.error().primary.message;
  EXPECT_EQ(entry->identifier, "ExportNodes");
  EXPECT_FALSE(entry->declared);
}

TEST_F(RegistryTest, RegisterByTypeIndex) {
  auto entry = registry_.Register(
      std::type_index(typeid(ExportNodes)), std::string("export"));
  ASSERT_TRUE(entry.has_value()) << entry.error().primary.message;
  EXPECT_EQ(entry->identifier, "export");
  EXPECT_TRUE(entry->declared);
  EXPECT_EQ(
      registry_.FindByIdentifier("export"), registry_.Find<ExportNodes>());
}

TEST_F(RegistryTest, EmptyDeclaredIdentifierFails) {
  auto entry =
      registry_.Register(std::type_index(typeid(ImportNodes)), std::string());
  ASSERT_FALSE(entry.has_value());
  EXPECT_EQ(entry.error().primary.kind, DiagKind::kError);
  EXPECT_NE(
      entry.error().primary.message.find("must not be empty"),
      std::string::npos);
  EXPECT_NE(
      entry.error().primary.message.find("registry_test::ImportNodes"),
      std::string::npos);
  EXPECT_EQ(registry_.Size(), 0);
  EXPECT_EQ(registry_.FindByIdentifier(""), nullptr);
}

TEST_F(RegistryTest, RegisteringTypeTwiceFails) {
  ASSERT_TRUE(registry_.Register<ImportNodes>().has_value());

  auto again = registry_.Register<ImportNodes>();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().primary.kind, DiagKind::kError);
  EXPECT_NE(
      again.error().primary.message.find("already registered"),
      std::string::npos);
  ASSERT_EQ(again.error().notes.size(), 1);
  EXPECT_NE(
      again.error().notes[0].message.find("import-nodes"), std::string::npos);
  EXPECT_EQ(registry_.Size(), 1);
}

TEST_F(RegistryTest, DeclaredIdentifierCollisionFails) {
  ASSERT_TRUE(registry_.Register<Alpha>().has_value());

  auto collision = registry_.Register<Beta>();
  ASSERT_FALSE(collision.has_value());
  EXPECT_NE(
      collision.error().primary.message.find("'shared'"), std::string::npos);
  ASSERT_EQ(collision.error().notes.size(), 1);
  EXPECT_NE(
      collision.error().notes[0].message.find("registry_test::Alpha"),
      std::string::npos);

  // Failed registration leaves the registry untouched.
  EXPECT_EQ(registry_.Size(), 1);
  EXPECT_EQ(registry_.Find<Beta>(), nullptr);
  const auto* owner = registry_.FindByIdentifier("shared");
  ASSERT_NE(owner, nullptr);
  EXPECT_EQ(owner->type, std::type_index(typeid(Alpha)));
}

TEST_F(RegistryTest, DeclaredIdentifierMayNotShadowTypeName) {
  ASSERT_TRUE(registry_.Register<Gamma>().has_value());
  EXPECT_FALSE(registry_.Register<Impostor>().has_value());
}

TEST_F(RegistryTest, TypeNameMayNotShadowDeclaredIdentifier) {
  ASSERT_TRUE(registry_.Register<Impostor>().has_value());
  EXPECT_FALSE(registry_.Register<Gamma>().has_value());
}

TEST_F(RegistryTest, IdentifiersAreCaseSensitive) {
  EXPECT_TRUE(registry_.Register<LowerCase>().has_value());
  EXPECT_TRUE(registry_.Register<UpperCase>().has_value());
  EXPECT_EQ(registry_.Size(), 2);
}

// =============================================================================
// Lookup
// =============================================================================

TEST_F(RegistryTest, FindByType) {
  ASSERT_TRUE(registry_.Register<ImportNodes>().has_value());

  const auto* entry = registry_.Find<ImportNodes>();
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->identifier, "import-nodes");
  EXPECT_EQ(registry_.Find(std::type_index(typeid(ImportNodes))), entry);
}

TEST_F(RegistryTest, FindByIdentifier) {
  ASSERT_TRUE(registry_.Register<ImportNodes>().has_value());
  ASSERT_TRUE(registry_.Register<ExportNodes>().has_value());

  const auto* entry = registry_.FindByIdentifier("ExportNodes");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->type, std::type_index(typeid(ExportNodes)));
}

TEST_F(RegistryTest, LookupOfUnknownReturnsNothing) {
  EXPECT_EQ(registry_.Find<ImportNodes>(), nullptr);
  EXPECT_EQ(registry_.FindByIdentifier("import-nodes"), nullptr);
  EXPECT_FALSE(registry_.Resolve(std::type_index(typeid(ImportNodes))));
}

TEST_F(RegistryTest, ResolveRegisteredType) {
  ASSERT_TRUE(registry_.Register<ImportNodes>().has_value());
  ASSERT_TRUE(registry_.Register<ExportNodes>().has_value());

  EXPECT_EQ(
      registry_.Resolve(std::type_index(typeid(ImportNodes))), "import-nodes");
  EXPECT_EQ(
      registry_.Resolve(std::type_index(typeid(ExportNodes))), "ExportNodes");
}

TEST_F(RegistryTest, EntriesAreSortedByIdentifier) {
  ASSERT_TRUE(registry_.Register<ImportNodes>().has_value());
  ASSERT_TRUE(registry_.Register<ExportNodes>().has_value());
  ASSERT_TRUE(registry_.Register<Alpha>().has_value());

  auto entries = registry_.Entries();
  ASSERT_EQ(entries.size(), 3);
  EXPECT_EQ(entries[0].identifier, "ExportNodes");
  EXPECT_EQ(entries[1].identifier, "import-nodes");
  EXPECT_EQ(entries[2].identifier, "shared");
}

TEST_F(RegistryTest, EntriesStayValidWhileRegistryGrows) {
  ASSERT_TRUE(registry_.Register<ImportNodes>().has_value());
  const auto* entry = registry_.Find<ImportNodes>();
  ASSERT_NE(entry, nullptr);

  ASSERT_TRUE(registry_.Register<Filler<0>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<1>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<2>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<3>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<4>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<5>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<6>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<7>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<8>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<9>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<10>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<11>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<12>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<13>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<14>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<15>>().has_value());
  ASSERT_TRUE(registry_.Register<Filler<16>>().has_value());

  EXPECT_EQ(registry_.Find<ImportNodes>(), entry);
  EXPECT_EQ(entry->identifier, "import-nodes");
  EXPECT_EQ(registry_.Size(), 18);
}

}  // namespace
}  // namespace dcomp
