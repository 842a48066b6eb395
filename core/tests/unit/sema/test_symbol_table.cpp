// tests/sema/test_symbol_table.cpp - Unit tests for the cross-file symbol table
//
// Exercises SymbolTable directly, without a parser: declaration, qualified
// and simple lookup, import bindings and scope queries.
//

#include <gtest/gtest.h>

#include <string>

#include "sysml/sema/symbols/symbol_table.hpp"

using namespace sysml;

// ============================================================================
// Test Helper
// ============================================================================

static Symbol make_symbol(
  SymbolKind kind, std::string name, ScopeId scope = k_root_scope, uint32_t at = 0)
{
  Symbol sym;
  sym.kind = kind;
  sym.simple_name = std::move(name);
  sym.scope = scope;
  sym.source_file = FileId{0};
  sym.source_span = SourceRange(FileId{0}, at, at + static_cast<uint32_t>(sym.simple_name.size()));
  sym.decl_range = SourceRange(FileId{0}, at, at + 100);
  return sym;
}

static SymbolId declare_ok(SymbolTable & table, Symbol sym)
{
  const DeclareResult r = table.declare(std::move(sym));
  EXPECT_TRUE(r.ok());
  return r.id;
}

// ============================================================================
// Declaration
// ============================================================================

TEST(SemaSymbolTable, QualifiedNameFollowsScopeChain)
{
  SymbolTable table;
  const SymbolId pkg = declare_ok(table, make_symbol(SymbolKind::Package, "Vehicles"));
  const ScopeId pkg_scope = table.get(pkg).body_scope;
  const SymbolId car = declare_ok(table, make_symbol(SymbolKind::Definition, "Car", pkg_scope));
  const SymbolId engine =
    declare_ok(table, make_symbol(SymbolKind::Usage, "engine", table.get(car).body_scope));

  EXPECT_EQ(table.get(pkg).qualified_name, "Vehicles");
  EXPECT_EQ(table.get(car).qualified_name, "Vehicles::Car");
  EXPECT_EQ(table.get(engine).qualified_name, "Vehicles::Car::engine");
  EXPECT_EQ(table.get_scope(table.get(car).body_scope).qualified_name, "Vehicles::Car");
}

TEST(SemaSymbolTable, LookupQualifiedReturnsEveryDeclaredSymbol)
{
  SymbolTable table;
  const SymbolId a = declare_ok(table, make_symbol(SymbolKind::Package, "A"));
  const ScopeId a_scope = table.get(a).body_scope;
  declare_ok(table, make_symbol(SymbolKind::Definition, "B", a_scope));
  declare_ok(table, make_symbol(SymbolKind::Definition, "C", a_scope));
  declare_ok(table, make_symbol(SymbolKind::Usage, "d"));

  for (SymbolId id = 0; id < table.size(); ++id) {
    const Symbol & sym = table.get(id);
    const Symbol * found = table.lookup_qualified(sym.qualified_name);
    ASSERT_NE(found, nullptr) << sym.qualified_name;
    EXPECT_EQ(found, &sym);
  }
  EXPECT_EQ(table.lookup_qualified("A::Missing"), nullptr);
}

TEST(SemaSymbolTable, DuplicateKeepsFirstDeclaration)
{
  SymbolTable table;
  const SymbolId first = declare_ok(table, make_symbol(SymbolKind::Definition, "Engine", 0, 10));

  const DeclareResult second = table.declare(make_symbol(SymbolKind::Usage, "Engine", 0, 50));
  EXPECT_FALSE(second.ok());
  EXPECT_EQ(second.conflict, first);
  EXPECT_EQ(table.size(), 1U);

  const Symbol * sym = table.lookup_qualified("Engine");
  ASSERT_NE(sym, nullptr);
  EXPECT_EQ(sym->kind, SymbolKind::Definition);
  EXPECT_EQ(sym->source_span.get_begin().offset(), 10U);
}

TEST(SemaSymbolTable, GenuineDeclarationSupersedesAlias)
{
  SymbolTable table;
  Symbol alias = make_symbol(SymbolKind::Alias, "Car");
  alias.alias_target = "Vehicle";
  const SymbolId alias_id = declare_ok(table, std::move(alias));
  EXPECT_EQ(table.get(alias_id).body_scope, k_invalid_scope);

  const DeclareResult def = table.declare(make_symbol(SymbolKind::Definition, "Car"));
  ASSERT_TRUE(def.ok());
  EXPECT_EQ(def.id, alias_id);
  EXPECT_EQ(table.get(alias_id).kind, SymbolKind::Definition);
  EXPECT_NE(table.get(alias_id).body_scope, k_invalid_scope);

  // A second alias never replaces the definition
  Symbol again = make_symbol(SymbolKind::Alias, "Car");
  again.alias_target = "Other";
  EXPECT_FALSE(table.declare(std::move(again)).ok());
}

TEST(SemaSymbolTable, DerivedFlagsAreSetOnce)
{
  SymbolTable table;
  const SymbolId id = declare_ok(table, make_symbol(SymbolKind::Definition, "Base"));

  EXPECT_TRUE(table.set_derived_flags(id, true, false));
  EXPECT_TRUE(table.get(id).is_abstract);
  EXPECT_FALSE(table.set_derived_flags(id, false, true));
  EXPECT_TRUE(table.get(id).is_abstract);
  EXPECT_FALSE(table.get(id).is_variation);
}

// ============================================================================
// Simple-name lookup
// ============================================================================

TEST(SemaSymbolTable, SimpleLookupWalksAncestors)
{
  SymbolTable table;
  const SymbolId pkg = declare_ok(table, make_symbol(SymbolKind::Package, "P"));
  const ScopeId pkg_scope = table.get(pkg).body_scope;
  const SymbolId wheel = declare_ok(table, make_symbol(SymbolKind::Definition, "Wheel", pkg_scope));
  const SymbolId car = declare_ok(table, make_symbol(SymbolKind::Definition, "Car", pkg_scope));

  const SimpleLookup r = table.lookup_simple("Wheel", table.get(car).body_scope);
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.symbol, wheel);
}

TEST(SemaSymbolTable, InnerDeclarationShadowsOuter)
{
  SymbolTable table;
  const SymbolId outer = declare_ok(table, make_symbol(SymbolKind::Definition, "mass"));
  const SymbolId car = declare_ok(table, make_symbol(SymbolKind::Definition, "Car"));
  const SymbolId inner =
    declare_ok(table, make_symbol(SymbolKind::Usage, "mass", table.get(car).body_scope));

  EXPECT_EQ(table.lookup_simple("mass", table.get(car).body_scope).symbol, inner);
  EXPECT_EQ(table.lookup_simple("mass", k_root_scope).symbol, outer);
}

TEST(SemaSymbolTable, GlobalFallbackRequiresUniqueName)
{
  SymbolTable table;
  const SymbolId a = declare_ok(table, make_symbol(SymbolKind::Package, "A"));
  const SymbolId b = declare_ok(table, make_symbol(SymbolKind::Package, "B"));
  const SymbolId unique =
    declare_ok(table, make_symbol(SymbolKind::Definition, "Unique", table.get(a).body_scope));
  declare_ok(table, make_symbol(SymbolKind::Definition, "Twice", table.get(a).body_scope));
  declare_ok(table, make_symbol(SymbolKind::Definition, "Twice", table.get(b).body_scope));

  const SimpleLookup found = table.lookup_simple("Unique", k_root_scope);
  ASSERT_TRUE(found.found());
  EXPECT_EQ(found.symbol, unique);

  const SimpleLookup ambiguous = table.lookup_simple("Twice", k_root_scope);
  EXPECT_EQ(ambiguous.status, LookupStatus::Ambiguous);
  EXPECT_EQ(ambiguous.candidates.size(), 2U);

  EXPECT_EQ(table.lookup_simple("Nothing", k_root_scope).status, LookupStatus::NotFound);
}

// ============================================================================
// Import bindings
// ============================================================================

TEST(SemaSymbolTable, LocalDeclarationShadowsImport)
{
  SymbolTable table;
  const SymbolId lib = declare_ok(table, make_symbol(SymbolKind::Package, "Lib"));
  const SymbolId imported =
    declare_ok(table, make_symbol(SymbolKind::Definition, "Part", table.get(lib).body_scope));
  const SymbolId user = declare_ok(table, make_symbol(SymbolKind::Package, "User"));
  const ScopeId user_scope = table.get(user).body_scope;
  const SymbolId local = declare_ok(table, make_symbol(SymbolKind::Definition, "Part", user_scope));

  EXPECT_EQ(
    table.bind_import(user_scope, "Part", imported, ImportKind::Member, false, false),
    BindResult::Shadowed);
  EXPECT_EQ(table.lookup_simple("Part", user_scope).symbol, local);
}

TEST(SemaSymbolTable, ImportBindingIsNeverOverwritten)
{
  SymbolTable table;
  const SymbolId a = declare_ok(table, make_symbol(SymbolKind::Package, "A"));
  const SymbolId b = declare_ok(table, make_symbol(SymbolKind::Package, "B"));
  const SymbolId from_a =
    declare_ok(table, make_symbol(SymbolKind::Definition, "X", table.get(a).body_scope));
  const SymbolId from_b =
    declare_ok(table, make_symbol(SymbolKind::Definition, "X", table.get(b).body_scope));
  const SymbolId user = declare_ok(table, make_symbol(SymbolKind::Package, "User"));
  const ScopeId scope = table.get(user).body_scope;

  EXPECT_EQ(
    table.bind_import(scope, "X", from_a, ImportKind::Member, false, false), BindResult::Added);
  EXPECT_EQ(
    table.bind_import(scope, "X", from_b, ImportKind::Namespace, false, true),
    BindResult::AlreadyBound);

  const SimpleLookup r = table.lookup_simple("X", scope);
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.symbol, from_a);
}

TEST(SemaSymbolTable, WildcardCollisionIsAmbiguousAtUse)
{
  SymbolTable table;
  const SymbolId a = declare_ok(table, make_symbol(SymbolKind::Package, "A"));
  const SymbolId b = declare_ok(table, make_symbol(SymbolKind::Package, "B"));
  const SymbolId from_a =
    declare_ok(table, make_symbol(SymbolKind::Definition, "X", table.get(a).body_scope));
  const SymbolId from_b =
    declare_ok(table, make_symbol(SymbolKind::Definition, "X", table.get(b).body_scope));
  const SymbolId user = declare_ok(table, make_symbol(SymbolKind::Package, "User"));
  const ScopeId scope = table.get(user).body_scope;

  EXPECT_EQ(
    table.bind_import(scope, "X", from_a, ImportKind::Namespace, false, true), BindResult::Added);
  EXPECT_EQ(
    table.bind_import(scope, "X", from_b, ImportKind::Namespace, false, true),
    BindResult::Ambiguous);
  EXPECT_EQ(
    table.bind_import(scope, "X", from_b, ImportKind::Namespace, false, true),
    BindResult::AlreadyBound);

  const SimpleLookup r = table.lookup_simple("X", scope);
  EXPECT_EQ(r.status, LookupStatus::Ambiguous);
  EXPECT_EQ(r.candidates.size(), 2U);
}

TEST(SemaSymbolTable, FindMemberSeesOnlyPublicImports)
{
  SymbolTable table;
  const SymbolId lib = declare_ok(table, make_symbol(SymbolKind::Package, "Lib"));
  const SymbolId x =
    declare_ok(table, make_symbol(SymbolKind::Definition, "X", table.get(lib).body_scope));
  const SymbolId y =
    declare_ok(table, make_symbol(SymbolKind::Definition, "Y", table.get(lib).body_scope));
  const SymbolId facade = declare_ok(table, make_symbol(SymbolKind::Package, "Facade"));
  const ScopeId scope = table.get(facade).body_scope;

  (void)table.bind_import(scope, "X", x, ImportKind::Member, true, false);
  (void)table.bind_import(scope, "Y", y, ImportKind::Member, false, false);

  EXPECT_EQ(table.find_member(scope, "X"), x);
  EXPECT_FALSE(table.find_member(scope, "Y").has_value());
  EXPECT_FALSE(table.find_member(scope, "X", false).has_value());
}

// ============================================================================
// Scopes
// ============================================================================

TEST(SemaSymbolTable, FindNamespaceAndChildScopes)
{
  SymbolTable table;
  const SymbolId pkg = declare_ok(table, make_symbol(SymbolKind::Package, "Pkg"));
  const SymbolId sub =
    declare_ok(table, make_symbol(SymbolKind::Package, "Sub", table.get(pkg).body_scope));
  declare_ok(table, make_symbol(SymbolKind::Definition, "X", table.get(sub).body_scope));

  EXPECT_EQ(table.find_namespace(""), k_root_scope);
  EXPECT_EQ(table.find_namespace("Pkg"), table.get(pkg).body_scope);
  EXPECT_FALSE(table.find_namespace("Nope").has_value());

  const auto & below = table.get_scope(table.get(pkg).body_scope).children;
  ASSERT_EQ(below.size(), 1U);
  EXPECT_EQ(below[0], table.get(sub).body_scope);
  EXPECT_EQ(table.get_scope(below[0]).qualified_name, "Pkg::Sub");
}

TEST(SemaSymbolTable, ScopeAtPicksInnermostDeclaration)
{
  SymbolTable table;
  Symbol outer = make_symbol(SymbolKind::Package, "Outer", k_root_scope, 0);
  outer.decl_range = SourceRange(FileId{0}, 0, 200);
  const SymbolId o = declare_ok(table, std::move(outer));

  Symbol inner = make_symbol(SymbolKind::Definition, "Inner", table.get(o).body_scope, 20);
  inner.decl_range = SourceRange(FileId{0}, 20, 80);
  const SymbolId i = declare_ok(table, std::move(inner));

  EXPECT_EQ(table.scope_at(FileId{0}, 50), table.get(i).body_scope);
  EXPECT_EQ(table.scope_at(FileId{0}, 150), table.get(o).body_scope);
  EXPECT_EQ(table.scope_at(FileId{0}, 500), k_root_scope);
  EXPECT_EQ(table.scope_at(FileId{1}, 50), k_root_scope);
}

TEST(SemaSymbolTable, AllSymbolsKeepInsertionOrder)
{
  SymbolTable table;
  declare_ok(table, make_symbol(SymbolKind::Definition, "Zeta"));
  declare_ok(table, make_symbol(SymbolKind::Definition, "Alpha"));
  declare_ok(table, make_symbol(SymbolKind::Definition, "Mid"));

  const auto & all = table.all_symbols();
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[0].simple_name, "Zeta");
  EXPECT_EQ(all[1].simple_name, "Alpha");
  EXPECT_EQ(all[2].simple_name, "Mid");
}
