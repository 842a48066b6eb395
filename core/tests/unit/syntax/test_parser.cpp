// tests/syntax/test_parser.cpp - Recursive-descent parser tests

#include <gtest/gtest.h>

#include <string>

#include "sysml/ast/ast.hpp"
#include "sysml/basic/diagnostic_codes.hpp"
#include "sysml/syntax/frontend.hpp"
#include "sysml/test_support/parse_helpers.hpp"

using namespace sysml;
using sysml::test_support::parse;

// ============================================================================
// Test Helper
// ============================================================================

static const PackageDecl * package_at(const test_support::TestParseUnit & u, size_t i)
{
  EXPECT_NE(u.unit, nullptr);
  if (u.unit == nullptr || i >= u.unit->members.size()) {
    return nullptr;
  }
  return dyn_cast<PackageDecl>(u.unit->members[i]);
}

static const ElementDecl * element_at(gsl::span<AstNode *> members, size_t i)
{
  if (i >= members.size()) {
    return nullptr;
  }
  return dyn_cast<ElementDecl>(members[i]);
}

// ============================================================================
// Packages and elements
// ============================================================================

TEST(SyntaxParser, PackageWithDefinitionsAndUsages)
{
  auto u = parse(R"(
    package Vehicles {
      part def Car :> Vehicle;
      part wheels : Wheel[4];
    }
  )");
  EXPECT_TRUE(u.diags.empty());

  const PackageDecl * pkg = package_at(u, 0);
  ASSERT_NE(pkg, nullptr);
  EXPECT_EQ(pkg->name, "Vehicles");
  EXPECT_EQ(u.slice(pkg->name_range), "Vehicles");
  ASSERT_EQ(pkg->members.size(), 2U);

  const auto * car = dyn_cast<DefinitionDecl>(pkg->members[0]);
  ASSERT_NE(car, nullptr);
  EXPECT_EQ(car->element_kind, ElementKind::Part);
  EXPECT_EQ(car->name, "Car");
  ASSERT_EQ(car->relationships.size(), 1U);
  EXPECT_EQ(car->relationships[0]->rel_kind, RelationshipKind::Specialization);
  EXPECT_EQ(car->relationships[0]->target, "Vehicle");

  const auto * wheels = dyn_cast<UsageDecl>(pkg->members[1]);
  ASSERT_NE(wheels, nullptr);
  EXPECT_EQ(wheels->multiplicity, "4");
  ASSERT_NE(wheels->first_relationship(RelationshipKind::Typing), nullptr);
  EXPECT_EQ(wheels->first_relationship(RelationshipKind::Typing)->target, "Wheel");
}

TEST(SyntaxParser, SpecializationOperatorDependsOnDeclarationKind)
{
  auto u = parse(R"(
    part def Sports :> Car;
    part fast :> cars;
    part front :>> wheel;
    part spare ::> wheel;
    part def Racer specializes Sports;
    part slow subsets cars;
    part back redefines wheel;
    part x defined by Car;
  )");
  EXPECT_TRUE(u.diags.empty());
  ASSERT_EQ(u.unit->members.size(), 8U);

  const RelationshipKind expected[] = {
    RelationshipKind::Specialization, RelationshipKind::Subsetting,
    RelationshipKind::Redefinition,   RelationshipKind::ReferenceSubsetting,
    RelationshipKind::Specialization, RelationshipKind::Subsetting,
    RelationshipKind::Redefinition,   RelationshipKind::Typing,
  };
  for (size_t i = 0; i < 8; ++i) {
    const ElementDecl * e = element_at(u.unit->members, i);
    ASSERT_NE(e, nullptr) << i;
    ASSERT_EQ(e->relationships.size(), 1U) << i;
    EXPECT_EQ(e->relationships[0]->rel_kind, expected[i]) << i;
  }
}

TEST(SyntaxParser, MultipleTargetsAndQualifiedNames)
{
  auto u = parse("part def Amphibian :> Vehicles::Car, Vehicles::Boat, 'Old Type';");
  EXPECT_TRUE(u.diags.empty());

  const ElementDecl * e = element_at(u.unit->members, 0);
  ASSERT_NE(e, nullptr);
  ASSERT_EQ(e->relationships.size(), 3U);
  EXPECT_EQ(e->relationships[0]->target, "Vehicles::Car");
  EXPECT_TRUE(e->relationships[0]->is_qualified_target());
  EXPECT_EQ(u.slice(e->relationships[0]->target_range), "Vehicles::Car");
  EXPECT_EQ(e->relationships[2]->target, "Old Type");
  EXPECT_FALSE(e->relationships[2]->is_qualified_target());
}

TEST(SyntaxParser, PrefixesAndDirections)
{
  auto u = parse(R"(
    abstract part def Base;
    variation part def Choice;
    port def Plug {
      in attribute voltage : Real;
      out item signal;
      inout ref part peer;
    }
    ref driver : Person;
  )");
  EXPECT_TRUE(u.diags.empty());
  ASSERT_EQ(u.unit->members.size(), 4U);

  EXPECT_TRUE(element_at(u.unit->members, 0)->is_abstract);
  EXPECT_TRUE(element_at(u.unit->members, 1)->is_variation);

  const ElementDecl * plug = element_at(u.unit->members, 2);
  ASSERT_EQ(plug->members.size(), 3U);
  EXPECT_EQ(element_at(plug->members, 0)->direction, Direction::In);
  EXPECT_EQ(element_at(plug->members, 0)->element_kind, ElementKind::Attribute);
  EXPECT_EQ(element_at(plug->members, 1)->direction, Direction::Out);
  EXPECT_EQ(element_at(plug->members, 2)->direction, Direction::InOut);
  // `ref part` is a part usage held by reference
  EXPECT_EQ(element_at(plug->members, 2)->element_kind, ElementKind::Part);

  const ElementDecl * driver = element_at(u.unit->members, 3);
  EXPECT_EQ(driver->element_kind, ElementKind::Ref);
  EXPECT_EQ(driver->name, "driver");
}

TEST(SyntaxParser, TwoWordAndKermlKinds)
{
  auto u = parse(R"(
    use case def Commute;
    analysis case def Trade;
    datatype Real :> Number;
    feature mass : Real;
  )");
  EXPECT_TRUE(u.diags.empty());
  ASSERT_EQ(u.unit->members.size(), 4U);

  const auto * uc = dyn_cast<DefinitionDecl>(u.unit->members[0]);
  ASSERT_NE(uc, nullptr);
  EXPECT_EQ(uc->element_kind, ElementKind::UseCase);
  EXPECT_EQ(uc->name, "Commute");
  EXPECT_EQ(element_at(u.unit->members, 1)->element_kind, ElementKind::AnalysisCase);

  const auto * real = dyn_cast<ClassifierDecl>(u.unit->members[2]);
  ASSERT_NE(real, nullptr);
  EXPECT_EQ(real->element_kind, ElementKind::Datatype);
  EXPECT_EQ(real->relationships[0]->rel_kind, RelationshipKind::Specialization);

  const auto * mass = dyn_cast<FeatureDecl>(u.unit->members[3]);
  ASSERT_NE(mass, nullptr);
  EXPECT_EQ(mass->relationships[0]->rel_kind, RelationshipKind::Typing);
}

TEST(SyntaxParser, ValuesAreKeptAsText)
{
  auto u = parse(R"(
    part def Car {
      attribute mass : Real = 1200 + payload * 2;
      attribute speed := 0;
      attribute gear default = 1;
    }
  )");
  EXPECT_TRUE(u.diags.empty());
  const ElementDecl * car = element_at(u.unit->members, 0);
  ASSERT_EQ(car->members.size(), 3U);

  const ElementDecl * mass = element_at(car->members, 0);
  ASSERT_NE(mass->value, nullptr);
  EXPECT_EQ(mass->value->text, "1200 + payload * 2");
  EXPECT_EQ(mass->relationships.size(), 1U);

  EXPECT_TRUE(element_at(car->members, 1)->value->is_initial);
  EXPECT_TRUE(element_at(car->members, 2)->value->is_default);
}

TEST(SyntaxParser, AnonymousRedefinition)
{
  auto u = parse("part def Car :> Vehicle { attribute :>> mass = 1500; }");
  EXPECT_TRUE(u.diags.empty());
  const ElementDecl * redef = element_at(element_at(u.unit->members, 0)->members, 0);
  ASSERT_NE(redef, nullptr);
  EXPECT_TRUE(redef->name.empty());
  EXPECT_FALSE(redef->name_range.is_valid());
  EXPECT_EQ(redef->relationships[0]->rel_kind, RelationshipKind::Redefinition);
  EXPECT_EQ(redef->relationships[0]->target, "mass");
}

// ============================================================================
// Directives and relationship members
// ============================================================================

TEST(SyntaxParser, ImportKindsAndVisibility)
{
  auto u = parse(R"(
    package P {
      import Lib::Engine;
      import Lib::*;
      public import Lib::**;
      import all Other::*;
    }
  )");
  EXPECT_TRUE(u.diags.empty());
  const PackageDecl * pkg = package_at(u, 0);
  ASSERT_EQ(pkg->members.size(), 4U);

  const auto * member = dyn_cast<ImportDecl>(pkg->members[0]);
  ASSERT_NE(member, nullptr);
  EXPECT_EQ(member->import_kind, ImportKind::Member);
  EXPECT_EQ(member->target, "Lib::Engine");
  EXPECT_EQ(member->visibility, Visibility::Private);

  const auto * ns = cast<ImportDecl>(pkg->members[1]);
  EXPECT_EQ(ns->import_kind, ImportKind::Namespace);
  EXPECT_EQ(ns->target, "Lib");

  const auto * rec = cast<ImportDecl>(pkg->members[2]);
  EXPECT_EQ(rec->import_kind, ImportKind::Recursive);
  EXPECT_EQ(rec->visibility, Visibility::Public);

  EXPECT_EQ(cast<ImportDecl>(pkg->members[3])->target, "Other");
}

TEST(SyntaxParser, AliasDeclaration)
{
  auto u = parse("package P { alias Car for Vehicles::Automobile; }");
  EXPECT_TRUE(u.diags.empty());
  const auto * alias = dyn_cast<AliasDecl>(package_at(u, 0)->members[0]);
  ASSERT_NE(alias, nullptr);
  EXPECT_EQ(alias->name, "Car");
  EXPECT_EQ(alias->target, "Vehicles::Automobile");
}

TEST(SyntaxParser, SatisfyPerformExhibit)
{
  auto u = parse(R"(
    part def Car {
      satisfy Braking by brakes;
      perform action drive;
      exhibit states;
      satisfy Safety;
    }
  )");
  EXPECT_TRUE(u.diags.empty());
  const ElementDecl * car = element_at(u.unit->members, 0);
  ASSERT_EQ(car->members.size(), 4U);

  const auto * sat = dyn_cast<RelationshipPart>(car->members[0]);
  ASSERT_NE(sat, nullptr);
  EXPECT_EQ(sat->rel_kind, RelationshipKind::Satisfy);
  EXPECT_EQ(sat->target, "Braking");
  EXPECT_EQ(sat->subject, "brakes");
  EXPECT_EQ(u.slice(sat->subject_range), "brakes");

  const auto * perf = cast<RelationshipPart>(car->members[1]);
  EXPECT_EQ(perf->rel_kind, RelationshipKind::Perform);
  EXPECT_EQ(perf->target, "drive");
  EXPECT_EQ(cast<RelationshipPart>(car->members[2])->rel_kind, RelationshipKind::Exhibit);
  EXPECT_TRUE(cast<RelationshipPart>(car->members[3])->subject.empty());
}

TEST(SyntaxParser, DocCommentsAttachTrimmed)
{
  auto u = parse(R"(
    package P {
      doc /* The package. */
      part def Engine {
        doc
        /*
         Turns fuel into torque.
        */
      }
    }
  )");
  EXPECT_TRUE(u.diags.empty());
  const PackageDecl * pkg = package_at(u, 0);
  EXPECT_EQ(pkg->doc, "The package.");
  ASSERT_EQ(pkg->members.size(), 1U);
  EXPECT_EQ(element_at(pkg->members, 0)->doc, "Turns fuel into torque.");
}

TEST(SyntaxParser, BehaviorStatementsAndAnnotationsAreSkipped)
{
  auto u = parse(R"(
    state def Gear {
      entry; then off;
      state off;
      transition first off then on;
      state on;
      @Safety;
      comment about on /* reviewed */
      #Critical part guard;
    }
    constraint def Limit { speed < 120 }
  )");
  EXPECT_TRUE(u.diags.empty()) << u.diags.all().front().message;

  const ElementDecl * gear = element_at(u.unit->members, 0);
  ASSERT_EQ(gear->members.size(), 3U);
  EXPECT_EQ(element_at(gear->members, 0)->name, "off");
  EXPECT_EQ(element_at(gear->members, 1)->name, "on");
  EXPECT_EQ(element_at(gear->members, 2)->name, "guard");
  EXPECT_TRUE(element_at(u.unit->members, 1)->members.empty());
}

// ============================================================================
// Error recovery
// ============================================================================

TEST(SyntaxParser, MissingSemicolonReportedOnPreviousLine)
{
  auto u = parse(
    "part def A\n"
    "part def B;\n");
  ASSERT_EQ(u.diags.size(), 1U);
  const Diagnostic & d = u.diags.all().front();
  EXPECT_EQ(d.code, diag_codes::k_syntax_error);
  EXPECT_EQ(d.message, "expected ';' or '{' after declaration");
  EXPECT_EQ(u.full_range(d.primary_range()).start_line, 1U);

  // Both declarations survive
  ASSERT_EQ(u.unit->members.size(), 2U);
  EXPECT_EQ(element_at(u.unit->members, 1)->name, "B");
}

TEST(SyntaxParser, UnexpectedTokenDoesNotStopTheBody)
{
  auto u = parse("package P { part def A; ) part def B; }");
  ASSERT_EQ(u.diags.size(), 1U);
  EXPECT_EQ(u.diags.all().front().code, diag_codes::k_unexpected_token);
  EXPECT_EQ(u.diags.all().front().message, "unexpected ')' in member position");

  const PackageDecl * pkg = package_at(u, 0);
  ASSERT_NE(pkg, nullptr);
  ASSERT_EQ(pkg->members.size(), 2U);
  EXPECT_EQ(element_at(pkg->members, 1)->name, "B");
}

TEST(SyntaxParser, MissingTargetAndUnclosedBody)
{
  auto u = parse("package P { part def A :> ; part def B;");
  EXPECT_TRUE(u.diags.has_errors());

  const PackageDecl * pkg = package_at(u, 0);
  ASSERT_NE(pkg, nullptr);
  ASSERT_EQ(pkg->members.size(), 2U);
  EXPECT_TRUE(element_at(pkg->members, 0)->relationships.empty());

  bool saw_unclosed = false;
  for (const auto & d : u.diags.all()) {
    if (d.message == "expected '}' to close body") {
      saw_unclosed = true;
    }
  }
  EXPECT_TRUE(saw_unclosed);
}

TEST(SyntaxParser, StrayClosingBraceAtTopLevel)
{
  auto u = parse("part def A; } part def B;");
  ASSERT_EQ(u.diags.size(), 1U);
  EXPECT_EQ(u.diags.all().front().message, "unexpected '}' at top level");
  EXPECT_EQ(u.unit->members.size(), 2U);
}
