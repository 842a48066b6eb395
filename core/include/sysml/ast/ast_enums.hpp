// sysml/ast/ast_enums.hpp - Syntax tree enumerations
//
// Node kinds, element keywords, and the small attribute enums carried by
// declarations (visibility, feature direction, import and relationship kind).
//
#pragma once

#include <cstdint>
#include <string_view>

namespace sysml
{

// ============================================================================
// NodeKind - Identifies all syntax tree node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category so category checks are range comparisons.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#define AST_NODE_NAMESPACE(Class, Kind, Snake) Kind,
#define AST_NODE_DIRECTIVE(Class, Kind, Snake) Kind,
#define AST_NODE_ELEMENT(Class, Kind, Snake) Kind,
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "sysml/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_directive_kind(NodeKind k) noexcept
{
  return k == NodeKind::Import || k == NodeKind::Alias;
}

[[nodiscard]] constexpr bool is_element_kind(NodeKind k) noexcept
{
  return k >= NodeKind::Definition && k <= NodeKind::Feature;
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Snake;
#define AST_NODE_NAMESPACE(Class, Kind, Snake) \
  case NodeKind::Kind:                         \
    return #Snake;
#define AST_NODE_DIRECTIVE(Class, Kind, Snake) \
  case NodeKind::Kind:                         \
    return #Snake;
#define AST_NODE_ELEMENT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#include "sysml/ast/ast_nodes.def"
  }
  return "<unknown>";
}

// ============================================================================
// Visibility / Direction
// ============================================================================

enum class Visibility : uint8_t {
  Public,
  Private,
  Protected,
};

/// Feature direction (`in`, `out`, `inout`).
enum class Direction : uint8_t {
  None,
  In,
  Out,
  InOut,
};

// ============================================================================
// Imports
// ============================================================================

enum class ImportKind : uint8_t {
  Member,     ///< import Pkg::Member;
  Namespace,  ///< import Pkg::*;
  Recursive,  ///< import Pkg::**;
};

// ============================================================================
// Relationships
// ============================================================================

/**
 * Kind of a relationship clause or relationship member.
 *
 * The same `:>` token means Specialization on a definition and Subsetting on
 * a usage; the parser decides which.
 */
enum class RelationshipKind : uint8_t {
  Specialization,       ///< def A :> B
  Typing,               ///< part a : B
  Subsetting,           ///< part a :> b
  Redefinition,         ///< part a :>> b
  ReferenceSubsetting,  ///< part a ::> b
  Satisfy,              ///< satisfy R;
  Perform,              ///< perform A;
  Exhibit,              ///< exhibit S;
  Include,              ///< include U;
};

inline constexpr int k_relationship_kind_count = 9;

// ============================================================================
// ElementKind - The keyword that introduced a definition or usage
// ============================================================================

enum class ElementKind : uint8_t {
  // SysML definitions and usages
  Part,
  Item,
  Port,
  Attribute,
  Action,
  State,
  Requirement,
  Constraint,
  Connection,
  Interface,
  Allocation,
  UseCase,
  AnalysisCase,
  VerificationCase,
  Case,
  Concern,
  View,
  Viewpoint,
  Rendering,
  Metadata,
  Occurrence,
  Flow,
  Enum,
  Calc,
  Ref,  ///< usage only
  // KerML classifiers
  Class,
  Classifier,
  Datatype,
  Struct,
  Assoc,
  Behavior,
  Function,
  Predicate,
  Metaclass,
  Type,
  // KerML features
  Feature,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(Visibility v) noexcept
{
  switch (v) {
    case Visibility::Public:
      return "public";
    case Visibility::Private:
      return "private";
    case Visibility::Protected:
      return "protected";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Direction d) noexcept
{
  switch (d) {
    case Direction::None:
      return "";
    case Direction::In:
      return "in";
    case Direction::Out:
      return "out";
    case Direction::InOut:
      return "inout";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ImportKind k) noexcept
{
  switch (k) {
    case ImportKind::Member:
      return "member";
    case ImportKind::Namespace:
      return "namespace";
    case ImportKind::Recursive:
      return "recursive";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(RelationshipKind k) noexcept
{
  switch (k) {
    case RelationshipKind::Specialization:
      return "specialization";
    case RelationshipKind::Typing:
      return "typing";
    case RelationshipKind::Subsetting:
      return "subsetting";
    case RelationshipKind::Redefinition:
      return "redefinition";
    case RelationshipKind::ReferenceSubsetting:
      return "reference_subsetting";
    case RelationshipKind::Satisfy:
      return "satisfy";
    case RelationshipKind::Perform:
      return "perform";
    case RelationshipKind::Exhibit:
      return "exhibit";
    case RelationshipKind::Include:
      return "include";
  }
  return "";
}

/// Surface keyword(s) of an element kind, e.g. "use case".
[[nodiscard]] constexpr std::string_view to_string(ElementKind k) noexcept
{
  switch (k) {
    case ElementKind::Part:
      return "part";
    case ElementKind::Item:
      return "item";
    case ElementKind::Port:
      return "port";
    case ElementKind::Attribute:
      return "attribute";
    case ElementKind::Action:
      return "action";
    case ElementKind::State:
      return "state";
    case ElementKind::Requirement:
      return "requirement";
    case ElementKind::Constraint:
      return "constraint";
    case ElementKind::Connection:
      return "connection";
    case ElementKind::Interface:
      return "interface";
    case ElementKind::Allocation:
      return "allocation";
    case ElementKind::UseCase:
      return "use case";
    case ElementKind::AnalysisCase:
      return "analysis case";
    case ElementKind::VerificationCase:
      return "verification case";
    case ElementKind::Case:
      return "case";
    case ElementKind::Concern:
      return "concern";
    case ElementKind::View:
      return "view";
    case ElementKind::Viewpoint:
      return "viewpoint";
    case ElementKind::Rendering:
      return "rendering";
    case ElementKind::Metadata:
      return "metadata";
    case ElementKind::Occurrence:
      return "occurrence";
    case ElementKind::Flow:
      return "flow";
    case ElementKind::Enum:
      return "enum";
    case ElementKind::Calc:
      return "calc";
    case ElementKind::Ref:
      return "ref";
    case ElementKind::Class:
      return "class";
    case ElementKind::Classifier:
      return "classifier";
    case ElementKind::Datatype:
      return "datatype";
    case ElementKind::Struct:
      return "struct";
    case ElementKind::Assoc:
      return "assoc";
    case ElementKind::Behavior:
      return "behavior";
    case ElementKind::Function:
      return "function";
    case ElementKind::Predicate:
      return "predicate";
    case ElementKind::Metaclass:
      return "metaclass";
    case ElementKind::Type:
      return "type";
    case ElementKind::Feature:
      return "feature";
  }
  return "";
}

}  // namespace sysml
