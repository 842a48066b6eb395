// sysml/ast/ast.hpp - Syntax tree node classes
//
// The node set is closed (see ast_nodes.def). Consumers dispatch with a
// switch over NodeKind plus cast<>, never through virtual functions.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "sysml/ast/ast_enums.hpp"
#include "sysml/basic/casting.hpp"
#include "sysml/basic/source_manager.hpp"

namespace sysml
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all syntax tree nodes.
 *
 * Every node has a NodeKind for RTTI and the byte range it was parsed from.
 * Nodes are immutable once the parser returns and are owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/**
 * Value part of a feature (`= expr`, `:= expr`, `default = expr`).
 *
 * Only the raw text is kept. Names inside it are never declarations.
 */
class ValueExpr : public NodeBase<ValueExpr, AstNode, NodeKind::ValueExpression>
{
public:
  std::string_view text;
  bool is_initial = false;  ///< `:=`
  bool is_default = false;  ///< `default`

  ValueExpr(std::string_view t, SourceRange r) : NodeBase(r), text(t) {}
};

/**
 * A relationship clause (`: T`, `:> B`, `:>> x`) or relationship member
 * (`satisfy R by S;`).
 *
 * `target` is a reference: it names an existing element and must never be
 * treated as a declaration, even when it is qualified.
 */
class RelationshipPart : public NodeBase<RelationshipPart, AstNode, NodeKind::RelationshipPart>
{
public:
  RelationshipKind rel_kind;
  std::string_view target;
  SourceRange target_range;

  /// `by` subject of a satisfy member; empty for everything else.
  std::string_view subject;
  SourceRange subject_range;

  RelationshipPart(
    RelationshipKind k, std::string_view t, SourceRange tr, SourceRange r = {})
  : NodeBase(r), rel_kind(k), target(t), target_range(tr)
  {
  }

  [[nodiscard]] bool is_qualified_target() const noexcept
  {
    return target.find("::") != std::string_view::npos;
  }
};

// ============================================================================
// Element Declarations
// ============================================================================

/**
 * Common shape of definitions, usages, classifiers and features.
 */
class ElementDecl : public AstNode
{
public:
  ElementKind element_kind = ElementKind::Part;

  std::string_view name;  ///< Empty for anonymous usages
  SourceRange name_range;

  Visibility visibility = Visibility::Public;
  Direction direction = Direction::None;

  bool is_abstract = false;
  bool is_variation = false;
  bool is_readonly = false;
  bool is_derived = false;
  bool is_end = false;

  std::string_view multiplicity;  ///< Text between the brackets, if any

  gsl::span<RelationshipPart *> relationships;
  gsl::span<AstNode *> members;
  const ValueExpr * value = nullptr;

  std::string_view doc;

  static bool classof(const AstNode * node) { return is_element_kind(node->get_kind()); }

  /// First relationship clause of the given kind, or nullptr.
  [[nodiscard]] const RelationshipPart * first_relationship(RelationshipKind k) const noexcept
  {
    for (const auto * rel : relationships) {
      if (rel->rel_kind == k) {
        return rel;
      }
    }
    return nullptr;
  }

protected:
  ElementDecl(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

/// `part def Vehicle :> Base { ... }`
class DefinitionDecl : public NodeBase<DefinitionDecl, ElementDecl, NodeKind::Definition>
{
public:
  DefinitionDecl(ElementKind ek, SourceRange r) : NodeBase(r) { element_kind = ek; }
};

/// `part engine : Engine[1];`
class UsageDecl : public NodeBase<UsageDecl, ElementDecl, NodeKind::Usage>
{
public:
  UsageDecl(ElementKind ek, SourceRange r) : NodeBase(r) { element_kind = ek; }
};

/// KerML `class`, `datatype`, `behavior`, ...
class ClassifierDecl : public NodeBase<ClassifierDecl, ElementDecl, NodeKind::Classifier>
{
public:
  ClassifierDecl(ElementKind ek, SourceRange r) : NodeBase(r) { element_kind = ek; }
};

/// KerML `feature`
class FeatureDecl : public NodeBase<FeatureDecl, ElementDecl, NodeKind::Feature>
{
public:
  explicit FeatureDecl(SourceRange r) : NodeBase(r) { element_kind = ElementKind::Feature; }
};

// ============================================================================
// Namespaces and Directives
// ============================================================================

class PackageDecl : public NodeBase<PackageDecl, AstNode, NodeKind::Package>
{
public:
  std::string_view name;
  SourceRange name_range;
  Visibility visibility = Visibility::Public;
  bool is_library = false;
  bool is_standard = false;
  gsl::span<AstNode *> members;
  std::string_view doc;

  PackageDecl(std::string_view n, SourceRange nr, SourceRange r)
  : NodeBase(r), name(n), name_range(nr)
  {
  }
};

/// `import Pkg::Member;`, `import Pkg::*;`, `import Pkg::**;`
class ImportDecl : public NodeBase<ImportDecl, AstNode, NodeKind::Import>
{
public:
  ImportKind import_kind;
  std::string_view target;  ///< Qualified name without the `::*` / `::**` suffix
  SourceRange target_range;
  Visibility visibility = Visibility::Private;

  ImportDecl(ImportKind k, std::string_view t, SourceRange tr, SourceRange r)
  : NodeBase(r), import_kind(k), target(t), target_range(tr)
  {
  }
};

/// `alias Name for Target;`
class AliasDecl : public NodeBase<AliasDecl, AstNode, NodeKind::Alias>
{
public:
  std::string_view name;
  SourceRange name_range;
  std::string_view target;
  SourceRange target_range;
  Visibility visibility = Visibility::Public;
  std::string_view doc;

  AliasDecl(
    std::string_view n, SourceRange nr, std::string_view t, SourceRange tr, SourceRange r)
  : NodeBase(r), name(n), name_range(nr), target(t), target_range(tr)
  {
  }
};

// ============================================================================
// Top Level
// ============================================================================

/// Root of one parsed file.
class SourceUnit : public NodeBase<SourceUnit, AstNode, NodeKind::SourceUnit>
{
public:
  gsl::span<AstNode *> members;

  explicit SourceUnit(SourceRange r) : NodeBase(r) {}
};

}  // namespace sysml
