// sysml/sema/population/populator.hpp - Syntax tree to symbol table
//
// Walks one file's tree, declares its named elements and records the import
// directives and references it contains. Nothing is resolved here: names in
// relationship clauses are recorded as written and linked later, once every
// file has been populated.
//
#pragma once

#include <gsl/span>
#include <vector>

#include "sysml/ast/ast.hpp"
#include "sysml/basic/diagnostic.hpp"
#include "sysml/sema/resolution/references.hpp"
#include "sysml/sema/symbols/symbol_table.hpp"

namespace sysml
{

class Populator
{
public:
  Populator(
    SymbolTable & symbols, DiagnosticBag & diags, std::vector<ImportDirective> & imports,
    std::vector<ReferenceOccurrence> & references)
  : symbols_(symbols), diags_(diags), imports_(imports), references_(references)
  {
  }

  /**
   * Populate from one file.
   *
   * Duplicate qualified names are reported (E001); the first declaration is
   * kept and the body of the later one is not visited.
   *
   * @return Number of symbols declared.
   */
  size_t populate(const SourceUnit & unit, FileId file);

private:
  void visit_members(gsl::span<AstNode * const> members, ScopeId scope, SymbolId owner);
  void visit(const AstNode & node, ScopeId scope, SymbolId owner);

  void declare_package(const PackageDecl & decl, ScopeId scope);
  void declare_element(const ElementDecl & decl, ScopeId scope);
  void declare_alias(const AliasDecl & decl, ScopeId scope);
  void record_import(const ImportDecl & decl, ScopeId scope);
  void record_relationship(const RelationshipPart & rel, ScopeId scope, SymbolId owner);

  /// Declare and report a duplicate. Returns the new id, or k_invalid_symbol.
  SymbolId declare(Symbol symbol);

  SymbolTable & symbols_;
  DiagnosticBag & diags_;
  std::vector<ImportDirective> & imports_;
  std::vector<ReferenceOccurrence> & references_;

  FileId file_;
  size_t declared_ = 0;
};

}  // namespace sysml
