// sysml/sema/symbols/symbol.cpp - Symbol helpers
#include "sysml/sema/symbols/symbol.hpp"

namespace sysml
{

std::string_view to_string(SymbolKind k) noexcept
{
  switch (k) {
    case SymbolKind::Package:
      return "package";
    case SymbolKind::Classifier:
      return "classifier";
    case SymbolKind::Feature:
      return "feature";
    case SymbolKind::Definition:
      return "definition";
    case SymbolKind::Usage:
      return "usage";
    case SymbolKind::Alias:
      return "alias";
  }
  return "";
}

std::string_view to_string(SemanticRole r) noexcept
{
  switch (r) {
    case SemanticRole::Requirement:
      return "requirement";
    case SemanticRole::Action:
      return "action";
    case SemanticRole::State:
      return "state";
    case SemanticRole::UseCase:
      return "use case";
    case SemanticRole::Component:
      return "component";
    case SemanticRole::Interface:
      return "interface";
    case SemanticRole::Port:
      return "port";
    case SemanticRole::Attribute:
      return "attribute";
    case SemanticRole::Connection:
      return "connection";
    case SemanticRole::Constraint:
      return "constraint";
    case SemanticRole::AnalysisCase:
      return "analysis case";
    case SemanticRole::VerificationCase:
      return "verification case";
    case SemanticRole::View:
      return "view";
    case SemanticRole::Metadata:
      return "metadata";
    case SemanticRole::Item:
      return "item";
    case SemanticRole::Flow:
      return "flow";
    case SemanticRole::Allocation:
      return "allocation";
    case SemanticRole::Classifier:
      return "classifier";
    case SemanticRole::Feature:
      return "feature";
    case SemanticRole::Package:
      return "package";
    case SemanticRole::Unknown:
      return "unknown";
  }
  return "unknown";
}

SemanticRole role_for(ElementKind k) noexcept
{
  switch (k) {
    case ElementKind::Part:
      return SemanticRole::Component;
    case ElementKind::Item:
    case ElementKind::Occurrence:
      return SemanticRole::Item;
    case ElementKind::Port:
      return SemanticRole::Port;
    case ElementKind::Attribute:
    case ElementKind::Enum:
      return SemanticRole::Attribute;
    case ElementKind::Action:
    case ElementKind::Calc:
      return SemanticRole::Action;
    case ElementKind::State:
      return SemanticRole::State;
    case ElementKind::Requirement:
    case ElementKind::Concern:
      return SemanticRole::Requirement;
    case ElementKind::Constraint:
      return SemanticRole::Constraint;
    case ElementKind::Connection:
      return SemanticRole::Connection;
    case ElementKind::Interface:
      return SemanticRole::Interface;
    case ElementKind::Allocation:
      return SemanticRole::Allocation;
    case ElementKind::UseCase:
      return SemanticRole::UseCase;
    case ElementKind::AnalysisCase:
      return SemanticRole::AnalysisCase;
    case ElementKind::VerificationCase:
      return SemanticRole::VerificationCase;
    case ElementKind::View:
    case ElementKind::Viewpoint:
    case ElementKind::Rendering:
      return SemanticRole::View;
    case ElementKind::Metadata:
    case ElementKind::Metaclass:
      return SemanticRole::Metadata;
    case ElementKind::Flow:
      return SemanticRole::Flow;
    case ElementKind::Class:
    case ElementKind::Classifier:
    case ElementKind::Datatype:
    case ElementKind::Struct:
    case ElementKind::Assoc:
    case ElementKind::Behavior:
    case ElementKind::Function:
    case ElementKind::Predicate:
    case ElementKind::Type:
      return SemanticRole::Classifier;
    case ElementKind::Feature:
      return SemanticRole::Feature;
    case ElementKind::Case:
    case ElementKind::Ref:
      return SemanticRole::Unknown;
  }
  return SemanticRole::Unknown;
}

std::string Symbol::keyword() const
{
  switch (kind) {
    case SymbolKind::Package:
      return "package";
    case SymbolKind::Alias:
      return "alias";
    case SymbolKind::Definition:
      return std::string(to_string(element_kind)) + " def";
    case SymbolKind::Usage:
    case SymbolKind::Classifier:
    case SymbolKind::Feature:
      return std::string(to_string(element_kind));
  }
  return {};
}

}  // namespace sysml
