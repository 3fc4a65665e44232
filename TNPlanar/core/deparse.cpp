#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>

#include <sstream>

namespace tnplanar {

namespace {

std::string object_label(const ObjectRef& ref, const ObjectTable* objects) {
  if (ref.is_label()) return ref.label();
  if (objects) return objects->label(ref);
  return "%" + std::to_string(ref.handle().value);
}

std::string scalar_text(const ScalarTerm& s) {
  if (std::holds_alternative<std::string>(s.value))
    return std::get<std::string>(s.value);
  std::ostringstream oss;
  oss << std::get<double>(s.value);
  return oss.str();
}

std::string indent(const std::string& text) {
  std::string result = "  ";
  for (char c : text) {
    result += c;
    if (c == '\n') result += "  ";
  }
  return result;
}

class Deparser {
 public:
  explicit Deparser(const ObjectTable* objects) : objects_(objects) {}

  std::string operator()(const NodePtr& node) const {
    return node->visit([this](const auto& v) { return (*this)(v); });
  }

  std::string operator()(const TensorTerm& t) const {
    return deparse(t, objects_);
  }

  std::string operator()(const ScalarTerm& s) const { return scalar_text(s); }

  std::string operator()(const Conjugate& c) const {
    return "conj(" + (*this)(c.arg) + ")";
  }

  std::string operator()(const Sum& s) const {
    std::string result;
    for (std::size_t i = 0; i != s.summands.size(); ++i) {
      const auto& summand = s.summands[i];
      if (i == 0)
        result += summand.sign == Sign::Minus ? "-" : "";
      else
        result += summand.sign == Sign::Minus ? " - " : " + ";
      result += factor(summand.term);
    }
    return result;
  }

  std::string operator()(const Product& p) const {
    return factor(p.left) + " * " + factor(p.right);
  }

  std::string operator()(const Assignment& a) const {
    return (*this)(a.lhs) + (a.definition ? " := " : " = ") + (*this)(a.rhs);
  }

  std::string operator()(const Block& b) const {
    std::string result;
    for (std::size_t i = 0; i != b.statements.size(); ++i) {
      if (i != 0) result += "\n";
      result += (*this)(b.statements[i]);
    }
    return result;
  }

  std::string operator()(const OpaqueBlock& b) const {
    return b.head + " {\n" + indent((*this)(b.body)) + "\n}";
  }

  std::string operator()(const AnnotatedBlock& b) const {
    return "@" + b.annotation + " {\n" + indent((*this)(b.body)) + "\n}";
  }

  std::string operator()(const BraidingConstruction& b) const {
    return object_label(b.object, objects_) + " = braiding(" +
           deparse(b.space1, objects_) + ", " + deparse(b.space2, objects_) +
           ")";
  }

 private:
  const ObjectTable* objects_;

  /// operands of products and sums; nested sums are parenthesized
  std::string factor(const NodePtr& node) const {
    if (node->is<Sum>()) return "(" + (*this)(node) + ")";
    return (*this)(node);
  }
};

}  // namespace

std::string deparse(const NodePtr& node, const ObjectTable* objects) {
  return Deparser{objects}(node);
}

std::string deparse(const TensorTerm& term, const ObjectTable* objects) {
  return object_label(term.object, objects) + (term.adjoint ? "'" : "") +
         "[" + to_string(term.left) + ";" + to_string(term.right) + "]";
}

std::string deparse(const SpaceExpr& space, const ObjectTable* objects) {
  return "space(" + object_label(space.object, objects) + ", " +
         std::to_string(space.position) + ")" + (space.dual ? "'" : "");
}

}  // namespace tnplanar
