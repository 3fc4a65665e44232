#ifndef TNPLANAR_INDEX_HPP
#define TNPLANAR_INDEX_HPP

#include <TNPlanar/core/container.hpp>

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>

namespace tnplanar {

/// @brief Index labels a leg of a tensor term

/// An Index is either positional (an integer, as in `A[1,2;3]`) or symbolic
/// (a name, as in `A[a,b;c]`). Within one expression an Index that occurs
/// exactly twice is contracted, one that occurs exactly once is free.
/// Indices are totally ordered: positional indices precede symbolic ones.
class Index {
 public:
  using ordinal_type = std::int64_t;

  Index() = default;
  Index(ordinal_type ordinal) : value_(ordinal) {}
  Index(int ordinal) : value_(static_cast<ordinal_type>(ordinal)) {}
  Index(std::string label) : value_(std::move(label)) {}
  Index(const char* label) : value_(std::string(label)) {}

  /// @return true if this is a positional index
  bool positional() const { return value_.index() == 0; }
  /// @return true if this is a symbolic index
  bool symbolic() const { return value_.index() == 1; }

  /// @pre `this->positional()`
  ordinal_type ordinal() const { return std::get<ordinal_type>(value_); }
  /// @pre `this->symbolic()`
  const std::string& label() const { return std::get<std::string>(value_); }

  /// @return the textual form of this index
  std::string to_string() const;

  friend bool operator==(const Index&, const Index&) = default;
  friend std::strong_ordering operator<=>(const Index& a, const Index& b) {
    return a.value_ <=> b.value_;
  }

 private:
  std::variant<ordinal_type, std::string> value_ = ordinal_type{0};
};

using IndexList = container::svector<Index, 4>;

/// @return the textual form of @p indices, comma-separated
std::string to_string(const IndexList& indices);

/// @return @p indices in reverse order
IndexList reversed(const IndexList& indices);

/// @return concatenation of @p a and @p b
IndexList concat(const IndexList& a, const IndexList& b);

}  // namespace tnplanar

#endif  // TNPLANAR_INDEX_HPP
