#ifndef TNPLANAR_OBJECT_HPP
#define TNPLANAR_OBJECT_HPP

#include <TNPlanar/core/container.hpp>

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace tnplanar {

/// a small-integer handle into an ObjectTable
struct ObjectHandle {
  std::size_t value = 0;

  friend auto operator<=>(const ObjectHandle&, const ObjectHandle&) = default;
};

/// @brief refers to a tensor object from a TensorTerm

/// Before binding an object is referred to by its surface label; after
/// binding by a handle into the ObjectTable of the compilation.
class ObjectRef {
 public:
  ObjectRef() = default;
  ObjectRef(std::string label) : value_(std::move(label)) {}
  ObjectRef(const char* label) : value_(std::string(label)) {}
  ObjectRef(ObjectHandle handle) : value_(handle) {}

  bool is_label() const { return value_.index() == 0; }
  bool is_handle() const { return value_.index() == 1; }

  /// @pre `this->is_label()`
  const std::string& label() const { return std::get<std::string>(value_); }
  /// @pre `this->is_handle()`
  ObjectHandle handle() const { return std::get<ObjectHandle>(value_); }

  friend bool operator==(const ObjectRef&, const ObjectRef&) = default;
  friend auto operator<=>(const ObjectRef& a, const ObjectRef& b) {
    return a.value_ <=> b.value_;
  }

 private:
  std::variant<std::string, ObjectHandle> value_;
};

/// the role an object plays in a compilation
enum class ObjectRole {
  /// exists before the plan runs, bound from the caller's environment
  Existing,
  /// introduced by a definition, exported after the plan runs
  Defined,
  /// intermediate result of a binary contraction or trace
  Temporary,
  /// explicit braiding tensor constructed by the plan
  Braiding
};

std::string to_string(ObjectRole role);

struct ObjectInfo {
  /// surface label, or a generated one for temporaries and braidings
  std::string label;
  ObjectRole role;
  /// true if the object is the target of an assignment
  bool assigned = false;
};

/// @brief arena of the objects referenced by one compilation

/// Handles are allocated sequentially, hence identical inputs produce
/// identical tables.
class ObjectTable {
 public:
  ObjectTable() = default;
  explicit ObjectTable(std::string temporary_prefix)
      : temporary_prefix_(std::move(temporary_prefix)) {}

  /// @return the handle bound to @p label, creating it with @p role if needed
  ObjectHandle bind(const std::string& label, ObjectRole role);

  /// @return the handle bound to @p label, if any
  std::optional<ObjectHandle> find(const std::string& label) const;

  /// @return handle of a fresh temporary
  ObjectHandle make_temporary();

  /// @return handle of a fresh braiding object
  ObjectHandle make_braiding();

  const ObjectInfo& operator[](ObjectHandle h) const;
  ObjectInfo& operator[](ObjectHandle h);

  /// @return the label of @p ref
  std::string label(const ObjectRef& ref) const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  /// @return handles of all objects with role @p role, in creation order
  container::svector<ObjectHandle> handles(ObjectRole role) const;

 private:
  std::string temporary_prefix_ = "tmp";
  container::vector<ObjectInfo> entries_;
  container::map<std::string, ObjectHandle> by_label_;
  std::size_t ntemporaries_ = 0;
  std::size_t nbraidings_ = 0;

  ObjectHandle push(ObjectInfo info);
};

}  // namespace tnplanar

#endif  // TNPLANAR_OBJECT_HPP
