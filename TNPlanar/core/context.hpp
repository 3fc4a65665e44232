#ifndef TNPLANAR_CORE_CONTEXT_HPP
#define TNPLANAR_CORE_CONTEXT_HPP

#include <optional>
#include <string>

namespace tnplanar {

/// how explicit braiding tensors are handled by compile()
enum class BraidingMode {
  /// braiding placeholders are resolved into constructed braiding objects,
  /// and the result is checked for planarity and decomposed into binary
  /// contractions
  Construct,
  /// braiding placeholders are removed by renaming indices; the result is
  /// meant for the symmetric (non-planar) contraction pathway
  Remove
};

// clang-format off
/// @brief Specifies TNPlanar context, i.e. the settings that control
/// compilation of diagram expressions
///
/// TNPlanar context contains the following information:
/// - `braiding_mode`: whether braiding placeholders are constructed
///   (`BraidingMode::Construct`, default) or removed (`BraidingMode::Remove`)
/// - `braiding_label`: the reserved object label of braiding placeholders;
///   it cannot be assigned to
/// - `temporary_prefix`: prefix of the generated labels of temporaries
/// - `check_planarity`: whether every assignment is checked for planarity
///   before its contractions are decomposed; the decomposer detects
///   non-planar products as well, with less precise diagnostics
// clang-format on
class Context {
 public:
  struct Defaults {
    constexpr static auto braiding_mode = BraidingMode::Construct;
    constexpr static auto braiding_label = "τ";
    constexpr static auto temporary_prefix = "tmp";
    constexpr static auto check_planarity = true;
  };

  /// helper for the named-parameter constructor of Context

  /// see the Context documentation for detailed description
  struct Options {
    /// the BraidingMode
    BraidingMode braiding_mode = Defaults::braiding_mode;
    /// the reserved label of braiding placeholders
    std::string braiding_label = Defaults::braiding_label;
    /// the prefix of temporary labels
    std::string temporary_prefix = Defaults::temporary_prefix;
    /// whether to run the planarity checker
    bool check_planarity = Defaults::check_planarity;
  };

  /// @brief standard named-parameter constructor
  ///
  /// Example:
  /// ```cpp
  ///   Context ctx({.braiding_mode = BraidingMode::Remove});
  /// ```
  Context(Options options = {.braiding_mode = Defaults::braiding_mode,
                             .braiding_label = Defaults::braiding_label,
                             .temporary_prefix = Defaults::temporary_prefix,
                             .check_planarity = Defaults::check_planarity});

  Context(const Context&) = default;
  Context(Context&&) = default;
  Context& operator=(const Context&) = default;
  Context& operator=(Context&&) = default;
  ~Context() = default;

  /// \return BraidingMode of this context
  BraidingMode braiding_mode() const;
  /// \return the reserved label of braiding placeholders
  const std::string& braiding_label() const;
  /// \return the prefix of the labels of temporaries
  const std::string& temporary_prefix() const;
  /// \return whether compile() runs the planarity checker
  bool check_planarity() const;

  /// Sets the BraidingMode for this context, convenient for chaining
  /// \param mode BraidingMode
  /// \return ref to `*this`, for chaining
  Context& set(BraidingMode mode);
  /// Sets the braiding label for this context, convenient for chaining
  /// \return ref to `*this`, for chaining
  Context& set_braiding_label(std::string label);
  /// Sets the temporary prefix for this context, convenient for chaining
  /// \return ref to `*this`, for chaining
  Context& set_temporary_prefix(std::string prefix);
  /// Sets whether to check planarity, convenient for chaining
  /// \return ref to `*this`, for chaining
  Context& set_check_planarity(bool check);

 private:
  BraidingMode braiding_mode_ = Defaults::braiding_mode;
  std::string braiding_label_ = Defaults::braiding_label;
  std::string temporary_prefix_ = Defaults::temporary_prefix;
  bool check_planarity_ = Defaults::check_planarity;
};

/// Context object equality comparison
/// \param ctx1
/// \param ctx2
/// \return true if \p ctx1 and \p ctx2 are equal
bool operator==(const Context& ctx1, const Context& ctx2);

/// Context object inequality comparison
/// \param ctx1
/// \param ctx2
/// \return true if \p ctx1 and \p ctx2 are not equal
bool operator!=(const Context& ctx1, const Context& ctx2);

/// restores the default Context it holds when destroyed
class ContextResetter {
 public:
  ContextResetter() = default;
  explicit ContextResetter(Context previous) noexcept;
  ContextResetter(ContextResetter&& other) noexcept;
  ContextResetter& operator=(ContextResetter&&) = delete;
  ContextResetter(const ContextResetter&) = delete;
  ContextResetter& operator=(const ContextResetter&) = delete;
  ~ContextResetter();

 private:
  std::optional<Context> previous_;
};

/// \name manipulation of implicit context for TNPlanar
/// \warning none of these are thread-safe

/// @{

/// @brief access default Context
/// @return the default context
const Context& get_default_context();

/// @brief sets default Context
/// @param ctx Context object
void set_default_context(const Context& ctx);

/// @brief sets default Context
/// @param ctx_options Context named-parameter constructor arguments
void set_default_context(Context::Options ctx_options);

/// @brief resets default Context to its initial value
void reset_default_context();

/// @brief changes default context
/// @param ctx Context object
/// @return a move-only ContextResetter object whose destruction will reset the
/// default context to the previous value
[[nodiscard]] ContextResetter set_scoped_default_context(const Context& ctx);

/// @}

}  // namespace tnplanar

#endif  // TNPLANAR_CORE_CONTEXT_HPP
