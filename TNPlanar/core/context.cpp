#include <TNPlanar/core/context.hpp>

#include <utility>

namespace tnplanar {

bool operator==(const Context& ctx1, const Context& ctx2) {
  if (&ctx1 == &ctx2)
    return true;
  else
    return ctx1.braiding_mode() == ctx2.braiding_mode() &&
           ctx1.braiding_label() == ctx2.braiding_label() &&
           ctx1.temporary_prefix() == ctx2.temporary_prefix() &&
           ctx1.check_planarity() == ctx2.check_planarity();
}

bool operator!=(const Context& ctx1, const Context& ctx2) {
  return !(ctx1 == ctx2);
}

namespace {

Context& default_context_instance() {
  static Context instance;
  return instance;
}

}  // namespace

const Context& get_default_context() { return default_context_instance(); }

void set_default_context(const Context& ctx) {
  default_context_instance() = ctx;
}

void set_default_context(Context::Options ctx_options) {
  set_default_context(Context(std::move(ctx_options)));
}

void reset_default_context() { default_context_instance() = Context{}; }

ContextResetter::ContextResetter(Context previous) noexcept
    : previous_(std::move(previous)) {}

ContextResetter::ContextResetter(ContextResetter&& other) noexcept
    : previous_(std::move(other.previous_)) {
  other.previous_.reset();
}

ContextResetter::~ContextResetter() {
  if (previous_) set_default_context(*previous_);
}

ContextResetter set_scoped_default_context(const Context& ctx) {
  if (get_default_context() == ctx) return {};
  Context previous = get_default_context();
  set_default_context(ctx);
  return ContextResetter(std::move(previous));
}

Context::Context(Options options)
    : braiding_mode_(options.braiding_mode),
      braiding_label_(std::move(options.braiding_label)),
      temporary_prefix_(std::move(options.temporary_prefix)),
      check_planarity_(options.check_planarity) {}

BraidingMode Context::braiding_mode() const { return braiding_mode_; }

const std::string& Context::braiding_label() const { return braiding_label_; }

const std::string& Context::temporary_prefix() const {
  return temporary_prefix_;
}

bool Context::check_planarity() const { return check_planarity_; }

Context& Context::set(BraidingMode mode) {
  braiding_mode_ = mode;
  return *this;
}

Context& Context::set_braiding_label(std::string label) {
  braiding_label_ = std::move(label);
  return *this;
}

Context& Context::set_temporary_prefix(std::string prefix) {
  temporary_prefix_ = std::move(prefix);
  return *this;
}

Context& Context::set_check_planarity(bool check) {
  check_planarity_ = check;
  return *this;
}

}  // namespace tnplanar
