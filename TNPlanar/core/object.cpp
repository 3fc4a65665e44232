#include <TNPlanar/core/object.hpp>
#include <TNPlanar/core/utility/macros.hpp>

namespace tnplanar {

std::string to_string(ObjectRole role) {
  switch (role) {
    case ObjectRole::Existing:
      return "existing";
    case ObjectRole::Defined:
      return "defined";
    case ObjectRole::Temporary:
      return "temporary";
    case ObjectRole::Braiding:
      return "braiding";
  }
  TNPLANAR_UNREACHABLE;
}

ObjectHandle ObjectTable::push(ObjectInfo info) {
  ObjectHandle h{entries_.size()};
  entries_.push_back(std::move(info));
  return h;
}

ObjectHandle ObjectTable::bind(const std::string& label, ObjectRole role) {
  if (auto it = by_label_.find(label); it != by_label_.end()) return it->second;
  auto h = push({.label = label, .role = role});
  by_label_.emplace(label, h);
  return h;
}

std::optional<ObjectHandle> ObjectTable::find(const std::string& label) const {
  if (auto it = by_label_.find(label); it != by_label_.end()) return it->second;
  return std::nullopt;
}

ObjectHandle ObjectTable::make_temporary() {
  return push({.label = "#" + temporary_prefix_ +
                        std::to_string(++ntemporaries_),
               .role = ObjectRole::Temporary});
}

ObjectHandle ObjectTable::make_braiding() {
  return push({.label = "#braid" + std::to_string(++nbraidings_),
               .role = ObjectRole::Braiding});
}

const ObjectInfo& ObjectTable::operator[](ObjectHandle h) const {
  TNPLANAR_ASSERT(h.value < entries_.size());
  return entries_[h.value];
}

ObjectInfo& ObjectTable::operator[](ObjectHandle h) {
  TNPLANAR_ASSERT(h.value < entries_.size());
  return entries_[h.value];
}

std::string ObjectTable::label(const ObjectRef& ref) const {
  if (ref.is_label()) return ref.label();
  return (*this)[ref.handle()].label;
}

container::svector<ObjectHandle> ObjectTable::handles(ObjectRole role) const {
  container::svector<ObjectHandle> result;
  for (std::size_t i = 0; i != entries_.size(); ++i)
    if (entries_[i].role == role) result.push_back(ObjectHandle{i});
  return result;
}

}  // namespace tnplanar
