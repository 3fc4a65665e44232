#include <TNPlanar/core/index.hpp>

#include <range/v3/algorithm/reverse.hpp>

namespace tnplanar {

std::string Index::to_string() const {
  return positional() ? std::to_string(ordinal()) : label();
}

std::string to_string(const IndexList& indices) {
  std::string result;
  for (std::size_t i = 0; i != indices.size(); ++i) {
    if (i != 0) result += ",";
    result += indices[i].to_string();
  }
  return result;
}

IndexList reversed(const IndexList& indices) {
  IndexList result(indices.begin(), indices.end());
  ranges::reverse(result);
  return result;
}

IndexList concat(const IndexList& a, const IndexList& b) {
  IndexList result(a.begin(), a.end());
  result.insert(result.end(), b.begin(), b.end());
  return result;
}

}  // namespace tnplanar
