#ifndef TNPLANAR_CONTAINER_HPP
#define TNPLANAR_CONTAINER_HPP

#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>

#include <functional>
#include <vector>

namespace tnplanar {

namespace container {

template <typename T>
using vector = std::vector<T>;
template <typename T, std::size_t N = 8>
using svector = boost::container::small_vector<T, N>;

template <typename Key, typename Value, typename Compare = std::less<Key>>
using map = boost::container::flat_map<Key, Value, Compare>;

}  // namespace container

}  // namespace tnplanar

#endif  // TNPLANAR_CONTAINER_HPP
