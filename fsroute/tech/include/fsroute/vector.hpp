#pragma once

#include <amc/vector.hpp>

namespace fsroute {

template <class T>
using vector = amc::vector<T>;

}  // namespace fsroute
