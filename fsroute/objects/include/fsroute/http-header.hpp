#pragma once

#include <string>

namespace fsroute::http {

struct Header {
  bool operator==(const Header&) const = default;

  std::string name;
  std::string value;
};

}  // namespace fsroute::http
