#pragma once
#include <string>

namespace calsync {

class UuidUtils {
public:
  // Random (version 4) UUID in canonical lowercase form.
  static std::string generate();
};

} // namespace calsync
