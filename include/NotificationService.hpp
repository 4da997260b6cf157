#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace calsync {

// The system notification center as seen from this process.
class NotificationService {
public:
  virtual ~NotificationService() = default;

  virtual bool schedule(const std::string &id, Instant trigger,
                        const std::string &payload) = 0;
  virtual bool cancel(const std::string &id) = 0;
  virtual std::vector<std::string> listPending() = 0;
};

} // namespace calsync
