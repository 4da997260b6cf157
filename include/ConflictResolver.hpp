#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace calsync {

struct RepushTarget {
  std::string recordId;
  Origin origin;
};

struct Resolution {
  SyncableRecord winner;
  Origin winningOrigin = Origin::Local;
  // Origins whose copy differs from the winner and must receive it.
  std::vector<RepushTarget> repush;
  std::string reason;
};

/**
 * Picks the surviving version of one logical record.
 *
 * newer-wins compares lastModified and breaks ties local > remote-backend >
 * external-calendar. local-wins and remote-wins ignore timestamps; remote-wins
 * prefers the remote backend copy, then the external calendar copy. A deletion
 * then overrides the policy winner when the winner is an edit whose version is
 * not newer than the deletion.
 *
 * The winner always carries a version above every input.
 */
class ConflictResolver {
public:
  Resolution resolve(const SyncableRecord &local,
                     const std::optional<SyncableRecord> &remote,
                     const std::optional<SyncableRecord> &external,
                     ConflictPolicy policy) const;
};

} // namespace calsync
