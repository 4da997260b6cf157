#include "ConflictResolver.hpp"
#include <algorithm>

namespace calsync {

namespace {

struct Candidate {
  const SyncableRecord *record;
  Origin origin;
};

bool sameContent(const SyncableRecord &a, const SyncableRecord &b) {
  if (a.deleted != b.deleted)
    return false;
  return a.deleted || a.payload == b.payload;
}

} // namespace

Resolution ConflictResolver::resolve(const SyncableRecord &local,
                                     const std::optional<SyncableRecord> &remote,
                                     const std::optional<SyncableRecord> &external,
                                     ConflictPolicy policy) const {
  // Priority order doubles as the newer-wins tie-break.
  std::vector<Candidate> candidates{{&local, Origin::Local}};
  if (remote)
    candidates.push_back({&*remote, Origin::RemoteBackend});
  if (external)
    candidates.push_back({&*external, Origin::ExternalCalendar});

  Candidate chosen = candidates.front();
  Resolution result;

  switch (policy) {
  case ConflictPolicy::NewerWins:
    for (const auto &c : candidates) {
      if (c.record->lastModified > chosen.record->lastModified)
        chosen = c;
    }
    result.reason = "newer-wins";
    break;
  case ConflictPolicy::LocalWins:
    result.reason = "local-wins";
    break;
  case ConflictPolicy::RemoteWins:
    if (candidates.size() > 1)
      chosen = candidates[1];
    result.reason = "remote-wins";
    break;
  }

  if (!chosen.record->deleted) {
    const Candidate *deletion = nullptr;
    for (const auto &c : candidates) {
      if (c.record->deleted &&
          (!deletion || c.record->version > deletion->record->version))
        deletion = &c;
    }
    if (deletion && deletion->record->version >= chosen.record->version) {
      chosen = *deletion;
      result.reason += ", deletion kept over an older edit";
    }
  }

  int64_t maxVersion = 0;
  for (const auto &c : candidates)
    maxVersion = std::max(maxVersion, c.record->version);

  result.winner = *chosen.record;
  result.winner.id = local.id;
  result.winner.origin = chosen.origin;
  result.winner.version = maxVersion + 1;
  result.winningOrigin = chosen.origin;

  for (const auto &c : candidates) {
    if (c.origin == Origin::Local)
      continue;
    if (!sameContent(*c.record, result.winner))
      result.repush.push_back({local.id, c.origin});
  }
  return result;
}

} // namespace calsync
