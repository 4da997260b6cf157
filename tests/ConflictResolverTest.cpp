#include "ConflictResolver.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace calsync;
using calsync::test::at;
using calsync::test::dailySeries;
using calsync::test::seriesRecord;

namespace {

SyncableRecord edit(const std::string &title, int64_t version,
                    Instant lastModified, Origin origin) {
  return seriesRecord("s1", version, lastModified,
                      dailySeries(title, at(2026, 1, 1, 9)), origin);
}

SyncableRecord deletion(int64_t version, Instant lastModified, Origin origin) {
  SyncableRecord record = edit("", version, lastModified, origin);
  record.deleted = true;
  return record;
}

bool repushes(const Resolution &resolution, Origin origin) {
  for (const auto &target : resolution.repush) {
    if (target.origin == origin)
      return true;
  }
  return false;
}

} // namespace

TEST(ConflictResolverTest, NewerWinsPicksLatestEdit) {
  ConflictResolver resolver;
  auto local = edit("Local", 3, at(2026, 1, 2, 10), Origin::Local);
  auto remote = edit("Remote", 2, at(2026, 1, 2, 11), Origin::RemoteBackend);

  auto resolution =
      resolver.resolve(local, remote, std::nullopt, ConflictPolicy::NewerWins);

  EXPECT_EQ(resolution.winningOrigin, Origin::RemoteBackend);
  EXPECT_EQ(resolution.winner.payload, remote.payload);
  EXPECT_EQ(resolution.winner.version, 4);
  EXPECT_FALSE(repushes(resolution, Origin::RemoteBackend));
}

TEST(ConflictResolverTest, NewerWinsRepushesToLosingOrigin) {
  ConflictResolver resolver;
  auto local = edit("Local", 3, at(2026, 1, 2, 12), Origin::Local);
  auto remote = edit("Remote", 2, at(2026, 1, 2, 11), Origin::RemoteBackend);

  auto resolution =
      resolver.resolve(local, remote, std::nullopt, ConflictPolicy::NewerWins);

  EXPECT_EQ(resolution.winningOrigin, Origin::Local);
  EXPECT_EQ(resolution.winner.payload, local.payload);
  ASSERT_EQ(resolution.repush.size(), 1u);
  EXPECT_EQ(resolution.repush[0].origin, Origin::RemoteBackend);
  EXPECT_EQ(resolution.repush[0].recordId, "s1");
}

TEST(ConflictResolverTest, NewerWinsTieGoesLocalThenRemote) {
  ConflictResolver resolver;
  const Instant same = at(2026, 1, 2, 10);
  auto local = edit("Local", 1, same, Origin::Local);
  auto remote = edit("Remote", 1, same, Origin::RemoteBackend);
  auto external = edit("External", 1, same, Origin::ExternalCalendar);

  auto resolution =
      resolver.resolve(local, remote, external, ConflictPolicy::NewerWins);
  EXPECT_EQ(resolution.winningOrigin, Origin::Local);

  auto older = edit("Local", 1, same - 60, Origin::Local);
  resolution = resolver.resolve(older, remote, external, ConflictPolicy::NewerWins);
  EXPECT_EQ(resolution.winningOrigin, Origin::RemoteBackend);
  EXPECT_TRUE(repushes(resolution, Origin::ExternalCalendar));
}

TEST(ConflictResolverTest, LocalWinsDeletionBeatsLaterRemoteEdit) {
  ConflictResolver resolver;
  auto local = deletion(2, at(2026, 1, 2, 10), Origin::Local);
  auto remote = edit("Remote", 2, at(2026, 1, 3, 10), Origin::RemoteBackend);

  auto resolution =
      resolver.resolve(local, remote, std::nullopt, ConflictPolicy::LocalWins);

  EXPECT_TRUE(resolution.winner.deleted);
  EXPECT_EQ(resolution.winningOrigin, Origin::Local);
  EXPECT_TRUE(repushes(resolution, Origin::RemoteBackend));
}

TEST(ConflictResolverTest, DeletionOverridesNewerEditOfSameVersion) {
  ConflictResolver resolver;
  auto local = edit("Local", 2, at(2026, 1, 3, 10), Origin::Local);
  auto remote = deletion(2, at(2026, 1, 2, 10), Origin::RemoteBackend);

  auto resolution =
      resolver.resolve(local, remote, std::nullopt, ConflictPolicy::NewerWins);

  EXPECT_TRUE(resolution.winner.deleted);
  EXPECT_EQ(resolution.winningOrigin, Origin::RemoteBackend);
  EXPECT_EQ(resolution.winner.version, 3);
}

TEST(ConflictResolverTest, EditWithHigherVersionSurvivesOlderDeletion) {
  ConflictResolver resolver;
  auto local = edit("Local", 5, at(2026, 1, 3, 10), Origin::Local);
  auto remote = deletion(2, at(2026, 1, 2, 10), Origin::RemoteBackend);

  auto resolution =
      resolver.resolve(local, remote, std::nullopt, ConflictPolicy::NewerWins);

  EXPECT_FALSE(resolution.winner.deleted);
  EXPECT_TRUE(repushes(resolution, Origin::RemoteBackend));
}

TEST(ConflictResolverTest, RemoteWinsFallsBackToExternalCopy) {
  ConflictResolver resolver;
  auto local = edit("Local", 4, at(2026, 1, 3, 10), Origin::Local);
  auto external = edit("External", 7, at(2026, 1, 1, 10), Origin::ExternalCalendar);

  auto resolution =
      resolver.resolve(local, std::nullopt, external, ConflictPolicy::RemoteWins);

  EXPECT_EQ(resolution.winningOrigin, Origin::ExternalCalendar);
  EXPECT_EQ(resolution.winner.payload, external.payload);
  EXPECT_EQ(resolution.winner.id, "s1");
  EXPECT_EQ(resolution.winner.version, 8);
  EXPECT_TRUE(resolution.repush.empty());
}

TEST(ConflictResolverTest, WinnerVersionExceedsEveryInput) {
  ConflictResolver resolver;
  auto local = edit("Local", 2, at(2026, 1, 1), Origin::Local);
  auto remote = edit("Remote", 9, at(2026, 1, 2), Origin::RemoteBackend);
  auto external = edit("External", 5, at(2026, 1, 3), Origin::ExternalCalendar);

  for (auto policy : {ConflictPolicy::NewerWins, ConflictPolicy::LocalWins,
                      ConflictPolicy::RemoteWins}) {
    auto resolution = resolver.resolve(local, remote, external, policy);
    EXPECT_EQ(resolution.winner.version, 10) << toString(policy);
  }
}
