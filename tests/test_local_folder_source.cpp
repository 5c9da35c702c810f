// Repository: loopcast
// Component: Local folder source unit tests

#include <gtest/gtest.h>

#include <filesystem>

#include "loopcast/Errors.hpp"
#include "loopcast/source/LocalFolderSource.hpp"
#include "support/TempDir.hpp"

namespace loopcast::source {
namespace {

using tests::TempDir;

config::SourceConfig LocalConfig(const std::string& root, bool recursive = true) {
  config::SourceConfig config;
  config.type = config::SourceType::kLocal;
  config.path = root;
  config.recursive = recursive;
  config.extensions = config::DefaultExtensions();
  return config;
}

std::vector<std::string> Names(const std::vector<MediaItem>& items) {
  std::vector<std::string> names;
  for (const auto& item : items) names.push_back(item.name);
  return names;
}

TEST(LocalFolderSourceTest, ListsVideoFilesSortedByPath) {
  TempDir dir;
  dir.WriteFile("b.mp4");
  dir.WriteFile("a.mkv");
  dir.WriteFile("notes.txt");
  dir.WriteFile("c.MOV");

  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  const auto items = source.List(cancel);

  EXPECT_EQ(Names(items), (std::vector<std::string>{"a.mkv", "b.mp4", "c.MOV"}));
  for (const auto& item : items) {
    EXPECT_EQ(item.source, &source);
    EXPECT_EQ(item.generation, 1u);
    ASSERT_TRUE(item.size_bytes.has_value());
    EXPECT_EQ(*item.size_bytes, 1);
  }
}

TEST(LocalFolderSourceTest, RecursionIsConfigurable) {
  TempDir dir;
  dir.WriteFile("top.mp4");
  dir.WriteFile("season1/ep1.mp4");
  dir.WriteFile("season1/extras/bonus.webm");

  util::CancellationToken cancel;
  LocalFolderSource recursive(LocalConfig(dir.str(), true));
  EXPECT_EQ(recursive.List(cancel).size(), 3u);

  LocalFolderSource flat(LocalConfig(dir.str(), false));
  EXPECT_EQ(Names(flat.List(cancel)), (std::vector<std::string>{"top.mp4"}));
}

TEST(LocalFolderSourceTest, MissingRootIsSourceUnavailable) {
  TempDir dir;
  LocalFolderSource source(LocalConfig(dir.str() + "/does-not-exist"));
  util::CancellationToken cancel;
  EXPECT_THROW(source.List(cancel), SourceUnavailableError);
}

TEST(LocalFolderSourceTest, FolderWithoutVideosIsSourceEmpty) {
  TempDir dir;
  dir.WriteFile("readme.md");
  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  EXPECT_THROW(source.List(cancel), SourceEmptyError);
}

TEST(LocalFolderSourceTest, CancelledListingThrowsShutdownRequested) {
  TempDir dir;
  dir.WriteFile("a.mp4");
  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  cancel.Cancel();
  EXPECT_THROW(source.List(cancel), ShutdownRequestedError);
}

TEST(LocalFolderSourceTest, EachListingIsANewGeneration) {
  TempDir dir;
  dir.WriteFile("a.mp4");
  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  const auto first = source.List(cancel);
  const auto second = source.List(cancel);
  EXPECT_LT(first.front().generation, second.front().generation);
}

TEST(LocalFolderSourceTest, ResolveIsIdentityAndRechecksExistence) {
  TempDir dir;
  const std::string path = dir.WriteFile("clip.mp4");
  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  const auto items = source.List(cancel);
  ASSERT_EQ(items.size(), 1u);

  const PlayableInput input = source.Resolve(items.front(), cancel);
  EXPECT_EQ(input.uri, path);
  EXPECT_TRUE(input.headers.empty());

  std::filesystem::remove(path);
  EXPECT_THROW(source.Resolve(items.front(), cancel), ItemUnresolvableError);
}

TEST(LocalFolderSourceTest, DescribeNeverThrowsForUnreadableMedia) {
  TempDir dir;
  dir.WriteFile("garbage.mp4", "definitely not a video");
  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  const auto items = source.List(cancel);

  ItemMetadata meta;
  EXPECT_NO_THROW(meta = source.Describe(items.front()));
  ASSERT_TRUE(meta.size_bytes.has_value());
  EXPECT_EQ(*meta.size_bytes, 22);
  EXPECT_FALSE(meta.duration_ms.has_value());
}

TEST(LocalFolderSourceTest, BrowseListsDirectoriesFirstThenVideos) {
  TempDir dir;
  dir.WriteFile("b.mp4");
  dir.WriteFile("a.mkv");
  dir.WriteFile("notes.txt");
  dir.WriteFile("season2/e1.mp4");
  dir.WriteFile("season1/e1.mp4");

  LocalFolderSource source(LocalConfig(dir.str()));
  util::CancellationToken cancel;
  const auto rows = source.Browse("", cancel);
  ASSERT_EQ(rows.size(), 4u);
  EXPECT_EQ(rows[0].name, "season1");
  EXPECT_TRUE(rows[0].is_directory);
  EXPECT_EQ(rows[1].name, "season2");
  EXPECT_EQ(rows[2].name, "a.mkv");
  EXPECT_FALSE(rows[2].is_directory);
  EXPECT_EQ(rows[3].name, "b.mp4");
  EXPECT_EQ(rows[3].size_bytes.value_or(-1), 1);

  EXPECT_THROW(source.Browse(dir.str() + "/missing", cancel), SourceUnavailableError);
}

TEST(LocalFolderSourceTest, SwitchPathChangesWhatIsListed) {
  TempDir dir;
  dir.WriteFile("top.mp4");
  const std::string nested = dir.WriteFile("season1/e1.mp4");

  LocalFolderSource source(LocalConfig(dir.str(), /*recursive=*/false));
  util::CancellationToken cancel;
  EXPECT_EQ(Names(source.List(cancel)), std::vector<std::string>({"top.mp4"}));

  const std::string season = (dir.path() / "season1").string();
  source.SwitchPath(season);
  EXPECT_EQ(source.RootPath(), season);
  EXPECT_EQ(source.Label(), "local:" + season);
  const auto items = source.List(cancel);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].id, nested);
}

TEST(LocalFolderSourceTest, CheckAvailableRequiresTheRootFolder) {
  TempDir dir;
  util::CancellationToken cancel;
  LocalFolderSource present(LocalConfig(dir.str()));
  EXPECT_NO_THROW(present.CheckAvailable(cancel));
  LocalFolderSource missing(LocalConfig(dir.str() + "/gone"));
  EXPECT_THROW(missing.CheckAvailable(cancel), SourceUnavailableError);
}

}  // namespace
}  // namespace loopcast::source
