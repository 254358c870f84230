#include <gtest/gtest.h>

#include "fixtures.h"
#include "world_version.h"

using namespace mcscribe;
using namespace mcscribe::fixtures;

namespace
{

WorldVersion version(int32_t id, const std::string &name)
{
  WorldVersion v;
  v.id = id;
  v.name = name;
  return v;
}

} // namespace

TEST(ChunkSchemaSelectionTest, NumericBoundaries)
{
  EXPECT_EQ(selectChunkSchema(version(1343, "1.12.2")), ChunkSchema::Legacy);
  EXPECT_EQ(selectChunkSchema(version(2681, "1.16.5")), ChunkSchema::Legacy);
  EXPECT_EQ(selectChunkSchema(version(2682, "21w03a")), ChunkSchema::V1_17);
  EXPECT_EQ(selectChunkSchema(version(2730, "1.17.1")), ChunkSchema::V1_17);
  EXPECT_EQ(selectChunkSchema(version(2731, "1.18")), ChunkSchema::V1_18);
  EXPECT_EQ(selectChunkSchema(version(3120, "1.19.2")), ChunkSchema::V1_18);
}

TEST(ChunkSchemaSelectionTest, OldNameWinsOverLargeId)
{
  EXPECT_EQ(selectChunkSchema(version(19133, "old")), ChunkSchema::Legacy);
  EXPECT_EQ(selectChunkSchema(version(2731, "old")), ChunkSchema::Legacy);
}

TEST(LevelDatTest, ModernVersionCompound)
{
  WorldVersion v = parseLevelDat(modernLevelDat(2730, "1.17.1", true));
  EXPECT_EQ(v.id, 2730);
  EXPECT_EQ(v.name, "1.17.1");
  EXPECT_TRUE(v.snapshot);
  EXPECT_FALSE(v.isLegacy());
}

TEST(LevelDatTest, SynthesizesLegacyDescriptor)
{
  WorldVersion v = parseLevelDat(legacyLevelDat(19133));
  EXPECT_EQ(v.id, 19133);
  EXPECT_EQ(v.name, "old");
  EXPECT_FALSE(v.snapshot);
  EXPECT_TRUE(v.isLegacy());
}

TEST(LevelDatTest, MissingBothVersionsIsFatal)
{
  nbt::tag_compound root;
  root.put("Data", nbt::tag_compound{{"LevelName", "nameless"}});
  EXPECT_THROW(parseLevelDat(root), LevelDatError);
}

TEST(LevelDatTest, MissingDataIsFatal)
{
  nbt::tag_compound root{{"Other", 1}};
  EXPECT_THROW(parseLevelDat(root), LevelDatError);
}

TEST(LevelDatTest, WrongFieldTypeIsFatal)
{
  nbt::tag_compound version_tag{{"Id", "not a number"}, {"Name", "1.18"}};
  nbt::tag_compound data;
  data.put("Version", std::move(version_tag));
  nbt::tag_compound root;
  root.put("Data", std::move(data));
  EXPECT_THROW(parseLevelDat(root), LevelDatError);
}

TEST(LevelDatTest, ReadsGzipFile)
{
  TempDir tmp;
  writeFile(tmp.path() / "level.dat", gzipCompress(serializeNbt(modernLevelDat(2975, "1.19.2"))));

  WorldVersion v = readLevelDat(tmp.path() / "level.dat");
  EXPECT_EQ(v.id, 2975);
  EXPECT_EQ(v.name, "1.19.2");
}

TEST(LevelDatTest, UnreadableFileIsFatal)
{
  TempDir tmp;
  EXPECT_THROW(readLevelDat(tmp.path() / "level.dat"), LevelDatError);

  writeFile(tmp.path() / "level.dat", "garbage that is not gzip");
  EXPECT_THROW(readLevelDat(tmp.path() / "level.dat"), LevelDatError);
}
