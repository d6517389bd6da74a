#include <gtest/gtest.h>
#include "../src/TileChunk.h"

class TileChunkTest : public ::testing::Test
{
protected:
    TileChunk chunk{glm::ivec2(1, -1), 8};

    Tile MakeTile(glm::ivec2 cell, int texture = 0)
    {
        return TileBuilder().WithLayer(0, TileLayer::FromTexture(texture)).Build(cell);
    }
};

// --- Basic Operations ---

TEST_F(TileChunkTest, InitiallyEmpty)
{
    EXPECT_TRUE(chunk.IsEmpty());
    EXPECT_EQ(chunk.GetTileCount(), 0);
    EXPECT_FALSE(chunk.IsDirty());
}

TEST_F(TileChunkTest, GetSize)
{
    EXPECT_EQ(chunk.GetSize(), 8);
}

TEST_F(TileChunkTest, GetCoord)
{
    EXPECT_EQ(chunk.GetCoord(), glm::ivec2(1, -1));
}

TEST_F(TileChunkTest, Set_Single)
{
    EXPECT_FALSE(chunk.Set(glm::ivec2(3, 4), MakeTile(glm::ivec2(11, -4))));
    ASSERT_NE(chunk.Get(glm::ivec2(3, 4)), nullptr);
    EXPECT_EQ(chunk.Get(glm::ivec2(3, 4))->index, glm::ivec2(11, -4));
    EXPECT_EQ(chunk.GetTileCount(), 1);
    EXPECT_TRUE(chunk.IsDirty());
}

TEST_F(TileChunkTest, Set_ReplaceDoesNotGrowCount)
{
    chunk.Set(glm::ivec2(0, 0), MakeTile(glm::ivec2(8, -8), 1));
    EXPECT_TRUE(chunk.Set(glm::ivec2(0, 0), MakeTile(glm::ivec2(8, -8), 2)));
    EXPECT_EQ(chunk.GetTileCount(), 1);
    EXPECT_EQ(chunk.Get(glm::ivec2(0, 0))->layers[0].textureIndex, 2);
}

TEST_F(TileChunkTest, Remove_Existing)
{
    chunk.Set(glm::ivec2(2, 2), MakeTile(glm::ivec2(10, -6)));
    chunk.ClearDirty();
    EXPECT_TRUE(chunk.Remove(glm::ivec2(2, 2)));
    EXPECT_EQ(chunk.Get(glm::ivec2(2, 2)), nullptr);
    EXPECT_TRUE(chunk.IsEmpty());
    EXPECT_TRUE(chunk.IsDirty());
}

TEST_F(TileChunkTest, Remove_EmptySlotIsNoOp)
{
    EXPECT_FALSE(chunk.Remove(glm::ivec2(2, 2)));
    EXPECT_FALSE(chunk.IsDirty());
}

TEST_F(TileChunkTest, Clear_RemovesAll)
{
    chunk.Set(glm::ivec2(0, 0), MakeTile(glm::ivec2(8, -8)));
    chunk.Set(glm::ivec2(7, 7), MakeTile(glm::ivec2(15, -1)));
    chunk.Clear();
    EXPECT_TRUE(chunk.IsEmpty());
    EXPECT_EQ(chunk.Get(glm::ivec2(7, 7)), nullptr);
}

// --- Bounds Checking ---

TEST_F(TileChunkTest, OutOfBounds_NegativeLocal)
{
    EXPECT_FALSE(chunk.Set(glm::ivec2(-1, 0), MakeTile(glm::ivec2(7, -8))));
    EXPECT_EQ(chunk.Get(glm::ivec2(-1, 0)), nullptr);
    EXPECT_EQ(chunk.GetTileCount(), 0);
}

TEST_F(TileChunkTest, OutOfBounds_BeyondSize)
{
    EXPECT_FALSE(chunk.Set(glm::ivec2(8, 0), MakeTile(glm::ivec2(16, -8))));
    EXPECT_EQ(chunk.Get(glm::ivec2(0, 8)), nullptr);
    EXPECT_FALSE(chunk.Remove(glm::ivec2(8, 8)));
}

// --- Animation Tracking ---

TEST_F(TileChunkTest, HasAnimation_TracksSetAndRemove)
{
    Tile animated = TileBuilder().WithAnimation(0).Build(glm::ivec2(8, -8));
    chunk.Set(glm::ivec2(0, 0), animated);
    EXPECT_TRUE(chunk.HasAnimation());

    chunk.Set(glm::ivec2(0, 0), MakeTile(glm::ivec2(8, -8)));
    EXPECT_FALSE(chunk.HasAnimation());

    chunk.Set(glm::ivec2(1, 0), animated);
    chunk.Remove(glm::ivec2(1, 0));
    EXPECT_FALSE(chunk.HasAnimation());
}

TEST_F(TileChunkTest, OnTileEdited_UpdatesAnimationCount)
{
    chunk.Set(glm::ivec2(0, 0), MakeTile(glm::ivec2(8, -8)));
    chunk.OnTileEdited(false, true);
    EXPECT_TRUE(chunk.HasAnimation());
    chunk.OnTileEdited(true, false);
    EXPECT_FALSE(chunk.HasAnimation());
}

// --- Iteration ---

TEST_F(TileChunkTest, ForEachTile_RowMajorOrder)
{
    chunk.Set(glm::ivec2(5, 1), MakeTile(glm::ivec2(13, -7)));
    chunk.Set(glm::ivec2(2, 0), MakeTile(glm::ivec2(10, -8)));
    chunk.Set(glm::ivec2(0, 1), MakeTile(glm::ivec2(8, -7)));

    std::vector<glm::ivec2> order;
    chunk.ForEachTile([&order](const Tile &tile) { order.push_back(tile.index); });

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], glm::ivec2(10, -8));
    EXPECT_EQ(order[1], glm::ivec2(8, -7));
    EXPECT_EQ(order[2], glm::ivec2(13, -7));
}

TEST_F(TileChunkTest, GetCellArea)
{
    TileArea area = chunk.GetCellArea();
    EXPECT_EQ(area.origin, glm::ivec2(8, -8));
    EXPECT_EQ(area.dest, glm::ivec2(15, -1));
}
