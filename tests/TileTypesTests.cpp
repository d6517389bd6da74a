#include <gtest/gtest.h>
#include "../src/TileTypes.h"
#include "../src/TilemapError.h"

#include <climits>

class TileTypesTest : public ::testing::Test
{
protected:
    Tile tile;

    void SetUp() override
    {
        tile = TileBuilder()
                   .WithLayer(0, TileLayer::FromTexture(1))
                   .WithLayer(1, TileLayer::FromTexture(2))
                   .Build(glm::ivec2(0, 0));
    }
};

// --- Floor Division ---

TEST_F(TileTypesTest, CellToChunk_Positive)
{
    EXPECT_EQ(CellToChunk(glm::ivec2(0, 15), 16), glm::ivec2(0, 0));
    EXPECT_EQ(CellToChunk(glm::ivec2(16, 31), 16), glm::ivec2(1, 1));
}

TEST_F(TileTypesTest, CellToChunk_Negative)
{
    EXPECT_EQ(CellToChunk(glm::ivec2(-1, -16), 16), glm::ivec2(-1, -1));
    EXPECT_EQ(CellToChunk(glm::ivec2(-17, 0), 16), glm::ivec2(-2, 0));
}

TEST_F(TileTypesTest, CellToChunkLocal_AlwaysInRange)
{
    EXPECT_EQ(CellToChunkLocal(glm::ivec2(-1, 0), 16), glm::ivec2(15, 0));
    EXPECT_EQ(CellToChunkLocal(glm::ivec2(-16, -17), 16), glm::ivec2(0, 15));
    EXPECT_EQ(CellToChunkLocal(glm::ivec2(33, 5), 16), glm::ivec2(1, 5));
}

// --- Layer Placement ---

TEST_F(TileTypesTest, PlaceLayer_TopAppendsAboveHighest)
{
    PlaceLayer(tile, TileLayerPosition::Top(), TileLayer::FromTexture(7));
    EXPECT_EQ(tile.GetLayerCount(), 3);
    EXPECT_EQ(tile.layers[2].textureIndex, 7);
}

TEST_F(TileTypesTest, PlaceLayer_TopReplacesLastWhenFull)
{
    PlaceLayer(tile, TileLayerPosition::Top(), TileLayer::FromTexture(3));
    PlaceLayer(tile, TileLayerPosition::Top(), TileLayer::FromTexture(4));
    PlaceLayer(tile, TileLayerPosition::Top(), TileLayer::FromTexture(5));
    EXPECT_EQ(tile.GetLayerCount(), MAX_LAYER_COUNT);
    EXPECT_EQ(tile.layers[MAX_LAYER_COUNT - 1].textureIndex, 5);
    EXPECT_EQ(tile.layers[2].textureIndex, 3);
}

TEST_F(TileTypesTest, PlaceLayer_BottomShiftsUp)
{
    PlaceLayer(tile, TileLayerPosition::Bottom(), TileLayer::FromTexture(9));
    EXPECT_EQ(tile.layers[0].textureIndex, 9);
    EXPECT_EQ(tile.layers[1].textureIndex, 1);
    EXPECT_EQ(tile.layers[2].textureIndex, 2);
}

TEST_F(TileTypesTest, PlaceLayer_IndexOverwrites)
{
    PlaceLayer(tile, TileLayerPosition::At(1), TileLayer::FromTexture(6, FLIP_VERTICAL));
    EXPECT_EQ(tile.layers[1].textureIndex, 6);
    EXPECT_EQ(tile.layers[1].flip, static_cast<uint32_t>(FLIP_VERTICAL));
}

TEST_F(TileTypesTest, PlaceLayer_IndexOutOfRangeIgnored)
{
    Tile before = tile;
    PlaceLayer(tile, TileLayerPosition::At(MAX_LAYER_COUNT), TileLayer::FromTexture(6));
    EXPECT_EQ(tile, before);
}

TEST_F(TileTypesTest, PlaceLayer_AnimationOverTextureConflicts)
{
    try
    {
        PlaceLayer(tile, TileLayerPosition::At(0), TileLayer::FromAnimation(0));
        FAIL() << "expected a LayerConflict";
    }
    catch (const TilemapError &e)
    {
        EXPECT_EQ(e.GetKind(), TilemapErrorKind::LayerConflict);
    }
    EXPECT_EQ(tile.layers[0].textureIndex, 1);
}

TEST_F(TileTypesTest, PlaceLayer_AnimationIntoEmptySlotAllowed)
{
    EXPECT_NO_THROW(PlaceLayer(tile, TileLayerPosition::Top(), TileLayer::FromAnimation(0)));
    EXPECT_TRUE(tile.HasAnimation());
}

// --- Builder ---

TEST_F(TileTypesTest, TileBuilder_Defaults)
{
    Tile built = TileBuilder().Build(glm::ivec2(3, -2));
    EXPECT_EQ(built.index, glm::ivec2(3, -2));
    EXPECT_EQ(built.GetLayerCount(), 0);
    EXPECT_EQ(built.color, glm::vec4(1.0f));
    EXPECT_TRUE(built.visible);
}

TEST_F(TileTypesTest, TileBuilder_ConflictingLayerThrows)
{
    TileBuilder builder;
    builder.WithLayer(0, TileLayer::FromTexture(1));
    EXPECT_THROW(builder.WithAnimation(0, 0), TilemapError);
}

// --- Updater ---

TEST_F(TileTypesTest, TileUpdater_OnlyTouchesSetFields)
{
    TileUpdater updater;
    updater.color = glm::vec4(0.5f);
    updater.Apply(tile);
    EXPECT_EQ(tile.color, glm::vec4(0.5f));
    EXPECT_EQ(tile.layers[0].textureIndex, 1);
    EXPECT_TRUE(tile.visible);
}

TEST_F(TileTypesTest, TileUpdater_FlipAppliesToOccupiedLayers)
{
    TileUpdater updater;
    updater.flip = FLIP_BOTH;
    updater.Apply(tile);
    EXPECT_EQ(tile.layers[0].flip, static_cast<uint32_t>(FLIP_BOTH));
    EXPECT_EQ(tile.layers[1].flip, static_cast<uint32_t>(FLIP_BOTH));
    EXPECT_EQ(tile.layers[2].flip, static_cast<uint32_t>(FLIP_NONE));
}

TEST_F(TileTypesTest, TileUpdater_LayerAndVisibility)
{
    TileUpdater updater;
    updater.layer = LayerUpdater{TileLayerPosition::Top(), TileLayer::FromTexture(3)};
    updater.visible = false;
    updater.Apply(tile);
    EXPECT_EQ(tile.layers[2].textureIndex, 3);
    EXPECT_FALSE(tile.visible);
}

// --- Areas ---

TEST_F(TileTypesTest, TileArea_ExtentIsInclusive)
{
    TileArea area(glm::ivec2(2, 2), glm::uvec2(10, 7));
    EXPECT_EQ(area.dest, glm::ivec2(11, 8));
    EXPECT_EQ(area.GetCellCount(), 70);
}

TEST_F(TileTypesTest, TileArea_ZeroExtentIsEmpty)
{
    TileArea area(glm::ivec2(0, 0), glm::uvec2(0, 5));
    EXPECT_TRUE(area.IsEmpty());
    EXPECT_EQ(area.GetCellCount(), 0);
}

TEST_F(TileTypesTest, TileArea_ExtentClipsAtIntMax)
{
    TileArea area(glm::ivec2(INT_MAX - 1, 0), glm::uvec2(10, 1));
    EXPECT_EQ(area.dest, glm::ivec2(INT_MAX, 0));
    EXPECT_EQ(area.GetCellCount(), 2);

    TileArea whole = TileArea::FromCorners(glm::ivec2(INT_MIN, 0), glm::ivec2(INT_MAX, 0));
    EXPECT_EQ(whole.GetCellCount(), int64_t{1} << 32);
}

TEST_F(TileTypesTest, ChunkCellArea_NonPowerOfTwo)
{
    EXPECT_EQ(ChunkCellArea(glm::ivec2(-1, 2), 3).origin, glm::ivec2(-3, 6));
    EXPECT_EQ(ChunkCellArea(glm::ivec2(-1, 2), 3).dest, glm::ivec2(-1, 8));
    EXPECT_EQ(CellToChunkLocal(glm::ivec2(INT_MIN, INT_MAX), 3), glm::ivec2(1, 1));
}

TEST_F(TileTypesTest, IAabb2d_ClipDisjointIsEmpty)
{
    IAabb2d box{glm::ivec2(0, 0), glm::ivec2(9, 9)};
    EXPECT_TRUE(box.Clip(TileArea(glm::ivec2(20, 20), glm::uvec2(4, 4))).IsEmpty());
}

TEST_F(TileTypesTest, Aabb2d_TouchingEdgesIntersect)
{
    Aabb2d a{glm::vec2(0.0f), glm::vec2(10.0f)};
    Aabb2d b{glm::vec2(10.0f, 0.0f), glm::vec2(20.0f, 10.0f)};
    Aabb2d c{glm::vec2(10.5f, 0.0f), glm::vec2(20.0f, 10.0f)};
    EXPECT_TRUE(a.Intersects(b));
    EXPECT_FALSE(a.Intersects(c));
    EXPECT_TRUE(a.Expanded(1.0f).Intersects(c));
}
