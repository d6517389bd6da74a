#include <gtest/gtest.h>
#include "../src/ChunkMeshBuilder.h"

#include <vector>

class ChunkMeshBuilderTest : public ::testing::Test
{
protected:
    GridGeometry geometry;
    std::vector<Tile> tiles;

    void SetUp() override
    {
        geometry.type = TileType::Square;
        geometry.slotSize = glm::vec2(16.0f, 16.0f);
        geometry.renderSize = glm::vec2(16.0f, 16.0f);
    }

    void AddTile(glm::ivec2 cell, const TileBuilder &builder)
    {
        tiles.push_back(builder.Build(cell));
    }
};

// --- Geometry ---

TEST_F(ChunkMeshBuilderTest, EmptyInput_EmptyMesh)
{
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);
    EXPECT_TRUE(mesh.IsEmpty());
    EXPECT_EQ(mesh.GetQuadCount(), 0u);
}

TEST_F(ChunkMeshBuilderTest, SingleTile_OneQuad)
{
    AddTile(glm::ivec2(0, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(3)));
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);

    ASSERT_EQ(mesh.vertices.size(), 4u);
    EXPECT_EQ(mesh.indices, (std::vector<uint32_t>{0, 1, 2, 0, 2, 3}));
    EXPECT_EQ(mesh.GetIndexCount(), 6u);

    EXPECT_EQ(mesh.vertices[0].position, glm::vec3(0.0f, 0.0f, 0.0f));
    EXPECT_EQ(mesh.vertices[1].position, glm::vec3(16.0f, 0.0f, 0.0f));
    EXPECT_EQ(mesh.vertices[2].position, glm::vec3(16.0f, 16.0f, 0.0f));
    EXPECT_EQ(mesh.vertices[3].position, glm::vec3(0.0f, 16.0f, 0.0f));
}

TEST_F(ChunkMeshBuilderTest, IndicesOffsetPerQuad)
{
    AddTile(glm::ivec2(0, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
    AddTile(glm::ivec2(1, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);

    ASSERT_EQ(mesh.indices.size(), 12u);
    EXPECT_EQ(mesh.indices[6], 4u);
    EXPECT_EQ(mesh.indices[11], 7u);
    EXPECT_EQ(mesh.vertices[4].position.x, 16.0f);
}

TEST_F(ChunkMeshBuilderTest, IsometricQuadCenteredOnCell)
{
    geometry.type = TileType::Isometric;
    geometry.renderSize = glm::vec2(32.0f, 16.0f);
    AddTile(glm::ivec2(1, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);

    ASSERT_EQ(mesh.vertices.size(), 4u);
    EXPECT_EQ(mesh.vertices[0].position, glm::vec3(0.0f, 8.0f, 0.0f));
    EXPECT_EQ(mesh.vertices[2].position, glm::vec3(32.0f, 24.0f, 0.0f));
}

// --- Skipped Tiles ---

TEST_F(ChunkMeshBuilderTest, InvisibleTilesSkipped)
{
    AddTile(glm::ivec2(0, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)).WithVisible(false));
    EXPECT_TRUE(BuildChunkMesh(geometry, tiles).IsEmpty());
}

TEST_F(ChunkMeshBuilderTest, LayerlessTilesSkipped)
{
    AddTile(glm::ivec2(0, 0), TileBuilder().WithColor(glm::vec4(1.0f, 0.0f, 0.0f, 1.0f)));
    AddTile(glm::ivec2(1, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);
    EXPECT_EQ(mesh.GetQuadCount(), 1u);
    EXPECT_EQ(mesh.vertices[0].gridIndex, glm::ivec2(1, 0));
}

// --- Attributes ---

TEST_F(ChunkMeshBuilderTest, AttributesCopiedToEveryCorner)
{
    AddTile(glm::ivec2(2, 5), TileBuilder()
                                  .WithLayer(0, TileLayer::FromTexture(1, FLIP_HORIZONTAL))
                                  .WithLayer(2, TileLayer::FromTexture(7, FLIP_BOTH))
                                  .WithColor(glm::vec4(0.8f, 1.0f, 0.8f, 0.5f)));
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);

    for (const ChunkVertex &v : mesh.vertices)
    {
        EXPECT_EQ(v.gridIndex, glm::ivec2(2, 5));
        EXPECT_EQ(v.textureIndices, glm::ivec4(1, -1, 7, -1));
        EXPECT_EQ(v.animations, glm::ivec4(-1));
        EXPECT_EQ(v.flips, glm::uvec4(FLIP_HORIZONTAL, FLIP_NONE, FLIP_BOTH, FLIP_NONE));
        EXPECT_EQ(v.color, glm::vec4(0.8f, 1.0f, 0.8f, 0.5f));
    }
    EXPECT_FALSE(mesh.HasAnimation());
}

TEST_F(ChunkMeshBuilderTest, AnimatedLaneRecorded)
{
    AddTile(glm::ivec2(0, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
    AddTile(glm::ivec2(1, 0), TileBuilder()
                                  .WithLayer(0, TileLayer::FromTexture(2))
                                  .WithAnimation(4, 1));
    ChunkMesh mesh = BuildChunkMesh(geometry, tiles);

    ASSERT_EQ(mesh.animatedLayers.size(), 1u);
    EXPECT_EQ(mesh.animatedLayers[0].firstVertex, 4u);
    EXPECT_EQ(mesh.animatedLayers[0].layer, 1);
    EXPECT_EQ(mesh.animatedLayers[0].animationId, 4);
    EXPECT_EQ(mesh.vertices[4].textureIndices[1], -1);
    EXPECT_EQ(mesh.vertices[4].animations[1], 4);
    EXPECT_EQ(mesh.vertices[4].textureIndices[0], 2);
}

TEST_F(ChunkMeshBuilderTest, RebuildIsDeterministic)
{
    AddTile(glm::ivec2(0, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(1)));
    AddTile(glm::ivec2(3, 2), TileBuilder().WithAnimation(0));

    ChunkMesh first = BuildChunkMesh(geometry, tiles);
    ChunkMesh second;
    second.vertices.resize(32);
    BuildChunkMesh(geometry, tiles, second);

    ASSERT_EQ(first.vertices.size(), second.vertices.size());
    for (std::size_t i = 0; i < first.vertices.size(); ++i)
    {
        EXPECT_EQ(first.vertices[i].position, second.vertices[i].position);
        EXPECT_EQ(first.vertices[i].textureIndices, second.vertices[i].textureIndices);
    }
    EXPECT_EQ(first.indices, second.indices);
}
