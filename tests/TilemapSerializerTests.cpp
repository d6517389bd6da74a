#include <gtest/gtest.h>
#include "../src/TilemapSerializer.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

class TilemapSerializerTest : public ::testing::Test
{
protected:
    TilemapWorld world;
    Tilemap *map = nullptr;

    void SetUp() override
    {
        TilemapDescriptor desc;
        desc.name = "ground";
        desc.geometry.type = TileType::Hexagonal;
        desc.geometry.hexLegs = 6;
        desc.geometry.slotSize = glm::vec2(20.0f, 18.0f);
        desc.geometry.renderSize = glm::vec2(20.0f, 24.0f);
        desc.chunkSize = 8;
        desc.transform.translation = glm::vec2(-400.0f, 12.5f);
        desc.transform.zIndex = 3;
        desc.texture.handle = 2;
        desc.texture.atlasSize = glm::uvec2(128, 64);
        desc.texture.rotation = TilemapRotation::Cw270;
        desc.flip = FLIP_VERTICAL;
        desc.material = 4;
        desc.layerOpacities[1] = 0.25f;
        desc.bounds = IAabb2d{glm::ivec2(-10, -10), glm::ivec2(10, 10)};
        map = &world.Create(desc);
    }
};

TEST_F(TilemapSerializerTest, SaveToString_WritesOnlyOccupiedCells)
{
    map->Set(glm::ivec2(-4, 2), TileBuilder().WithLayer(0, TileLayer::FromTexture(1)));
    map->Set(glm::ivec2(3, 0), TileBuilder().WithLayer(0, TileLayer::FromTexture(2)));

    nlohmann::json j = nlohmann::json::parse(TilemapSerializer::SaveToString(*map));
    EXPECT_EQ(j["name"], "ground");
    EXPECT_EQ(j["tileType"], "Hexagonal");
    ASSERT_TRUE(j["tiles"].is_object());
    EXPECT_EQ(j["tiles"].size(), 2u);
    EXPECT_TRUE(j["tiles"].contains("-4,2"));
    EXPECT_FALSE(j["tiles"]["-4,2"].contains("color"));
}

TEST_F(TilemapSerializerTest, RoundTrip_PreservesDescriptorAndTiles)
{
    int water = map->AddAnimation(AnimatedTile({4, 5, 6}, 0.25f));
    map->Set(glm::ivec2(0, 0), TileBuilder()
                                   .WithLayer(0, TileLayer::FromTexture(3, FLIP_VERTICAL))
                                   .WithAnimation(water, 2)
                                   .WithColor(glm::vec4(1.0f, 0.5f, 0.5f, 1.0f)));
    map->Set(glm::ivec2(-9, 7), TileBuilder().WithLayer(1, TileLayer::FromTexture(8)).WithVisible(false));

    TilemapId loadedId = INVALID_TILEMAP_ID;
    ASSERT_TRUE(TilemapSerializer::LoadFromString(TilemapSerializer::SaveToString(*map), world, &loadedId));
    const Tilemap *loaded = world.Get(loadedId);
    ASSERT_NE(loaded, nullptr);
    EXPECT_NE(loadedId, map->GetId());

    const TilemapDescriptor &a = map->GetDescriptor();
    const TilemapDescriptor &b = loaded->GetDescriptor();
    EXPECT_EQ(a.name, b.name);
    EXPECT_EQ(a.geometry, b.geometry);
    EXPECT_EQ(a.chunkSize, b.chunkSize);
    EXPECT_EQ(a.transform, b.transform);
    EXPECT_EQ(a.texture, b.texture);
    EXPECT_EQ(a.material, b.material);
    EXPECT_EQ(a.layerOpacities, b.layerOpacities);
    EXPECT_EQ(b.texture.rotation, TilemapRotation::Cw270);
    EXPECT_EQ(b.flip, static_cast<uint32_t>(FLIP_VERTICAL));
    ASSERT_EQ(b.animations.size(), 1u);
    EXPECT_EQ(b.animations[0].frames, a.animations[0].frames);
    ASSERT_TRUE(b.bounds.has_value());
    EXPECT_EQ(b.bounds->min, glm::ivec2(-10, -10));

    EXPECT_EQ(loaded->GetStorage().GetTileCount(), 2u);
    ASSERT_NE(loaded->Get(glm::ivec2(0, 0)), nullptr);
    EXPECT_EQ(*loaded->Get(glm::ivec2(0, 0)), *map->Get(glm::ivec2(0, 0)));
    ASSERT_NE(loaded->Get(glm::ivec2(-9, 7)), nullptr);
    EXPECT_EQ(*loaded->Get(glm::ivec2(-9, 7)), *map->Get(glm::ivec2(-9, 7)));
}

TEST_F(TilemapSerializerTest, Load_MissingKeysUseDefaults)
{
    TilemapId id = INVALID_TILEMAP_ID;
    ASSERT_TRUE(TilemapSerializer::LoadFromString(R"({ "name": "bare" })", world, &id));
    const TilemapDescriptor &desc = world.Get(id)->GetDescriptor();
    EXPECT_EQ(desc.geometry.type, TileType::Square);
    EXPECT_EQ(desc.chunkSize, 32);
    EXPECT_EQ(desc.texture.handle, NO_TEXTURE);
    EXPECT_EQ(desc.texture.rotation, TilemapRotation::None);
    EXPECT_EQ(desc.flip, static_cast<uint32_t>(FLIP_NONE));
}

TEST_F(TilemapSerializerTest, Load_MalformedJsonFails)
{
    EXPECT_FALSE(TilemapSerializer::LoadFromString("{ \"name\": ", world));
    EXPECT_FALSE(TilemapSerializer::LoadFromString("[1, 2]", world));
    EXPECT_EQ(world.GetTilemapCount(), 1u);
}

TEST_F(TilemapSerializerTest, Load_InvalidDescriptorLeavesWorldUnchanged)
{
    EXPECT_FALSE(TilemapSerializer::LoadFromString(R"({ "chunkSize": 0 })", world));
    EXPECT_FALSE(TilemapSerializer::LoadFromString(R"({ "tileType": "Triangle" })", world));
    EXPECT_FALSE(TilemapSerializer::LoadFromString(R"({ "texture": { "rotation": 45 } })", world));
    EXPECT_FALSE(TilemapSerializer::LoadFromString(R"({ "flip": 4 })", world));
    EXPECT_FALSE(TilemapSerializer::LoadFromString(R"({ "animations": [{ "frames": [1, 2], "frameDuration": 0 }] })", world));
    EXPECT_FALSE(TilemapSerializer::LoadFromString(R"({ "animations": [{ "frames": [1, 2], "frameDuration": -1.5 }] })", world));
    EXPECT_EQ(world.GetTilemapCount(), 1u);
}

TEST_F(TilemapSerializerTest, Load_BadTileDespawnsPartialTilemap)
{
    const char *text = R"({
        "animations": [],
        "tiles": { "0,0": { "layers": [{ "animation": 2 }] } }
    })";
    EXPECT_FALSE(TilemapSerializer::LoadFromString(text, world));
    EXPECT_EQ(world.GetTilemapCount(), 1u);
}

TEST_F(TilemapSerializerTest, Load_SkipsMalformedCellKeys)
{
    const char *text = R"({
        "tiles": {
            "1,2": { "layers": [{ "texture": 0 }] },
            "1;2": { "layers": [{ "texture": 0 }] },
            "x,2": { "layers": [{ "texture": 0 }] }
        }
    })";
    TilemapId id = INVALID_TILEMAP_ID;
    ASSERT_TRUE(TilemapSerializer::LoadFromString(text, world, &id));
    EXPECT_EQ(world.Get(id)->GetStorage().GetTileCount(), 1u);
    EXPECT_NE(world.Get(id)->Get(glm::ivec2(1, 2)), nullptr);
}

TEST_F(TilemapSerializerTest, FileRoundTrip)
{
    map->FillRect(TileArea(glm::ivec2(0, 0), glm::uvec2(3, 3)), TileBuilder().WithLayer(0, TileLayer::FromTexture(1)));
    const std::string path = ::testing::TempDir() + "tessera_map_test.json";

    ASSERT_TRUE(TilemapSerializer::SaveToFile(*map, path));
    TilemapId id = INVALID_TILEMAP_ID;
    ASSERT_TRUE(TilemapSerializer::LoadFromFile(path, world, &id));
    EXPECT_EQ(world.Get(id)->GetStorage().GetTileCount(), 9u);
    std::remove(path.c_str());

    EXPECT_FALSE(TilemapSerializer::LoadFromFile(path, world));
}
