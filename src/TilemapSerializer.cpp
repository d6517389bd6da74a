#include "TilemapSerializer.h"
#include "TilemapError.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace
{
const char *TileTypeName(TileType type)
{
    switch (type)
    {
        case TileType::Isometric:
            return "Isometric";
        case TileType::Hexagonal:
            return "Hexagonal";
        case TileType::Square:
        default:
            return "Square";
    }
}

bool ParseTileType(const std::string &name, TileType &out)
{
    if (name == "Square")
        out = TileType::Square;
    else if (name == "Isometric")
        out = TileType::Isometric;
    else if (name == "Hexagonal")
        out = TileType::Hexagonal;
    else
        return false;
    return true;
}

json Vec2ToJson(glm::vec2 v) { return json::array({v.x, v.y}); }
json IVec2ToJson(glm::ivec2 v) { return json::array({v.x, v.y}); }

glm::vec2 Vec2FromJson(const json &j, glm::vec2 fallback)
{
    if (!j.is_array() || j.size() != 2)
        return fallback;
    return glm::vec2(j[0].get<float>(), j[1].get<float>());
}

glm::ivec2 IVec2FromJson(const json &j, glm::ivec2 fallback)
{
    if (!j.is_array() || j.size() != 2)
        return fallback;
    return glm::ivec2(j[0].get<int>(), j[1].get<int>());
}

std::string CellKey(glm::ivec2 cell)
{
    return std::to_string(cell.x) + "," + std::to_string(cell.y);
}

bool ParseCellKey(const std::string &key, glm::ivec2 &out)
{
    std::size_t comma = key.find(',');
    if (comma == std::string::npos)
        return false;

    const char *begin = key.data();
    const char *end = key.data() + key.size();
    auto rx = std::from_chars(begin, begin + comma, out.x);
    if (rx.ec != std::errc() || rx.ptr != begin + comma)
        return false;
    auto ry = std::from_chars(begin + comma + 1, end, out.y);
    return ry.ec == std::errc() && ry.ptr == end;
}

json TileToJson(const Tile &tile)
{
    json layers = json::array();
    for (int i = 0; i < tile.GetLayerCount(); ++i)
    {
        const TileLayer &layer = tile.layers[i];
        if (layer.IsEmpty())
        {
            layers.push_back(nullptr);
            continue;
        }
        json l = json::object();
        if (layer.IsAnimated())
            l["animation"] = layer.animationId;
        else
            l["texture"] = layer.textureIndex;
        if (layer.flip != FLIP_NONE)
            l["flip"] = layer.flip;
        layers.push_back(l);
    }

    json j;
    j["layers"] = layers;
    if (tile.color != glm::vec4(1.0f))
        j["color"] = json::array({tile.color.r, tile.color.g, tile.color.b, tile.color.a});
    if (!tile.visible)
        j["visible"] = false;
    return j;
}

TileBuilder TileFromJson(const json &j)
{
    TileBuilder builder;
    if (j.contains("layers") && j["layers"].is_array())
    {
        const json &layers = j["layers"];
        for (std::size_t i = 0; i < layers.size() && i < static_cast<std::size_t>(MAX_LAYER_COUNT); ++i)
        {
            const json &l = layers[i];
            if (!l.is_object())
                continue;
            uint32_t flip = l.value("flip", 0u) & FLIP_BOTH;
            if (l.contains("animation"))
                builder.WithLayer(static_cast<int>(i), TileLayer::FromAnimation(l["animation"].get<int>(), flip));
            else if (l.contains("texture"))
                builder.WithLayer(static_cast<int>(i), TileLayer::FromTexture(l["texture"].get<int>(), flip));
        }
    }
    if (j.contains("color") && j["color"].is_array() && j["color"].size() == 4)
    {
        const json &c = j["color"];
        builder.WithColor(glm::vec4(c[0].get<float>(), c[1].get<float>(), c[2].get<float>(), c[3].get<float>()));
    }
    builder.WithVisible(j.value("visible", true));
    return builder;
}

TilemapDescriptor DescriptorFromJson(const json &j)
{
    TilemapDescriptor desc;
    desc.name = j.value("name", std::string());

    std::string typeName = j.value("tileType", std::string("Square"));
    if (!ParseTileType(typeName, desc.geometry.type))
    {
        throw TilemapError(TilemapErrorKind::InvalidDescriptor, "unknown tile type '" + typeName + "'");
    }
    desc.geometry.hexLegs = j.value("hexLegs", 0);
    if (j.contains("slotSize"))
        desc.geometry.slotSize = Vec2FromJson(j["slotSize"], desc.geometry.slotSize);
    if (j.contains("renderSize"))
        desc.geometry.renderSize = Vec2FromJson(j["renderSize"], desc.geometry.renderSize);
    desc.chunkSize = j.value("chunkSize", desc.chunkSize);

    if (j.contains("transform"))
    {
        const json &t = j["transform"];
        if (t.contains("translation"))
            desc.transform.translation = Vec2FromJson(t["translation"], desc.transform.translation);
        desc.transform.zIndex = t.value("zIndex", 0);
        desc.transform.rotation = t.value("rotation", 0.0f);
    }

    if (j.contains("texture"))
    {
        const json &t = j["texture"];
        desc.texture.handle = t.value("handle", NO_TEXTURE);
        if (t.contains("atlasSize"))
            desc.texture.atlasSize = glm::uvec2(IVec2FromJson(t["atlasSize"], glm::ivec2(0)));
        if (t.contains("tileSize"))
            desc.texture.tileSize = Vec2FromJson(t["tileSize"], desc.texture.tileSize);
        desc.texture.rotation = static_cast<TilemapRotation>(t.value("rotation", 0u));
    }
    desc.flip = j.value("flip", static_cast<uint32_t>(FLIP_NONE));

    desc.material = j.value("material", STANDARD_MATERIAL);

    if (j.contains("layerOpacities") && j["layerOpacities"].is_array())
    {
        const json &o = j["layerOpacities"];
        for (std::size_t i = 0; i < o.size() && i < desc.layerOpacities.size(); ++i)
            desc.layerOpacities[i] = o[i].get<float>();
    }

    if (j.contains("animations") && j["animations"].is_array())
    {
        for (const json &a : j["animations"])
        {
            AnimatedTile anim;
            anim.frames = a.value("frames", std::vector<int>());
            anim.frameDuration = a.value("frameDuration", 0.2f);
            desc.animations.push_back(anim);
        }
    }

    if (j.contains("bounds"))
    {
        const json &b = j["bounds"];
        IAabb2d bounds;
        bounds.min = IVec2FromJson(b.value("min", json()), bounds.min);
        bounds.max = IVec2FromJson(b.value("max", json()), bounds.max);
        desc.bounds = bounds;
    }
    desc.enforceBounds = j.value("enforceBounds", false);
    return desc;
}
} // namespace

std::string TilemapSerializer::SaveToString(const Tilemap &tilemap, int indent)
{
    const TilemapDescriptor &desc = tilemap.GetDescriptor();

    json j;
    j["name"] = desc.name;
    j["tileType"] = TileTypeName(desc.geometry.type);
    j["hexLegs"] = desc.geometry.hexLegs;
    j["slotSize"] = Vec2ToJson(desc.geometry.slotSize);
    j["renderSize"] = Vec2ToJson(desc.geometry.renderSize);
    j["chunkSize"] = desc.chunkSize;

    j["transform"] = {
        {"translation", Vec2ToJson(desc.transform.translation)},
        {"zIndex", desc.transform.zIndex},
        {"rotation", desc.transform.rotation},
    };
    j["texture"] = {
        {"handle", desc.texture.handle},
        {"atlasSize", IVec2ToJson(glm::ivec2(desc.texture.atlasSize))},
        {"tileSize", Vec2ToJson(desc.texture.tileSize)},
        {"rotation", static_cast<uint32_t>(desc.texture.rotation)},
    };
    j["flip"] = desc.flip;
    j["material"] = desc.material;
    j["layerOpacities"] = desc.layerOpacities;

    json animations = json::array();
    for (const AnimatedTile &anim : desc.animations)
        animations.push_back({{"frames", anim.frames}, {"frameDuration", anim.frameDuration}});
    j["animations"] = animations;

    if (desc.bounds)
        j["bounds"] = {{"min", IVec2ToJson(desc.bounds->min)}, {"max", IVec2ToJson(desc.bounds->max)}};
    j["enforceBounds"] = desc.enforceBounds;

    // Tiles (sparse)
    json tiles = json::object();
    for (const auto &[coord, chunk] : tilemap.GetStorage().GetChunks())
    {
        (void)coord;
        chunk.ForEachTile([&tiles](const Tile &tile) { tiles[CellKey(tile.index)] = TileToJson(tile); });
    }
    j["tiles"] = tiles;

    return j.dump(indent);
}

bool TilemapSerializer::SaveToFile(const Tilemap &tilemap, const std::string &path)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        std::cerr << "[Serializer] Could not open file for writing: " << path << std::endl;
        return false;
    }

    file << SaveToString(tilemap);
    if (!file.good())
    {
        std::cerr << "[Serializer] Write failed: " << path << std::endl;
        return false;
    }

    std::cout << "[Serializer] Saved tilemap '" << tilemap.GetName() << "' ("
              << tilemap.GetStorage().GetTileCount() << " tiles) to " << path << std::endl;
    return true;
}

bool TilemapSerializer::LoadFromString(const std::string &text, TilemapWorld &world, TilemapId *outId)
{
    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
        std::cerr << "[Serializer] Failed to parse JSON: " << e.what() << std::endl;
        return false;
    }

    if (!j.is_object())
    {
        std::cerr << "[Serializer] Expected a JSON object" << std::endl;
        return false;
    }

    TilemapId id = INVALID_TILEMAP_ID;
    try
    {
        Tilemap &tilemap = world.Create(DescriptorFromJson(j));
        id = tilemap.GetId();

        if (j.contains("tiles") && j["tiles"].is_object())
        {
            for (const auto &[key, value] : j["tiles"].items())
            {
                glm::ivec2 cell;
                if (!ParseCellKey(key, cell))
                {
                    std::cerr << "[Serializer] Skipping tile with malformed key '" << key << "'" << std::endl;
                    continue;
                }
                tilemap.Set(cell, TileFromJson(value));
            }
        }
    }
    catch (const json::exception &e)
    {
        std::cerr << "[Serializer] Invalid tilemap JSON: " << e.what() << std::endl;
        if (id != INVALID_TILEMAP_ID)
            world.Despawn(id);
        return false;
    }
    catch (const TilemapError &e)
    {
        std::cerr << "[Serializer] " << e.what() << std::endl;
        if (id != INVALID_TILEMAP_ID)
            world.Despawn(id);
        return false;
    }

    if (outId)
        *outId = id;
    return true;
}

bool TilemapSerializer::LoadFromFile(const std::string &path, TilemapWorld &world, TilemapId *outId)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "[Serializer] Could not open file for reading: " << path << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!LoadFromString(buffer.str(), world, outId))
    {
        std::cerr << "[Serializer] Failed to load " << path << std::endl;
        return false;
    }
    return true;
}
