/*  ============================================================================================  *
 *
 *           ::::::::::: :::::::::: :::::::: :::::::: :::::::::: :::::::::      :::
 *               :+:     :+:       :+:    :+::+:    :+::+:        :+:    :+:   :+: :+:
 *               +:+     +:+       +:+       +:+       +:+        +:+    +:+  +:+   +:+
 *               +#+     +#++:++#  +#++:++#+++#++:++#+++#++:++#   +#++:++#:  +#++:++#++:
 *               +#+     +#+              +#+       +#++#+        +#+    +#+ +#+     +#+
 *               #+#     #+#       #+#    #+##+#    #+##+#        #+#    #+# #+#     #+#
 *               ###     ########## ######## ######## ########## ###    ### ###     ###
 *
 *                               << C H U N K E D   T I L E M A P S >>
 *
 *  ============================================================================================  *
 *
 *      Sparse chunked tile storage with an extract / cull / prepare / queue
 *      render pipeline for square, isometric and hexagonal tilemaps.
 *
 *    ----------------------------------------------------------------------
 *
 *      License:      MIT
 */
#include "CpuMirrorUploader.h"
#include "FrameClock.h"
#include "RenderSettings.h"
#include "TextureRegistry.h"
#include "TilemapError.h"
#include "TilemapRenderPipeline.h"
#include "TilemapSerializer.h"
#include "TilemapWorld.h"
#include "Version.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace
{
constexpr TextureHandle SQUARE_ATLAS = 1;
constexpr TextureHandle ISOMETRIC_ATLAS = 2;

/**
 * @brief Populate the world with one square, one isometric and one pure color tilemap.
 */
void BuildScene(TilemapWorld &world, const RenderSettings &settings)
{
    // Square map with overlays, flips and an animated strip
    TilemapDescriptor square;
    square.name = "square";
    square.geometry.type = TileType::Square;
    square.geometry.slotSize = glm::vec2(16.0f, 16.0f);
    square.geometry.renderSize = glm::vec2(16.0f, 16.0f);
    square.chunkSize = 16;
    square.texture = {SQUARE_ATLAS, glm::uvec2(32, 32), glm::vec2(16.0f, 16.0f)};
    square.enforceBounds = settings.enforceBoundsByDefault;
    square.transform.zIndex = 1;

    Tilemap &squareMap = world.Create(square);
    int water = squareMap.AddAnimation(AnimatedTile({0, 1, 2, 3}, 0.25f));

    squareMap.FillRect(TileArea(glm::ivec2(0, 0), glm::uvec2(20, 10)),
                       TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));
    squareMap.FillRect(TileArea(glm::ivec2(2, 2), glm::uvec2(10, 7)),
                       TileBuilder()
                           .WithLayer(0, TileLayer::FromTexture(1))
                           .WithColor(glm::vec4(0.8f, 1.0f, 0.8f, 0.5f)));
    squareMap.Set(glm::ivec2(18, 8), TileBuilder()
                                         .WithLayer(0, TileLayer::FromTexture(0))
                                         .WithColor(glm::vec4(0.0f, 0.0f, 1.0f, 1.0f)));
    squareMap.Set(glm::ivec2(1, 1), TileBuilder().WithLayer(1, TileLayer::FromTexture(1, FLIP_HORIZONTAL)));
    squareMap.Set(glm::ivec2(1, 2), TileBuilder().WithLayer(0, TileLayer::FromTexture(1, FLIP_VERTICAL)));
    squareMap.Set(glm::ivec2(1, 3), TileBuilder().WithLayer(0, TileLayer::FromTexture(1, FLIP_BOTH)));

    TileUpdater overlay;
    overlay.layer = LayerUpdater{TileLayerPosition::Top(), TileLayer::FromTexture(3)};
    squareMap.UpdateRect(TileArea(glm::ivec2(1, 3), glm::uvec2(3, 3)), overlay);

    squareMap.FillRect(TileArea(glm::ivec2(0, 12), glm::uvec2(20, 2)), TileBuilder().WithAnimation(water));

    // Isometric map
    TilemapDescriptor iso;
    iso.name = "isometric";
    iso.geometry.type = TileType::Isometric;
    iso.geometry.slotSize = glm::vec2(32.0f, 16.0f);
    iso.geometry.renderSize = glm::vec2(32.0f, 16.0f);
    iso.chunkSize = 32;
    iso.texture = {ISOMETRIC_ATLAS, glm::uvec2(32, 32), glm::vec2(32.0f, 16.0f)};
    iso.transform.translation = glm::vec2(-400.0f, 0.0f);

    world.Create(iso).FillRect(TileArea(glm::ivec2(0, 0), glm::uvec2(20, 10)),
                               TileBuilder().WithLayer(0, TileLayer::FromTexture(0)));

    // Pure color map, no atlas
    TilemapDescriptor color;
    color.name = "pure_color";
    color.chunkSize = settings.defaultChunkSize;
    color.transform.translation = glm::vec2(0.0f, -300.0f);

    world.Create(color).FillRect(TileArea(glm::ivec2(0, 0), glm::uvec2(20, 10)),
                                 TileBuilder()
                                     .WithLayer(0, TileLayer::FromTexture(0))
                                     .WithColor(glm::vec4(1.0f, 1.0f, 0.0f, 1.0f)));
}
} // namespace

int main(int argc, char **argv)
{
    // ------------------------------------------------------------------------
    // Initialize Logging
    // ------------------------------------------------------------------------
    std::ofstream logFile("tessera.txt", std::ios::app);
    logFile << "=== Tessera " << TESSERA_VERSION << " Starting ===" << std::endl;
    std::cout << "=== Tessera " << TESSERA_VERSION << " ===" << std::endl;

    // ------------------------------------------------------------------------
    // Settings: tessera_demo [settings.json] [frames]
    // ------------------------------------------------------------------------
    RenderSettings settings;
    if (argc > 1 && !settings.LoadFromFile(argv[1]))
    {
        std::cerr << "Falling back to default settings" << std::endl;
        logFile << "WARNING: could not load settings from " << argv[1] << std::endl;
    }

    int frameCount = 120;
    if (argc > 2)
        frameCount = std::max(1, std::atoi(argv[2]));

    try
    {
        TilemapWorld world;
        TextureRegistry textures;
        CpuMirrorUploader uploader;
        FrameClock clock;

        textures.Register(SQUARE_ATLAS, "test_square.png");
        textures.Register(ISOMETRIC_ATLAS, "test_isometric.png");

        BuildScene(world, settings);

        TilemapRenderPipeline pipeline(settings, textures, uploader);

        std::vector<Camera> cameras(2);
        cameras[0].id = 0;
        cameras[0].viewportSize = glm::vec2(1280.0f, 720.0f);
        cameras[1].id = 1;
        cameras[1].position = glm::vec2(-400.0f, 80.0f);
        cameras[1].viewportSize = glm::vec2(320.0f, 240.0f);

        const float deltaTime = 1.0f / 60.0f;
        for (int frame = 0; frame < frameCount; ++frame)
        {
            // Atlases finish loading a few frames in
            if (frame == 3)
                textures.MarkReady(SQUARE_ATLAS, glm::uvec2(32, 32));
            if (frame == 6)
                textures.MarkReady(ISOMETRIC_ATLAS, glm::uvec2(32, 32));

            // Pan the main camera and keep editing the square map
            cameras[0].position.x = 200.0f * static_cast<float>(frame) / static_cast<float>(frameCount);
            if (Tilemap *square = world.Get(0))
            {
                TileUpdater tint;
                tint.color = glm::vec4(1.0f, 1.0f - 0.5f * static_cast<float>(frame % 2), 1.0f, 1.0f);
                square->Update(glm::ivec2(18, 8), tint);
            }

            clock.Update(deltaTime);
            FrameStats stats = pipeline.RenderFrame(world, cameras, clock);

            if (frame < 8 || frame == frameCount - 1)
            {
                logFile << "Frame " << frame << ": " << stats << std::endl;
                std::cout << "Frame " << frame << ": " << stats << std::endl;
            }
        }

        // Round-trip the square map through the sparse JSON format
        if (const Tilemap *square = world.Get(0))
        {
            if (TilemapSerializer::SaveToFile(*square, "tessera_map.json"))
            {
                TilemapId reloaded = INVALID_TILEMAP_ID;
                if (TilemapSerializer::LoadFromFile("tessera_map.json", world, &reloaded))
                {
                    std::cout << "Reloaded tilemap " << reloaded << " with "
                              << world.Get(reloaded)->GetStorage().GetTileCount() << " tiles" << std::endl;
                    world.Despawn(reloaded);
                }
            }
        }

        world.Clear();
        FrameStats last = pipeline.RenderFrame(world, cameras, clock);
        pipeline.RenderFrame(world, cameras, clock);

        std::cout << "Shutdown: released " << uploader.GetTotalReleases() << " chunk buffers, "
                  << uploader.GetResidentChunkCount() << " still resident" << std::endl;
        logFile << "Shutdown frame: " << last << std::endl;
    }
    catch (const TilemapError &e)
    {
        std::cerr << "Tilemap error: " << e.what() << std::endl;
        logFile << "TILEMAP ERROR: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        logFile << "EXCEPTION: " << e.what() << std::endl;
        return 1;
    }

    logFile << "=== Tessera Exiting ===" << std::endl;
    return 0;
}
