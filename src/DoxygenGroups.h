/**
 * @file DoxygenGroups.h
 * @brief Doxygen module definitions and hierarchical documentation structure.
 *
 * This file defines the logical groupings (modules) used throughout the codebase
 * documentation. Each module represents a cohesive subsystem of the library.
 *
 * @par Architecture Overview
 * The library is organized into four subsystems:
 *
 * \htmlonly
 * <pre class="mermaid">
 * flowchart TB
 * classDef core fill:#1e3a5f,stroke:#3b82f6,color:#e2e8f0
 * classDef storage fill:#134e3a,stroke:#10b981,color:#e2e8f0
 * classDef pipeline fill:#4a3520,stroke:#f59e0b,color:#e2e8f0
 * classDef render fill:#2e1f5e,stroke:#8b5cf6,color:#e2e8f0
 *
 * Core["Core"]:::core
 * Storage["Tile Storage"]:::storage
 * Pipeline["Render Pipeline"]:::pipeline
 * Rendering["GPU Backends"]:::render
 *
 * Core --> Storage
 * Core --> Pipeline
 * Pipeline --> Storage
 * Pipeline --> Rendering
 * </pre>
 * \endhtmlonly
 */

/**
 * @defgroup Core Core
 * @brief Shared infrastructure: errors, frame timing and settings.
 *
 * @par Responsibilities
 * - **Errors**: TilemapError carries a kind, the tilemap and the offending cell
 * - **Timing**: FrameClock drives animation frames with pause and time scale
 * - **Settings**: RenderSettings loads pipeline knobs from JSON
 *
 * @par Frame Model
 * @code
 * while (running) {
 *     clock.Update(deltaTime);
 *     EditTiles(world);
 *     pipeline.RenderFrame(world, cameras, clock);
 *     SubmitDraws(pipeline.GetRenderWorld().GetViews());
 * }
 * @endcode
 *
 * @see FrameClock, RenderSettings, TilemapError
 */

/**
 * @defgroup Storage Tile Storage
 * @brief Sparse chunked cell storage and the tilemap entity that owns it.
 *
 * @par Chunk Addressing
 * A cell \f$ c \f$ lives in chunk \f$ \lfloor c / s \rfloor \f$ at local
 * offset \f$ c - s \lfloor c / s \rfloor \f$, where \f$ s \f$ is the chunk
 * size. Floor division keeps negative cells in the right chunk:
 * | Cell | Chunk (s = 16) | Local |
 * |------|----------------|-------|
 * | 0    | 0              | 0     |
 * | 15   | 0              | 15    |
 * | -1   | -1             | 15    |
 * | -16  | -1             | 0     |
 * | -17  | -2             | 15    |
 *
 * @par Change Tracking
 * Every mutation marks its chunk dirty. A chunk that becomes empty, or a
 * despawned tilemap, reports its chunks as released instead. The render
 * extraction drains both sets once per frame.
 *
 * @see ChunkedTileStorage, Tilemap, TilemapWorld, TilemapSerializer
 */

/**
 * @defgroup Pipeline Render Pipeline
 * @brief Extract, cull, prepare and queue stages run once per frame.
 *
 * @par Stage Order
 * | Stage   | Reads                  | Writes                         |
 * |---------|------------------------|--------------------------------|
 * | Extract | TilemapWorld, cameras  | RenderWorld mirror             |
 * | Cull    | RenderWorld, cameras   | Visible chunk keys per camera  |
 * | Prepare | Visible chunks         | Meshes, GPU buffers, uniforms  |
 * | Queue   | Visible chunks         | Sorted DrawSubmission lists    |
 *
 * Chunks that leave every view keep their buffers. Released chunks are
 * handed to the uploader at the start of the following extraction.
 *
 * @see TilemapRenderPipeline, RenderWorld
 */

/**
 * @defgroup Rendering GPU Backends
 * @brief Mesh building and the uploader interface the pipeline writes through.
 *
 * @par Backends
 * - **CpuMirrorUploader**: keeps every buffer in memory, used by tests and the demo
 * - **VulkanChunkUploader**: host-visible, persistently mapped Vulkan buffers
 *
 * @par Vertex Layout
 * Each tile is one quad (four ChunkVertex records, six indices). Layer
 * texture indices travel per vertex so animation can patch them in place.
 *
 * @see IGpuUploader, ChunkMeshBuilder
 */
