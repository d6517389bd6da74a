#pragma once

#include <cstdint>

/**
 * @class FrameClock
 * @brief Render-time source driving tile animations.
 * @ingroup Core
 *
 * The clock accumulates scaled elapsed seconds. Extraction copies the
 * current time into the render world once per frame, so every camera and
 * every chunk of a frame samples animations at the same instant.
 *
 * @par Time Model
 * @f[
 * elapsed_{n+1} = elapsed_n + deltaTime \times timeScale
 * @f]
 * Negative results clamp to zero. A paused clock ignores Update() but
 * still accepts SetTime().
 *
 * @par Animation Sampling
 * The frame of an animated layer at time t is
 * @f[
 * frame = frames\left[\left\lfloor \frac{t}{frameDuration} \right\rfloor \bmod |frames|\right]
 * @f]
 *
 * @par Usage Example
 * @code
 * FrameClock clock;
 * clock.SetTimeScale(0.5f);  // Slow motion
 * clock.Update(deltaTime);
 * pipeline.RenderFrame(world, cameras, clock);
 * @endcode
 */
class FrameClock
{
public:
    /// @name Constructor
    /// @{

    /**
     * @brief Construct a clock at time 0, scale 1.0, running.
     */
    FrameClock();

    /// @}

    /// @name Update
    /// @{

    /// Reset to time 0, scale 1.0, running, frame 0.
    void Initialize();

    /**
     * @brief Advance time based on elapsed real time.
     *
     * Call once per frame. Also increments the frame counter, even when paused.
     *
     * @param deltaTime Real time elapsed since last frame (seconds).
     */
    void Update(float deltaTime);

    /// @}

    /// @name Queries
    /// @{

    /// Scaled seconds since Initialize().
    float GetElapsed() const { return m_Elapsed; }

    /// Number of Update() calls since Initialize().
    uint64_t GetFrameIndex() const { return m_FrameIndex; }

    /// Scaled delta of the last Update() (0 while paused).
    float GetLastDelta() const { return m_LastDelta; }

    /// @}

    /// @name Controls
    /// @{

    /**
     * @brief Jump to an absolute time.
     * @param seconds New elapsed time, clamped to >= 0.
     */
    void SetTime(float seconds);

    /**
     * @brief Set time multiplier.
     *
     * 1.0 = normal speed, 2.0 = double speed, 0.0 = frozen.
     *
     * @param scale Multiplier, clamped to >= 0.
     */
    void SetTimeScale(float scale);

    float GetTimeScale() const { return m_TimeScale; }

    void SetPaused(bool paused) { m_Paused = paused; }
    bool IsPaused() const { return m_Paused; }

    /// @}

private:
    float m_Elapsed;
    float m_TimeScale;
    float m_LastDelta;
    uint64_t m_FrameIndex;
    bool m_Paused = false;
};
