#include "FrameClock.h"

#include <algorithm>

FrameClock::FrameClock()
    : m_Elapsed(0.0f)
    , m_TimeScale(1.0f)
    , m_LastDelta(0.0f)
    , m_FrameIndex(0)
{
}

void FrameClock::Initialize()
{
    m_Elapsed = 0.0f;
    m_TimeScale = 1.0f;
    m_LastDelta = 0.0f;
    m_FrameIndex = 0;
    m_Paused = false;
}

void FrameClock::Update(float deltaTime)
{
    ++m_FrameIndex;

    if (m_Paused)
    {
        m_LastDelta = 0.0f;
        return;
    }

    m_LastDelta = deltaTime * m_TimeScale;
    m_Elapsed = std::max(0.0f, m_Elapsed + m_LastDelta);
}

void FrameClock::SetTime(float seconds)
{
    m_Elapsed = std::max(0.0f, seconds);
}

void FrameClock::SetTimeScale(float scale)
{
    m_TimeScale = std::max(0.0f, scale);
}
