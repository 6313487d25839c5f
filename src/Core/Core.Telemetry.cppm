module;

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

export module Core:Telemetry;

export namespace Core::Telemetry
{
    // -------------------------------------------------------------------------
    // FrameClock - wall-clock delta source for the main loop
    // -------------------------------------------------------------------------
    class FrameClock
    {
    public:
        // Seconds elapsed since the previous Tick(); 0 on the first call.
        double Tick()
        {
            const auto now = std::chrono::steady_clock::now();
            if (!m_Started)
            {
                m_Started = true;
                m_Last = now;
                return 0.0;
            }
            const std::chrono::duration<double> dt = now - m_Last;
            m_Last = now;
            return dt.count();
        }

        void Reset() { m_Started = false; }

    private:
        std::chrono::steady_clock::time_point m_Last{};
        bool m_Started = false;
    };

    // -------------------------------------------------------------------------
    // FrameStats - counters updated by the scheduler
    // -------------------------------------------------------------------------
    // Frame times are kept in a fixed window so UI/debug tools can read an
    // average without the loop allocating.
    // -------------------------------------------------------------------------
    struct FrameStats
    {
        static constexpr size_t kWindowSize = 60;

        uint64_t TickCount = 0;
        uint64_t PresentedFrames = 0;
        double LastDelta = 0.0;

        void RecordTick(double delta)
        {
            ++TickCount;
            LastDelta = delta;
        }

        // frameTime: seconds since the previous presentation
        void RecordPresent(double frameTime)
        {
            ++PresentedFrames;
            m_FrameTimes[m_Head] = frameTime;
            m_Head = (m_Head + 1) % kWindowSize;
            if (m_Count < kWindowSize) ++m_Count;
        }

        [[nodiscard]] double AverageFrameTimeMs() const
        {
            if (m_Count == 0) return 0.0;
            double sum = 0.0;
            for (size_t i = 0; i < m_Count; ++i) sum += m_FrameTimes[i];
            return sum / static_cast<double>(m_Count) * 1000.0;
        }

        [[nodiscard]] double AverageFps() const
        {
            const double ms = AverageFrameTimeMs();
            return ms > 0.0 ? 1000.0 / ms : 0.0;
        }

        void Reset()
        {
            TickCount = 0;
            PresentedFrames = 0;
            LastDelta = 0.0;
            m_Head = 0;
            m_Count = 0;
        }

    private:
        std::array<double, kWindowSize> m_FrameTimes{};
        size_t m_Head = 0;
        size_t m_Count = 0;
    };
}
