module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

export module Runtime.FrameQueue;

export namespace Runtime
{
    // -------------------------------------------------------------------------
    // FrameQueue - the "next frame" signal
    // -------------------------------------------------------------------------
    // RequestFrame() queues a callback for the next Dispatch(). Post() queues a
    // task (e.g. an async load completion) that runs at the start of the next
    // Dispatch(), before any frame callback, so completions are never observed
    // in the middle of a tick.
    //
    // Post() may be called from any thread. RequestFrame() and Dispatch() are
    // main thread only.
    // -------------------------------------------------------------------------
    class FrameQueue
    {
    public:
        using Callback = std::function<void()>;

        void RequestFrame(Callback callback);
        void Post(Callback task);

        // Runs posted tasks, then the frame callbacks requested before this
        // call. Returns the number of frame callbacks run. An exception from a
        // callback propagates; the callbacks queued behind it move to the next
        // Dispatch() and the queue stays usable.
        size_t Dispatch();

        [[nodiscard]] size_t PendingFrames() const { return m_FrameCallbacks.size(); }
        [[nodiscard]] size_t PendingTasks() const;
        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }

    private:
        std::vector<Callback> m_FrameCallbacks;

        mutable std::mutex m_TaskMutex;
        std::vector<Callback> m_Tasks;

        uint64_t m_FrameNumber = 0;
        bool m_Dispatching = false;
    };
}
