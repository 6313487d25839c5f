module;

#include <cstddef>
#include <functional>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

module Runtime.FrameQueue;

import Core;

namespace Runtime
{
    void FrameQueue::RequestFrame(Callback callback)
    {
        m_FrameCallbacks.push_back(std::move(callback));
    }

    void FrameQueue::Post(Callback task)
    {
        std::lock_guard lock(m_TaskMutex);
        m_Tasks.push_back(std::move(task));
    }

    size_t FrameQueue::PendingTasks() const
    {
        std::lock_guard lock(m_TaskMutex);
        return m_Tasks.size();
    }

    namespace
    {
        // Clears the dispatch flag on every exit path, including a throwing callback
        struct DispatchScope
        {
            bool& Flag;

            explicit DispatchScope(bool& flag) : Flag(flag) { Flag = true; }
            ~DispatchScope() { Flag = false; }

            DispatchScope(const DispatchScope&) = delete;
            DispatchScope& operator=(const DispatchScope&) = delete;
        };
    }

    size_t FrameQueue::Dispatch()
    {
        if (m_Dispatching)
        {
            Core::Log::Warn("FrameQueue::Dispatch called re-entrantly, ignoring");
            return 0;
        }
        DispatchScope scope(m_Dispatching);

        std::vector<Callback> tasks;
        {
            std::lock_guard lock(m_TaskMutex);
            tasks.swap(m_Tasks);
        }
        for (auto& task : tasks) task();

        // Callbacks requested from here on belong to the next frame
        std::vector<Callback> frame;
        frame.swap(m_FrameCallbacks);

        size_t next = 0;
        try
        {
            for (; next < frame.size(); ++next) frame[next]();
        }
        catch (...)
        {
            // Callbacks behind the failing one run on the next frame, ahead of new requests
            m_FrameCallbacks.insert(m_FrameCallbacks.begin(),
                                    std::make_move_iterator(frame.begin() + static_cast<std::ptrdiff_t>(next) + 1),
                                    std::make_move_iterator(frame.end()));
            ++m_FrameNumber;
            throw;
        }

        ++m_FrameNumber;
        return frame.size();
    }
}
