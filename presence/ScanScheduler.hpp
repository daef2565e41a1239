#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "PresenceTracker.hpp"
#include "ScanPipeline.hpp"

namespace arp_presence::presence
{
    class SetupError : public std::runtime_error
    {
    public:
        explicit SetupError(const std::string &reason) : std::runtime_error(reason) {}
    };

    // Runs the pipeline on a fixed interval. The timer thread only posts
    // cycles; a single worker runs them, so at most one is ever in flight and
    // ticks that land during a cycle are dropped.
    class ScanScheduler
    {
    public:
        using CycleCallback = std::function<void(const common::ScanSnapshot &, const std::vector<PresenceChange> &)>;

        ScanScheduler(ScanPipeline &pipeline, PresenceTracker &tracker, std::chrono::milliseconds interval);
        ~ScanScheduler();

        ScanScheduler(const ScanScheduler &) = delete;
        ScanScheduler &operator=(const ScanScheduler &) = delete;

        // Runs the first cycle on the calling thread. Throws SetupError with
        // the reason when it does not complete.
        void Setup();

        void Start(CycleCallback callback);
        void Stop();

        // Returns false when a cycle is already running (the tick is skipped).
        bool TriggerCycle();

        std::shared_ptr<const common::ScanSnapshot> CurrentSnapshot() const;

        size_t SkippedTicks() const { return m_skipped_ticks; }
        size_t CompletedCycles() const { return m_completed_cycles; }
        bool IsRunning() const { return m_running; }

    private:
        void TimerLoop();
        void WorkerLoop();
        void RunCycle();
        std::vector<PresenceChange> Publish(common::ScanSnapshot snapshot);

        ScanPipeline &m_pipeline;
        PresenceTracker &m_tracker;
        std::chrono::milliseconds m_interval;

        CycleCallback m_callback;

        std::atomic<bool> m_running;
        std::atomic<bool> m_cycle_in_flight;
        std::atomic<size_t> m_skipped_ticks;
        std::atomic<size_t> m_completed_cycles;

        std::thread m_timer_thread;
        std::thread m_worker_thread;

        std::mutex m_queue_mutex;
        std::condition_variable m_queue_cv;
        bool m_cycle_requested;

        std::mutex m_timer_mutex;
        std::condition_variable m_timer_cv;

        mutable std::mutex m_snapshot_mutex;
        std::shared_ptr<const common::ScanSnapshot> m_snapshot;
    };
}
