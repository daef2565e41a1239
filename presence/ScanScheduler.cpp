#include "ScanScheduler.hpp"
#include <iostream>

namespace arp_presence::presence
{
    namespace
    {
        void LogChanges(const std::vector<PresenceChange> &changes)
        {
            for (const auto &change : changes)
            {
                if (change.from == PresenceState::Unknown)
                {
                    std::cout << "[Presence] New device " << change.mac << " (" << change.device.ip
                              << ", " << change.device.vendor << ") is home\n";
                }
                else
                {
                    std::cout << "[Presence] " << change.mac << " (" << change.device.ip << ") "
                              << ToString(change.from) << " -> " << ToString(change.to) << "\n";
                }
            }
        }
    }

    ScanScheduler::ScanScheduler(ScanPipeline &pipeline, PresenceTracker &tracker, std::chrono::milliseconds interval)
        : m_pipeline(pipeline),
          m_tracker(tracker),
          m_interval(interval),
          m_running(false),
          m_cycle_in_flight(false),
          m_skipped_ticks(0),
          m_completed_cycles(0),
          m_cycle_requested(false)
    {
    }

    ScanScheduler::~ScanScheduler()
    {
        Stop();
    }

    void ScanScheduler::Setup()
    {
        common::ScanSnapshot snapshot = m_pipeline.RunOnce();

        if (snapshot.condition != common::ScanCondition::Ok)
        {
            std::string reason = snapshot.detail.empty() ? common::ToString(snapshot.condition) : snapshot.detail;
            std::cerr << "[Scheduler] Initial scan failed (" << common::ToString(snapshot.condition)
                      << "): " << reason << "\n";
            throw SetupError(reason);
        }

        Publish(std::move(snapshot));
    }

    void ScanScheduler::Start(CycleCallback callback)
    {
        if (m_running)
            return;

        m_callback = std::move(callback);
        m_running = true;

        m_worker_thread = std::thread(&ScanScheduler::WorkerLoop, this);
        m_timer_thread = std::thread(&ScanScheduler::TimerLoop, this);

        std::cout << "[Scheduler] Scanning every " << m_interval.count() << " ms\n";
    }

    void ScanScheduler::Stop()
    {
        if (!m_running)
            return;

        m_running = false;
        {
            std::lock_guard<std::mutex> lock(m_timer_mutex);
        }
        m_timer_cv.notify_all();
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
        }
        m_queue_cv.notify_all();

        if (m_timer_thread.joinable())
            m_timer_thread.join();
        if (m_worker_thread.joinable())
            m_worker_thread.join();
    }

    bool ScanScheduler::TriggerCycle()
    {
        if (!m_running)
            return false;

        if (m_cycle_in_flight.exchange(true))
        {
            ++m_skipped_ticks;
            std::cout << "[Scheduler] Previous scan still running, skipping this tick\n";
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_cycle_requested = true;
        }
        m_queue_cv.notify_one();
        return true;
    }

    std::shared_ptr<const common::ScanSnapshot> ScanScheduler::CurrentSnapshot() const
    {
        std::lock_guard<std::mutex> lock(m_snapshot_mutex);
        return m_snapshot;
    }

    void ScanScheduler::TimerLoop()
    {
        auto next_tick = std::chrono::steady_clock::now() + m_interval;

        while (m_running)
        {
            {
                std::unique_lock<std::mutex> lock(m_timer_mutex);
                m_timer_cv.wait_until(lock, next_tick, [this]
                                      { return !m_running; });
            }
            if (!m_running)
                break;

            TriggerCycle();

            next_tick += m_interval;
            auto now = std::chrono::steady_clock::now();
            if (next_tick < now)
                next_tick = now + m_interval;
        }
    }

    void ScanScheduler::WorkerLoop()
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                m_queue_cv.wait(lock, [this]
                                { return m_cycle_requested || !m_running; });

                if (!m_running)
                    break;

                m_cycle_requested = false;
            }

            RunCycle();
            m_cycle_in_flight = false;
        }
        m_cycle_in_flight = false;
    }

    void ScanScheduler::RunCycle()
    {
        try
        {
            common::ScanSnapshot snapshot = m_pipeline.RunOnce();

            if (snapshot.condition != common::ScanCondition::Ok)
            {
                std::cerr << "[Scheduler] Scan cycle failed (" << common::ToString(snapshot.condition)
                          << "): " << snapshot.detail << "\n";
            }

            auto changes = Publish(std::move(snapshot));

            if (m_callback)
            {
                auto current = CurrentSnapshot();
                m_callback(*current, changes);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scheduler] Error processing scan cycle: " << e.what() << "\n";
        }
    }

    std::vector<PresenceChange> ScanScheduler::Publish(common::ScanSnapshot snapshot)
    {
        auto published = std::make_shared<const common::ScanSnapshot>(std::move(snapshot));
        {
            std::lock_guard<std::mutex> lock(m_snapshot_mutex);
            m_snapshot = published;
        }

        auto changes = m_tracker.Update(*published);
        LogChanges(changes);
        ++m_completed_cycles;

        std::cout << "[Scheduler] Scan complete: " << published->devices.size() << " devices";
        if (!published->target.interface.empty())
            std::cout << " on " << published->target.interface << " (" << published->target.cidr << ")";
        std::cout << "\n";

        return changes;
    }
}
