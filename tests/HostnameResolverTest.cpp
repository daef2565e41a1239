#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include "../scanner/HostnameResolver.hpp"

using namespace arp_presence;
using namespace std::chrono_literals;

namespace
{
    std::size_t LiveThreads()
    {
        std::size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator("/proc/self/task"))
        {
            (void)entry;
            ++count;
        }
        return count;
    }

    // A joined thread can linger in /proc for a moment after join() returns.
    bool SettlesAt(std::size_t expected)
    {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (LiveThreads() == expected)
                return true;
            std::this_thread::sleep_for(5ms);
        }
        return LiveThreads() == expected;
    }

    // Hostname backend that hangs until Release() is called, like a DNS
    // server that never answers.
    class HangingBackend
    {
    public:
        std::optional<std::string> Lookup(const std::string &ip)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            ++m_active;
            ++m_calls[ip];
            if (m_active > m_max_active)
                m_max_active = m_active;
            m_cv.wait(lock, [this]
                      { return m_released; });
            --m_active;
            return std::string("device.lan");
        }

        void Release()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_released = true;
            }
            m_cv.notify_all();
        }

        int CallsFor(const std::string &ip)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_calls.count(ip) ? m_calls[ip] : 0;
        }

        int TotalCalls()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            int total = 0;
            for (const auto &entry : m_calls)
                total += entry.second;
            return total;
        }

        int MaxActive()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_max_active;
        }

    private:
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::map<std::string, int> m_calls;
        int m_active = 0;
        int m_max_active = 0;
        bool m_released = false;
    };

    std::string HostAddress(int i)
    {
        return "10.0." + std::to_string(i / 250) + "." + std::to_string(i % 250 + 1);
    }
}

TEST(ReverseDnsResolverTest, UnparseableAddressResolvesToNothing)
{
    scanner::ReverseDnsResolver resolver(500ms);
    EXPECT_FALSE(resolver.Resolve("not-an-address").has_value());
}

TEST(ReverseDnsResolverTest, AnswerIsShortened)
{
    scanner::ReverseDnsResolver resolver(500ms, [](const std::string &)
                                         { return std::optional<std::string>("nas.home.lan"); });

    EXPECT_EQ(resolver.Resolve("192.168.1.5"), "nas");
}

TEST(ReverseDnsResolverTest, MissingAnswerResolvesToNothing)
{
    scanner::ReverseDnsResolver resolver(500ms, [](const std::string &)
                                         { return std::optional<std::string>(); });

    EXPECT_FALSE(resolver.Resolve("192.168.1.5").has_value());
}

TEST(ReverseDnsResolverTest, FailingBackendDoesNotStopLaterLookups)
{
    scanner::ReverseDnsResolver resolver(500ms, [](const std::string &ip) -> std::optional<std::string>
                                         {
                                             if (ip == "192.168.1.5")
                                                 throw std::runtime_error("resolver exploded");
                                             return std::string("printer"); });

    EXPECT_FALSE(resolver.Resolve("192.168.1.5").has_value());
    EXPECT_EQ(resolver.Resolve("192.168.1.6"), "printer");
}

TEST(ReverseDnsResolverTest, HangingLookupsKeepThreadCountFlat)
{
    HangingBackend backend;
    std::size_t before = LiveThreads();
    {
        scanner::ReverseDnsResolver resolver(5ms, [&backend](const std::string &ip)
                                             { return backend.Lookup(ip); });

        for (int cycle = 0; cycle < 3; ++cycle)
        {
            for (int i = 0; i < 40; ++i)
                EXPECT_FALSE(resolver.Resolve(HostAddress(i)).has_value());
        }

        EXPECT_LE(LiveThreads(), before + 1);
        EXPECT_EQ(backend.MaxActive(), 1);
        EXPECT_EQ(backend.TotalCalls(), 1);

        backend.Release();
    }

    EXPECT_TRUE(SettlesAt(before));
    EXPECT_EQ(backend.MaxActive(), 1);
}

TEST(ReverseDnsResolverTest, OutstandingAddressIsNotLookedUpAgain)
{
    HangingBackend backend;
    scanner::ReverseDnsResolver resolver(50ms, [&backend](const std::string &ip)
                                         { return backend.Lookup(ip); });

    for (int i = 0; i < 5; ++i)
        EXPECT_FALSE(resolver.Resolve("192.168.1.5").has_value());
    EXPECT_EQ(backend.CallsFor("192.168.1.5"), 1);

    backend.Release();
    // The earlier lookup has to finish before the address is retried.
    std::optional<std::string> answer;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!answer.has_value() && std::chrono::steady_clock::now() < deadline)
    {
        answer = resolver.Resolve("192.168.1.5");
        if (!answer.has_value())
            std::this_thread::sleep_for(5ms);
    }

    EXPECT_EQ(answer, "device");
    EXPECT_GE(backend.CallsFor("192.168.1.5"), 2);
}

TEST(ReverseDnsResolverTest, BackloggedLookupsAreCapped)
{
    HangingBackend backend;
    {
        scanner::ReverseDnsResolver resolver(1ms, [&backend](const std::string &ip)
                                             { return backend.Lookup(ip); });

        for (int i = 0; i < 200; ++i)
            resolver.Resolve(HostAddress(i));

        backend.Release();
    }

    EXPECT_LE(backend.TotalCalls(), static_cast<int>(scanner::ReverseDnsResolver::MAX_PENDING));
    EXPECT_EQ(backend.MaxActive(), 1);
}
