#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace arp_presence::scanner
{
    // Short form of a fully qualified name, unless the short form is just the
    // address spelled with dashes (e.g. "192-168-1-5.isp.net").
    std::string PreferredHostname(const std::string &resolved, const std::string &ip);

    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;
        virtual std::optional<std::string> Resolve(const std::string &ip) = 0;
    };

    class NullHostnameResolver : public HostnameResolver
    {
    public:
        std::optional<std::string> Resolve(const std::string &) override { return std::nullopt; }
    };

    // Reverse DNS through getnameinfo(). Lookups run one at a time on a
    // worker thread owned by the resolver; Resolve() waits at most `timeout`
    // for its answer. An address whose lookup is still outstanding resolves to
    // nothing until that lookup finishes, and at most MAX_PENDING lookups are
    // outstanding at once.
    class ReverseDnsResolver : public HostnameResolver
    {
    public:
        using LookupFn = std::function<std::optional<std::string>(const std::string &)>;

        static constexpr std::size_t MAX_PENDING = 64;

        explicit ReverseDnsResolver(std::chrono::milliseconds timeout);
        ReverseDnsResolver(std::chrono::milliseconds timeout, LookupFn lookup);
        ~ReverseDnsResolver() override;

        ReverseDnsResolver(const ReverseDnsResolver &) = delete;
        ReverseDnsResolver &operator=(const ReverseDnsResolver &) = delete;

        std::optional<std::string> Resolve(const std::string &ip) override;

    private:
        struct Job
        {
            std::string ip;
            std::shared_ptr<std::promise<std::optional<std::string>>> result;
        };

        void ProcessLoop();

        std::chrono::milliseconds m_timeout;
        LookupFn m_lookup;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<Job> m_jobs;
        std::set<std::string> m_outstanding;
        bool m_running;
        std::thread m_worker;
    };
}
