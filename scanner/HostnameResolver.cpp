#include "HostnameResolver.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace arp_presence::scanner
{
    namespace
    {
        std::optional<std::string> LookupBlocking(const std::string &ip)
        {
            struct sockaddr_in sa;
            std::memset(&sa, 0, sizeof(sa));
            sa.sin_family = AF_INET;
            if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1)
                return std::nullopt;

            char hostname[NI_MAXHOST];
            if (getnameinfo(reinterpret_cast<struct sockaddr *>(&sa), sizeof(sa),
                            hostname, sizeof(hostname), nullptr, 0, NI_NAMEREQD) != 0)
                return std::nullopt;

            if (hostname[0] == '\0')
                return std::nullopt;
            return std::string(hostname);
        }
    }

    std::string PreferredHostname(const std::string &resolved, const std::string &ip)
    {
        auto dot = resolved.find('.');
        if (dot == std::string::npos)
            return resolved;

        std::string short_name = resolved.substr(0, dot);

        std::string as_address = short_name;
        for (char &c : as_address)
        {
            if (c == '-')
                c = '.';
        }

        if (as_address == ip)
            return resolved;
        return short_name;
    }

    ReverseDnsResolver::ReverseDnsResolver(std::chrono::milliseconds timeout)
        : ReverseDnsResolver(timeout, &LookupBlocking)
    {
    }

    ReverseDnsResolver::ReverseDnsResolver(std::chrono::milliseconds timeout, LookupFn lookup)
        : m_timeout(timeout), m_lookup(std::move(lookup)), m_running(true)
    {
        m_worker = std::thread(&ReverseDnsResolver::ProcessLoop, this);
    }

    ReverseDnsResolver::~ReverseDnsResolver()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_running = false;
            for (auto &job : m_jobs)
                job.result->set_value(std::nullopt);
            m_jobs.clear();
        }
        m_cv.notify_all();

        if (m_worker.joinable())
        {
            m_worker.join();
        }
    }

    std::optional<std::string> ReverseDnsResolver::Resolve(const std::string &ip)
    {
        auto result = std::make_shared<std::promise<std::optional<std::string>>>();
        std::future<std::optional<std::string>> future = result->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_outstanding.count(ip) > 0)
                return std::nullopt;
            if (m_outstanding.size() >= MAX_PENDING)
            {
                std::cerr << "[Enricher] Hostname lookups backed up, skipping " << ip << "\n";
                return std::nullopt;
            }
            m_outstanding.insert(ip);
            m_jobs.push_back({ip, result});
        }
        m_cv.notify_one();

        if (future.wait_for(m_timeout) != std::future_status::ready)
            return std::nullopt;

        auto hostname = future.get();
        if (!hostname.has_value())
            return std::nullopt;
        return PreferredHostname(*hostname, ip);
    }

    void ReverseDnsResolver::ProcessLoop()
    {
        while (true)
        {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this]
                          { return !m_running || !m_jobs.empty(); });

                if (!m_running)
                    return;

                job = std::move(m_jobs.front());
                m_jobs.pop_front();
            }

            std::optional<std::string> hostname;
            try
            {
                hostname = m_lookup(job.ip);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Enricher] Hostname lookup for " << job.ip << " failed: " << e.what() << "\n";
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_outstanding.erase(job.ip);
            }
            job.result->set_value(std::move(hostname));
        }
    }
}
