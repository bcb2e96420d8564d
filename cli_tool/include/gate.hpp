#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>

// Counts live connection handlers against a fixed limit. When the limit is
// reached the acceptor parks itself; the next release() calls the resume
// callback exactly once. A limit of 0 never parks.
class ConnectionGate {
   public:
    explicit ConnectionGate(std::size_t limit) : m_limit(limit) {}

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_limit == 0 || m_active < m_limit) {
            ++m_active;
            return true;
        }
        m_parked = true;
        return false;
    }

    void release() {
        std::function<void()> resume;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_active > 0) --m_active;
            if (m_parked && m_resume) {
                m_parked = false;
                resume = m_resume;
            }
        }
        if (resume) resume();
    }

    void set_resume(std::function<void()> resume) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_resume = std::move(resume);
    }

    // Called by the owner on shutdown so late releases never call back into it.
    void detach() { set_resume(nullptr); }

    std::size_t limit() const { return m_limit; }

   private:
    std::mutex m_mutex;
    std::size_t m_limit;
    std::size_t m_active = 0;
    bool m_parked = false;
    std::function<void()> m_resume;
};
