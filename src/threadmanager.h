#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <functional>

namespace blockshare {

/**
 * ThreadManager owns the background threads of a component (accept loop,
 * session handlers, download workers) and joins them on shutdown.
 *
 * Threads are started through add_managed_thread(), which wraps the body so
 * that an escaping exception is logged and the thread is marked finished.
 * Finished threads can be reaped while the owner keeps running, which matters
 * for a server that spawns one thread per inbound connection.
 *
 * Derived classes must call join_all_active_threads() in their own destructor,
 * before the members the threads use are destroyed.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Start a managed thread running body
     * @param body Thread function
     * @param name Descriptive name for logging purposes
     * @return false if the manager is shutting down and the thread was not started
     */
    bool add_managed_thread(std::function<void()> body, const std::string& name);

    /**
     * Join threads that have finished execution
     * @return Number of threads reaped
     */
    size_t cleanup_finished_threads();

    /**
     * Refuse new threads from now on
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish
     */
    void join_all_active_threads();

    /**
     * Get the current number of threads not yet joined
     * @return Number of active threads
     */
    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

private:
    struct ManagedThread {
        std::string name;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    std::vector<ManagedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    // Prevent copying
    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace blockshare
