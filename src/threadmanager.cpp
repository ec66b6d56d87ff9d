#include "threadmanager.h"
#include <exception>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace blockshare {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
    LOG_THREAD_DEBUG("ThreadManager initialized");
}

ThreadManager::~ThreadManager() {
    join_all_active_threads();
    LOG_THREAD_DEBUG("ThreadManager destroyed");
}

bool ThreadManager::add_managed_thread(std::function<void()> body, const std::string& name) {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Not starting thread during shutdown: " << name);
        return false;
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread t([body, finished, name]() {
        try {
            body();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Thread '" << name << "' terminated by exception: " << e.what());
        }
        finished->store(true);
    });

    active_threads_.push_back(ManagedThread{name, finished, std::move(t)});
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

size_t ThreadManager::cleanup_finished_threads() {
    std::vector<ManagedThread> finished_threads;
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        auto it = active_threads_.begin();
        while (it != active_threads_.end()) {
            if (it->finished->load()) {
                finished_threads.push_back(std::move(*it));
                it = active_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& mt : finished_threads) {
        if (mt.thread.joinable()) {
            mt.thread.join();
        }
        LOG_THREAD_DEBUG("Reaped finished thread: " << mt.name);
    }
    return finished_threads.size();
}

void ThreadManager::shutdown_all_threads() {
    LOG_THREAD_DEBUG("Refusing new threads from now on");
    shutdown_requested_.store(true);
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> threads_to_join;

    // Move threads out of the container while holding the lock
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }
        LOG_THREAD_DEBUG("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    // Join threads without holding the mutex
    for (auto& mt : threads_to_join) {
        if (mt.thread.joinable()) {
            if (mt.thread.get_id() == std::this_thread::get_id()) {
                LOG_THREAD_WARN("Thread '" << mt.name << "' cannot join itself, detaching");
                mt.thread.detach();
                continue;
            }
            mt.thread.join();
        }
    }

    LOG_THREAD_DEBUG("All managed threads have been joined");
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

} // namespace blockshare
