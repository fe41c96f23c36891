#include "reaper.hpp"

#include "common/utils/log_manager.hpp"

namespace chatlive::live {

using chatlive::utils::LogManager;

Reaper::Reaper(db::RedisManager& redis, ChatPublisher& publisher, UserDirectory& directory,
               std::chrono::milliseconds interval, PresenceOptions options)
        : redis_(redis),
          publisher_(publisher),
          directory_(directory),
          interval_(interval),
          options_(options) {}

Reaper::~Reaper() {
    stop();
}

size_t Reaper::run_once() {
    auto logger = LogManager::GetLogger("reaper");
    size_t removed = 0;

    std::vector<int64_t> rooms;
    try {
        rooms = UserListStore::scan_active_rooms(redis_);
    } catch (const std::exception& e) {
        logger->error("Failed to scan active rooms: {}", e.what());
        return 0;
    }

    for (auto room_id : rooms) {
        try {
            removed += reap_room(room_id);
        } catch (const std::exception& e) {
            logger->error("Failed to reap room {}: {}", room_id, e.what());
        }
    }

    if (removed > 0) {
        logger->info("Reaped {} expired handles across {} rooms", removed, rooms.size());
    }
    return removed;
}

/**
 * @brief Remove the expired handles of one room
 *
 * @details A user who re-joins between detection and removal keeps the new
 *          handle: leave_handle only removes the handle that expired.
 */
size_t Reaper::reap_room(int64_t room_id) {
    auto logger = LogManager::GetLogger("reaper");
    UserListStore store(redis_, room_id, options_);
    size_t removed = 0;

    for (const auto& entry : store.inconsistent_entries()) {
        auto user = directory_.find_user(room_id, entry.user_id);
        // Unknown profiles fall back to the number recorded at join
        int user_number = user ? user->number : kUnknownUserNumber;

        bool went_offline = store.leave_handle(entry.handle, user_number);
        ++removed;
        logger->debug("Removed expired handle {} of user {} in room {}", entry.handle,
                      entry.user_id, room_id);

        if (!went_offline) {
            continue;
        }
        if (user) {
            publisher_.send(make_timeout_event(room_id, *user));
        } else {
            logger->warn("No profile for user {} in room {}, timeout event dropped",
                         entry.user_id, room_id);
        }
    }
    return removed;
}

void Reaper::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(true);
    worker_ = std::thread(&Reaper::loop, this);
    LogManager::GetLogger("reaper")->info("Reaper started, interval {} ms", interval_.count());
}

void Reaper::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_running = running_.exchange(false);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (was_running) {
        LogManager::GetLogger("reaper")->info("Reaper stopped");
    }
}

void Reaper::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        lock.unlock();
        run_once();
        lock.lock();
        cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

}  // namespace chatlive::live
