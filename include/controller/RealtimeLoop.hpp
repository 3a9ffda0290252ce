#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"
#include "core/GameSession.hpp"

namespace blockfall::controller {

/// Drives a GameController from a background thread.
/// The thread wakes every `frame`, feeds the elapsed wall time to the
/// controller and goes back to sleep. Every access to the session,
/// from the loop thread or from input threads through post()/withSession(),
/// goes through the same mutex.
/// stop() (and the destructor) joins the thread, so no tick can fire
/// after the loop is torn down.
///
/// Session events are taken out under the lock and handed to subscribers
/// after it is released, one batch at a time and in production order.
/// Handlers may call snapshot(), post() and withSession(); events those
/// calls produce are delivered after the current batch. Handlers must not
/// call stop() and must subscribe before start().
class RealtimeLoop {
public:
    using Duration = GameController::Duration;

    /// Loop does not own the GameSession; caller keeps it alive.
    explicit RealtimeLoop(blockfall::core::GameSession& session,
                          Duration frame = Duration{16});
    ~RealtimeLoop();

    // Non-copyable, non-movable
    RealtimeLoop(const RealtimeLoop&) = delete;
    RealtimeLoop& operator=(const RealtimeLoop&) = delete;

    void start();
    void stop();
    bool isRunning() const noexcept { return m_running; }

    /// Apply a player action, serialized with the gravity ticks.
    void post(InputAction action);

    /// Run `fn(session)` under the loop lock and return its result.
    /// Events it produces are delivered once the lock is released.
    template <typename Fn>
    decltype(auto) withSession(Fn&& fn) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&&, blockfall::core::GameSession&>>) {
            std::forward<Fn>(fn)(m_session);
            deliverEvents(lock);
        } else {
            auto result = std::forward<Fn>(fn)(m_session);
            deliverEvents(lock);
            return result;
        }
    }

    blockfall::core::SessionState snapshot() const;

private:
    void run();

    // Called with `lock` held; returns with it held
    void deliverEvents(std::unique_lock<std::mutex>& lock);

    blockfall::core::GameSession& m_session;
    GameController m_controller;
    Duration m_frame;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::atomic<bool> m_running{false};
    std::thread m_thread;

    // Guarded by m_mutex
    std::vector<blockfall::core::GameEvent> m_outbox;
    bool m_delivering{false};
};

} // namespace blockfall::controller
