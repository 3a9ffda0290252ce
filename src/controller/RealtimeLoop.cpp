#include "controller/RealtimeLoop.hpp"

#include <chrono>
#include <iterator>
#include <stdexcept>

namespace blockfall::controller {

RealtimeLoop::RealtimeLoop(blockfall::core::GameSession& session, Duration frame)
    : m_session(session)
    , m_controller(session)
    , m_frame(frame)
{
    if (m_frame.count() <= 0) {
        throw std::invalid_argument("RealtimeLoop: frame duration must be positive");
    }
    m_session.setDeferredEventDelivery(true);
}

RealtimeLoop::~RealtimeLoop()
{
    stop();
    m_session.setDeferredEventDelivery(false);
}

void RealtimeLoop::start()
{
    if (m_running.exchange(true)) {
        return; // already running
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_controller.resetTiming();
    }

    // Start background tick loop
    m_thread = std::thread(&RealtimeLoop::run, this);
}

void RealtimeLoop::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_wakeup.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void RealtimeLoop::post(InputAction action)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_controller.handleAction(action);
    deliverEvents(lock);
}

blockfall::core::SessionState RealtimeLoop::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session.snapshot();
}

void RealtimeLoop::run()
{
    using Clock = GameController::Clock;

    auto last = Clock::now();

    std::unique_lock<std::mutex> lock(m_mutex);
    while (m_running) {
        m_wakeup.wait_for(lock, m_frame, [this] { return !m_running; });
        if (!m_running) {
            break;
        }

        // Only hand whole milliseconds to the controller; the remainder
        // stays in `last` for the next frame.
        const auto elapsed = std::chrono::duration_cast<Duration>(Clock::now() - last);
        last += elapsed;

        m_controller.update(elapsed);
        deliverEvents(lock);
    }
}

void RealtimeLoop::deliverEvents(std::unique_lock<std::mutex>& lock)
{
    auto produced = m_session.takePendingEvents();
    m_outbox.insert(m_outbox.end(),
                    std::make_move_iterator(produced.begin()),
                    std::make_move_iterator(produced.end()));

    if (m_delivering) {
        return; // the delivering thread picks them up after its current batch
    }

    m_delivering = true;
    try {
        while (!m_outbox.empty()) {
            std::vector<blockfall::core::GameEvent> batch;
            batch.swap(m_outbox);

            lock.unlock();
            for (const auto& event : batch) {
                m_session.events().emit(event);
            }
            lock.lock();
        }
    } catch (...) {
        // Leave delivery usable after a throwing handler
        if (!lock.owns_lock()) {
            lock.lock();
        }
        m_delivering = false;
        throw;
    }
    m_delivering = false;
}

} // namespace blockfall::controller
