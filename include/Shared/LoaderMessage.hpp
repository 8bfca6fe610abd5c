// =============================================================================
// SKYROAM - LOADER MESSAGES
// The only contract between the ingestion worker and the simulation loop
// =============================================================================
#pragma once

#include "Shared/Types.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skyroam {

// =============================================================================
// MESSAGE KINDS
// =============================================================================
struct StatusMessage {
    std::string text;
};

struct ProgressMessage {
    float fraction = 0.0f;   // [0, 1], non-decreasing per stream
};

struct BatchLoadedMessage {
    std::vector<ChunkData> chunks;
};

// Terminal; nothing follows
struct DoneMessage {};

using LoaderMessage = std::variant<StatusMessage, ProgressMessage, BatchLoadedMessage, DoneMessage>;

// =============================================================================
// MESSAGE CHANNEL
// Unbounded FIFO. push() never waits on the reader; try_pop() never blocks.
// =============================================================================
template<typename T>
class MessageChannel {
public:
    MessageChannel() = default;

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    void push(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(value));
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

private:
    std::deque<T> m_queue;
    mutable std::mutex m_mutex;
};

using LoaderChannel = MessageChannel<LoaderMessage>;

// =============================================================================
// PROGRESS REPORTER
// Producer-side helper: clamps to [0,1], never goes backwards, and only emits
// once the value has moved by at least `min_step`.
// =============================================================================
class ProgressReporter {
public:
    explicit ProgressReporter(LoaderChannel& channel, float min_step = 0.01f)
        : m_channel(channel), m_min_step(min_step) {}

    void report(float fraction) {
        fraction = std::clamp(fraction, 0.0f, 1.0f);
        if (fraction <= m_last) {
            return;
        }
        if (m_emitted && fraction - m_last < m_min_step && fraction < 1.0f) {
            return;
        }
        m_last = fraction;
        m_emitted = true;
        m_channel.push(ProgressMessage{fraction});
    }

    // Emit regardless of step size (phase boundaries)
    void force(float fraction) {
        fraction = std::clamp(fraction, 0.0f, 1.0f);
        if (m_emitted && fraction <= m_last) {
            return;
        }
        m_last = fraction;
        m_emitted = true;
        m_channel.push(ProgressMessage{fraction});
    }

    void status(std::string text) {
        m_channel.push(StatusMessage{std::move(text)});
    }

    [[nodiscard]] float last() const noexcept { return m_last; }

private:
    LoaderChannel& m_channel;
    float m_min_step;
    float m_last = 0.0f;
    bool m_emitted = false;
};

} // namespace skyroam
