#pragma once

#include <atomic>
#include <cstddef>
#include <ctime>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace pcdrop {

enum class EventLevel {
    Info,
    Success,
    Warning,
    Error
};

const char *level_name(const EventLevel &level);

struct Event {
    enum class Type { Log, Connections };

    Type type = Type::Log;
    EventLevel level = EventLevel::Info;
    std::string message;
    std::time_t timestamp = 0;
    int connections = 0;
};

// Thread-safe, bounded event stream consumed by the UI layer.
// Log events are echoed to stdout/stderr as they are published.
class EventChannel {
public:
    using Listener = std::function<void(const Event &)>;

    explicit EventChannel(const size_t &capacity = 1024, const bool &echo = true);

    void log(const EventLevel &level, const std::string &message);
    void info(const std::string &message) { this->log(EventLevel::Info, message); }
    void success(const std::string &message) { this->log(EventLevel::Success, message); }
    void warning(const std::string &message) { this->log(EventLevel::Warning, message); }
    void error(const std::string &message) { this->log(EventLevel::Error, message); }
    void connections(const int &count);

    // listener runs on the publishing thread, outside the channel lock
    void setListener(Listener listener);
    std::vector<Event> drain();
    size_t dropped() const { return this->dropped_count.load(); }

private:
    void publish(Event event);

    size_t capacity;
    bool echo;
    std::mutex mutex;
    std::deque<Event> pending;
    Listener listener;
    std::atomic<size_t> dropped_count{0};
};

// Live connection count shared between the server workers and the controller.
class ConnectionCounter {
public:
    explicit ConnectionCounter(EventChannel *events = nullptr) : events(events) {}

    int increment();
    int decrement();
    void reset();
    int value() const { return this->count.load(); }

private:
    std::atomic<int> count{0};
    EventChannel *events;
};

// increments on construction, decrements on destruction
class ConnectionGuard {
public:
    explicit ConnectionGuard(ConnectionCounter &counter) : counter(counter) { this->counter.increment(); }
    ~ConnectionGuard() { this->counter.decrement(); }

    ConnectionGuard(const ConnectionGuard &) = delete;
    ConnectionGuard &operator=(const ConnectionGuard &) = delete;

private:
    ConnectionCounter &counter;
};

} // namespace pcdrop
