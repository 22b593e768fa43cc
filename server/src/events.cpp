#include "events.hpp"
#include "pcdrop/helpers.hpp"

#include <iostream>
#include <utility>

namespace pcdrop {

const char *level_name(const EventLevel &level) {
    switch (level) {
        case EventLevel::Info:    return "info";
        case EventLevel::Success: return "success";
        case EventLevel::Warning: return "warning";
        case EventLevel::Error:   return "error";
    }
    return "info";
}

EventChannel::EventChannel(const size_t &capacity, const bool &echo) : capacity(capacity == 0 ? 1 : capacity), echo(echo) {}

void EventChannel::log(const EventLevel &level, const std::string &message) {
    Event event;
    event.type = Event::Type::Log;
    event.level = level;
    event.message = message;
    event.timestamp = std::time(nullptr);

    if (this->echo) {
        std::ostream &out = (level == EventLevel::Warning || level == EventLevel::Error) ? std::cerr : std::cout;
        out << "[" << format_time(event.timestamp) << "] [" << level_name(level) << "] " << message << std::endl;
    }
    this->publish(std::move(event));
}

void EventChannel::connections(const int &count) {
    Event event;
    event.type = Event::Type::Connections;
    event.message = "Connections: " + std::to_string(count);
    event.timestamp = std::time(nullptr);
    event.connections = count;
    this->publish(std::move(event));
}

void EventChannel::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->listener = std::move(listener);
}

std::vector<Event> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<Event> out(this->pending.begin(), this->pending.end());
    this->pending.clear();
    return out;
}

void EventChannel::publish(Event event) {
    Listener current;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        // drop the oldest event once the consumer falls behind
        if (this->pending.size() >= this->capacity) {
            this->pending.pop_front();
            this->dropped_count++;
        }
        this->pending.push_back(event);
        current = this->listener;
    }
    if (current) {
        current(event);
    }
}

int ConnectionCounter::increment() {
    int now = this->count.fetch_add(1) + 1;
    if (this->events) {
        this->events->connections(now);
    }
    return now;
}

int ConnectionCounter::decrement() {
    int now = this->count.fetch_sub(1) - 1;
    if (this->events) {
        this->events->connections(now);
    }
    return now;
}

void ConnectionCounter::reset() {
    this->count.store(0);
    if (this->events) {
        this->events->connections(0);
    }
}

} // namespace pcdrop
