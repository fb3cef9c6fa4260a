#include "queue.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace camper {

void Queue::append(QueueEntry entry) {
    bool was_past_end = past_end();
    items.push_back(std::move(entry));
    if (was_past_end) {
        if (resume_at < 0) {
            resume_at = position;
        }
        position = length();
    }
}

void Queue::insert_next(QueueEntry entry) {
    if (past_end()) {
        append(std::move(entry));
        return;
    }
    items.insert(items.begin() + (position + 1), std::move(entry));
}

bool Queue::remove_at(std::size_t index) {
    if (index >= items.size()) {
        throw std::out_of_range(fmt::format("queue index {} out of range (size {})", index, items.size()));
    }

    long removed = static_cast<long>(index);
    bool was_current = removed == position;
    items.erase(items.begin() + removed);

    if (items.empty()) {
        position = -1;
    } else if (removed < position) {
        --position;
    }
    if (removed < resume_at) {
        --resume_at;
    } else if (resume_at >= length()) {
        resume_at = -1;
    }
    settle();
    return was_current;
}

void Queue::move_cursor_to(std::size_t index) {
    if (index >= items.size()) {
        throw std::out_of_range(fmt::format("queue index {} out of range (size {})", index, items.size()));
    }
    position = static_cast<long>(index);
    settle();
}

std::optional<QueueEntry> Queue::advance() {
    if (items.empty()) {
        return std::nullopt;
    }
    if (position < length()) {
        ++position;
    }
    settle();
    return current();
}

std::optional<QueueEntry> Queue::previous() {
    if (items.empty()) {
        return std::nullopt;
    }
    if (position > -1) {
        --position;
    }
    settle();
    return current();
}

std::optional<QueueEntry> Queue::current() const {
    if (position < 0 || position >= length()) {
        return std::nullopt;
    }
    return items[static_cast<std::size_t>(position)];
}

std::optional<QueueEntry> Queue::resume() {
    if (auto entry = current()) {
        return entry;
    }
    if (items.empty()) {
        return std::nullopt;
    }
    if (position < 0) {
        position = 0;
    } else if (resume_at >= 0) {
        position = resume_at;
    }
    settle();
    return current();
}

bool Queue::can_resume() const {
    return !items.empty() && (position < length() || resume_at >= 0);
}

void Queue::clear() {
    items.clear();
    position = -1;
    resume_at = -1;
}

void Queue::settle() {
    if (!past_end()) {
        resume_at = -1;
    }
}

bool Queue::past_end() const {
    return !items.empty() && position == length();
}

bool Queue::has_next() const {
    return position + 1 < length();
}

bool Queue::has_previous() const {
    return position > 0;
}

} // namespace camper
