#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "../common/models.hpp"

namespace camper {

// Ordered play queue with a cursor. The cursor is -1 before the first entry
// (and always when empty), an index while something is current, or size()
// once advance() ran past the last entry. Pure data, no I/O.
class Queue {
public:
    void append(QueueEntry entry);
    // Directly after the current entry, or first in line while the cursor
    // is before the start. Past the end it appends.
    void insert_next(QueueEntry entry);
    // Returns true when the removed entry was the current one. The cursor
    // then rests on whatever slid into its place (past-end if nothing did).
    // Throws std::out_of_range.
    bool remove_at(std::size_t index);
    // Throws std::out_of_range.
    void move_cursor_to(std::size_t index);
    std::optional<QueueEntry> advance();
    std::optional<QueueEntry> previous();
    std::optional<QueueEntry> current() const;
    // Entry playback should start from when nothing is current: the first
    // entry while the cursor is before the start, or the first one added
    // after playback ran off the end. Moves the cursor there.
    std::optional<QueueEntry> resume();
    bool can_resume() const;
    void clear();

    bool empty() const { return items.empty(); }
    std::size_t size() const { return items.size(); }
    long cursor() const { return position; }
    bool past_end() const;
    bool has_next() const;
    bool has_previous() const;
    const std::vector<QueueEntry>& entries() const { return items; }

private:
    long length() const { return static_cast<long>(items.size()); }
    void settle();

    std::vector<QueueEntry> items;
    long position = -1;
    // First entry appended while past the end, -1 if none.
    long resume_at = -1;
};

} // namespace camper
