#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camper::bandcamp {

template <typename T>
struct Page {
    std::vector<T> items;
    // Records dropped because they failed to parse.
    std::size_t skipped = 0;
    // Cursor for the following page; empty on the last page.
    std::optional<std::string> next_cursor;
};

// Lazy, restartable sequence of pages for one query. Pages are fetched one at
// a time on demand, so they are always delivered in request order.
template <typename T>
class PagedQuery {
public:
    using Fetch = std::function<Page<T>(const std::string& cursor)>;

    explicit PagedQuery(Fetch fetch, std::string first_cursor = "")
        : fetch(std::move(fetch)), first_cursor(first_cursor), cursor(std::move(first_cursor)) {}

    PagedQuery(PagedQuery&& other) noexcept
        : fetch(std::move(other.fetch)),
          first_cursor(std::move(other.first_cursor)),
          cursor(std::move(other.cursor)),
          fetched(other.fetched) {}

    // Fetches the next page. On an exhausted query returns an empty page.
    // If the fetch throws, the cursor is left where it was so the same page
    // can be requested again.
    Page<T> next_page() {
        std::lock_guard<std::mutex> lock(mutex);
        if (!cursor) {
            return Page<T>{};
        }
        Page<T> page = fetch(*cursor);
        cursor = page.next_cursor;
        ++fetched;
        return page;
    }

    bool has_more() const {
        std::lock_guard<std::mutex> lock(mutex);
        return cursor.has_value();
    }

    void restart() {
        std::lock_guard<std::mutex> lock(mutex);
        cursor = first_cursor;
        fetched = 0;
    }

    std::size_t pages_fetched() const {
        std::lock_guard<std::mutex> lock(mutex);
        return fetched;
    }

private:
    Fetch fetch;
    std::string first_cursor;
    std::optional<std::string> cursor;
    std::size_t fetched = 0;
    mutable std::mutex mutex;
};

} // namespace camper::bandcamp
