#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

template <typename T>
struct Page {
    std::vector<T> items;
    std::size_t cursor{0}; // cursor to pass for the next page
};

// Slices `source` from `cursor`, at most `how_many` items, in insertion order.
// A cursor at or past the end yields an empty page that keeps the cursor.
template <typename T>
Page<T> fetch_page(const std::vector<T>& source, std::size_t cursor, std::size_t how_many) {
    Page<T> page;
    page.cursor = cursor;
    if (cursor >= source.size()) {
        return page;
    }
    const std::size_t length = std::min(how_many, source.size() - cursor);
    page.items.assign(source.begin() + cursor, source.begin() + cursor + length);
    page.cursor = cursor + length;
    return page;
}
