#pragma once

//
//  Map that iterates in insertion order. Configuration tables are small,
//  so lookups are linear.
//

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace mender {

template <typename K, typename V>
class OrderedMap {
   public:
    using Item = std::pair<K, V>;
    using iterator = typename std::vector<Item>::iterator;
    using const_iterator = typename std::vector<Item>::const_iterator;

    // Insert or overwrite; an overwritten key keeps its position.
    void
    insert(const K& key, V value) {
        if (auto* existing = find(key); existing) {
            *existing = std::move(value);
            return;
        }
        items_.emplace_back(key, std::move(value));
    }

    bool
    remove(const K& key) {
        auto it = std::find_if(items_.begin(), items_.end(), [&](const Item& item) { return item.first == key; });
        if (it == items_.end()) {
            return false;
        }
        items_.erase(it);
        return true;
    }

    V&
    operator[](const K& key) {
        if (auto* existing = find(key); existing) {
            return *existing;
        }
        items_.emplace_back(key, V{});
        return items_.back().second;
    }

    V*
    find(const K& key) {
        for (auto& item : items_) {
            if (item.first == key) {
                return &item.second;
            }
        }
        return nullptr;
    }

    const V*
    find(const K& key) const {
        for (const auto& item : items_) {
            if (item.first == key) {
                return &item.second;
            }
        }
        return nullptr;
    }

    bool
    contains(const K& key) const {
        return find(key) != nullptr;
    }

    std::size_t
    size() const {
        return items_.size();
    }

    bool
    empty() const {
        return items_.empty();
    }

    iterator
    begin() {
        return items_.begin();
    }

    iterator
    end() {
        return items_.end();
    }

    const_iterator
    begin() const {
        return items_.begin();
    }

    const_iterator
    end() const {
        return items_.end();
    }

   private:
    std::vector<Item> items_;
};

}  // namespace mender
