#pragma once

#include <cstddef>
#include <list>
#include <unordered_map>
#include <utility>

namespace af {

/**
 * @brief Hash map that remembers insertion order and trims its oldest entries
 *
 * Overwriting an existing key keeps its original position. `trim_to(n)`
 * removes entries from the front until at most n remain, in O(1) per
 * removed entry. Access does not affect ordering.
 */
template<typename Key, typename Value>
class InsertionOrderedMap {
public:
    using value_type = std::pair<Key, Value>;
    using const_iterator = typename std::list<value_type>::const_iterator;

    /**
     * @brief Insert a new entry or overwrite an existing one in place
     * @return true if the key was newly inserted
     */
    bool insert_or_assign(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            return false;
        }
        entries_.emplace_back(key, std::move(value));
        index_.emplace(key, std::prev(entries_.end()));
        return true;
    }

    const Value* find(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &it->second->second;
    }

    Value* find(const Key& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &it->second->second;
    }

    bool contains(const Key& key) const { return index_.count(key) > 0; }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    /**
     * @brief Drop the oldest entries until at most max_size remain
     * @return Number of entries removed
     */
    size_t trim_to(size_t max_size) {
        size_t removed = 0;
        while (entries_.size() > max_size) {
            index_.erase(entries_.front().first);
            entries_.pop_front();
            ++removed;
        }
        return removed;
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::list<value_type> entries_;
    std::unordered_map<Key, typename std::list<value_type>::iterator> index_;
};

/**
 * @brief Insertion-ordered set with the same trimming semantics
 */
template<typename Key>
class InsertionOrderedSet {
public:
    bool insert(const Key& key) { return entries_.insert_or_assign(key, true); }
    bool contains(const Key& key) const { return entries_.contains(key); }
    bool erase(const Key& key) { return entries_.erase(key); }
    size_t trim_to(size_t max_size) { return entries_.trim_to(max_size); }
    void clear() { entries_.clear(); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    InsertionOrderedMap<Key, bool> entries_;
};

} // namespace af
