#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace pl {

/**
 * @brief Insertion-ordered set with constant-time membership and removal
 *
 * Iteration visits keys in the order they were (last) inserted. `insert`
 * and `erase` report whether the set actually changed; callers rely on
 * that to decide whether a mutation was effective.
 */
template <typename Key, typename Hash = std::hash<Key>, typename Equal = std::equal_to<Key>>
class OrderedSet {
public:
    using value_type = Key;
    using const_iterator = typename std::list<Key>::const_iterator;

    OrderedSet() = default;

    OrderedSet(std::initializer_list<Key> keys) {
        for (const auto& k : keys) insert(k);
    }

    OrderedSet(const OrderedSet& other) {
        for (const auto& k : other.order_) insert(k);
    }

    OrderedSet& operator=(const OrderedSet& other) {
        if (this != &other) {
            clear();
            for (const auto& k : other.order_) insert(k);
        }
        return *this;
    }

    OrderedSet(OrderedSet&&) = default;
    OrderedSet& operator=(OrderedSet&&) = default;

    bool insert(const Key& key) {
        if (index_.find(key) != index_.end()) return false;
        order_.push_back(key);
        index_.emplace(key, std::prev(order_.end()));
        return true;
    }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    void clear() {
        index_.clear();
        order_.clear();
    }

    const Key& front() const {
        if (empty()) throw std::out_of_range("OrderedSet::front on empty set");
        return order_.front();
    }

    const Key& back() const {
        if (empty()) throw std::out_of_range("OrderedSet::back on empty set");
        return order_.back();
    }

    Key popBack() {
        Key key = back();
        erase(key);
        return key;
    }

    Key popFront() {
        Key key = front();
        erase(key);
        return key;
    }

    const_iterator begin() const { return order_.cbegin(); }
    const_iterator end() const { return order_.cend(); }

    std::vector<Key> toVector() const { return std::vector<Key>(order_.begin(), order_.end()); }

    // Order-sensitive comparison
    bool operator==(const OrderedSet& other) const {
        if (size() != other.size()) return false;
        Equal eq;
        auto a = order_.begin();
        auto b = other.order_.begin();
        for (; a != order_.end(); ++a, ++b) {
            if (!eq(*a, *b)) return false;
        }
        return true;
    }

    bool operator!=(const OrderedSet& other) const { return !(*this == other); }

private:
    std::list<Key> order_;
    std::unordered_map<Key, typename std::list<Key>::iterator, Hash, Equal> index_;
};

} // namespace pl
