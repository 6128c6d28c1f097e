/**
 * Insertion-ordered map
 *
 * Associative container that iterates in the order keys were first
 * inserted. Lookup goes through a hash index into the entry vector.
 */

#ifndef STOCKHOLM_ORDERED_MAP_HPP
#define STOCKHOLM_ORDERED_MAP_HPP

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stockholm {

template<typename K, typename V>
class OrderedMap {
public:
    // Keys are const, as in std::map, so iteration cannot desync the index
    using value_type = std::pair<const K, V>;
    using container_type = std::vector<value_type>;
    using iterator = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

    OrderedMap() = default;

    /**
     * Insert a new entry at the end
     * @return false (and leaves the map unchanged) if key already present
     */
    bool insert(const K& key, V value) {
        if (index_.count(key) > 0) {
            return false;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return true;
    }

    bool contains(const K& key) const { return index_.count(key) > 0; }

    /**
     * Get value for key, or nullptr if absent
     */
    V* find(const K& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        return &entries_[it->second].second;
    }

    const V* find(const K& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        return &entries_[it->second].second;
    }

    V& at(const K& key) {
        V* value = find(key);
        if (!value) throw std::out_of_range("OrderedMap::at: key not found");
        return *value;
    }

    const V& at(const K& key) const {
        const V* value = find(key);
        if (!value) throw std::out_of_range("OrderedMap::at: key not found");
        return *value;
    }

    /**
     * Keys in insertion order
     */
    std::vector<K> keys() const {
        std::vector<K> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.first);
        }
        return result;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.cbegin(); }
    const_iterator end() const { return entries_.cend(); }

private:
    container_type entries_;
    std::unordered_map<K, size_t> index_;
};

} // namespace stockholm

#endif // STOCKHOLM_ORDERED_MAP_HPP
