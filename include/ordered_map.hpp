#ifndef ORDERED_MAP_HPP
#define ORDERED_MAP_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <utility>
#include <stdexcept>
#include <unordered_map>

// ✅ String-keyed map that iterates in insertion order
// Lookups go through the hash map, iteration always walks `order`.
template <typename T>
struct OrderedMap {
    std::vector<std::string> order;              // keys in insertion order
    std::unordered_map<std::string, T> data;     // key -> value

    // Returns the value for key, appending a default one if it is new
    T& operator[](const std::string& key) {
        auto it = data.find(key);
        if (it == data.end()) {
            order.push_back(key);
            it = data.emplace(key, T{}).first;
        }
        return it->second;
    }

    void set(const std::string& key, T value) {
        (*this)[key] = std::move(value);
    }

    const T& at(const std::string& key) const {
        auto it = data.find(key);
        if (it == data.end()) {
            throw std::out_of_range("❌ Error: Unknown key: " + key);
        }
        return it->second;
    }

    bool contains(const std::string& key) const { return data.contains(key); }
    std::size_t size() const { return order.size(); }
    bool empty() const { return order.empty(); }
};

#endif
