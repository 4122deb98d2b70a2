#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/graph/Errors.hpp"  // NotFoundError, TypeError, detail::describe

#include <cstddef>       // std::size_t
#include <functional>    // std::hash
#include <iterator>      // iterator tags
#include <stdexcept>     // std::invalid_argument
#include <type_traits>   // std::decay_t, std::is_same
#include <unordered_map> // storage keyed by index
#include <unordered_set> // keys()
#include <utility>       // std::declval, std::move

namespace fuzz {

// ==========================
// Indexed members and sets
// ==========================
// An indexed member is a record with mutable payload fields and a single
// immutable field (the index) used for identity, hashing and equality.
// An IndexedSet stores such members set-style, but lets callers reach them
// dict-style through the index, so payload fields can be updated in place.
// ==========================

template <typename K>
class IndexedMember {
public:
    using index_type = K;

    // Throws TypeError if the index does not compare equal to itself.
    explicit IndexedMember(K index) : m_index(std::move(index)) {
        detail::requireSelfEqual(m_index, "index");
    }

    const K& index() const noexcept { return m_index; }

    friend bool operator==(const IndexedMember& a, const IndexedMember& b) { return a.m_index == b.m_index; }
    friend bool operator!=(const IndexedMember& a, const IndexedMember& b) { return !(a == b); }

private:
    K m_index; // never reassigned after construction
};

// Set of indexed members. T must expose `index()`; stored entries are copies
// of what was added, so mutating the caller's object later has no effect.
template <typename T>
class IndexedSet {
public:
    using value_type = T;
    using key_type   = std::decay_t<decltype(std::declval<const T&>().index())>;

    static_assert(!std::is_same<T, key_type>::value,
                  "an indexed member must be distinct from its index type");

private:
    using Storage = std::unordered_map<key_type, T>;

public:
    // Read-only iteration over stored members (order unspecified).
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        const_iterator() = default;
        explicit const_iterator(typename Storage::const_iterator it) : m_it(it) {}

        reference operator*() const { return m_it->second; }
        pointer operator->() const { return &m_it->second; }
        const_iterator& operator++() { ++m_it; return *this; }
        const_iterator operator++(int) { const_iterator old = *this; ++m_it; return old; }
        bool operator==(const const_iterator& o) const { return m_it == o.m_it; }
        bool operator!=(const const_iterator& o) const { return m_it != o.m_it; }

    private:
        typename Storage::const_iterator m_it;
    };

    IndexedSet() = default;

    template <typename Range>
    explicit IndexedSet(const Range& items) { update(items); }

    // ---- insertion ----

    // Store a copy of `item`. An existing member with the same index is
    // replaced (last write wins). `item` may refer to a stored member.
    void add(const T& item) {
        T copy(item);
        key_type key = copy.index();
        m_items.erase(key);
        m_items.emplace(std::move(key), std::move(copy));
    }

    template <typename Range>
    void update(const Range& items) {
        for (const auto& item : items) add(item);
    }

    // Assign the member stored under `key`; `item` must carry that key.
    void assign(const key_type& key, const T& item) {
        if (!(item.index() == key))
            throw std::invalid_argument("key does not match item index: " + detail::describe(key));
        add(item);
    }

    // ---- lookup ----

    T& get(const key_type& key) {
        auto it = m_items.find(key);
        if (it == m_items.end()) throw NotFoundError("no member with index " + detail::describe(key));
        return it->second;
    }

    const T& get(const key_type& key) const {
        auto it = m_items.find(key);
        if (it == m_items.end()) throw NotFoundError("no member with index " + detail::describe(key));
        return it->second;
    }

    T& get(const T& item) { return get(item.index()); }
    const T& get(const T& item) const { return get(item.index()); }

    bool contains(const key_type& key) const { return m_items.find(key) != m_items.end(); }
    bool contains(const T& item) const { return contains(item.index()); }
    bool has_key(const key_type& key) const { return contains(key); }

    // ---- removal ----

    void remove(const key_type& key) {
        const key_type k = key;                                     // key may live inside the erased node
        if (m_items.erase(k) == 0) throw NotFoundError("no member with index " + detail::describe(k));
    }

    void remove(const T& item) { remove(item.index()); }

    void clear() noexcept { m_items.clear(); }

    // ---- inspection ----

    std::unordered_set<key_type> keys() const {
        std::unordered_set<key_type> out;
        out.reserve(m_items.size());
        for (const auto& kv : m_items) out.insert(kv.first);
        return out;
    }

    std::size_t size() const noexcept { return m_items.size(); }
    bool empty() const noexcept { return m_items.empty(); }

    const_iterator begin() const { return const_iterator(m_items.cbegin()); }
    const_iterator end() const { return const_iterator(m_items.cend()); }

protected:
    // Mutable pass over every member; the index itself stays untouchable.
    template <typename F>
    void forEachMutable(F&& fn) {
        for (auto& kv : m_items) fn(kv.second);
    }

private:
    Storage m_items;
};

} // namespace fuzz

namespace std {

template <typename K>
struct hash<fuzz::IndexedMember<K>> {
    std::size_t operator()(const fuzz::IndexedMember<K>& m) const { return std::hash<K>{}(m.index()); }
};

} // namespace std
