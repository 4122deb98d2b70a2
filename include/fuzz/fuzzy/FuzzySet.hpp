#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/iset/IndexedSet.hpp"   // IndexedMember / IndexedSet storage

#include <cmath>          // std::isnan
#include <stdexcept>      // std::invalid_argument
#include <string>         // messages
#include <unordered_set>  // crisp results of cuts
#include <utility>        // std::move

namespace fuzz {

// ==========================
// Fuzzy elements and sets
// ==========================
// A FuzzyElement pairs an object (its immutable index) with a mutable
// membership degree mu in [0, 1]. A FuzzySet is an IndexedSet of such
// elements: at most one degree per object, and degrees can be changed in
// place through get(obj).mu without removing the element.
// ==========================
template <typename T>
class FuzzyElement : public IndexedMember<T> {
public:
    // Throws std::invalid_argument if mu lies outside [0, 1].
    explicit FuzzyElement(T obj, double degree = 1.0) : IndexedMember<T>(std::move(obj)), mu(degree) {
        if (std::isnan(mu) || mu < 0.0 || mu > 1.0)
            throw std::invalid_argument("membership degree must lie in [0, 1]: " + std::to_string(mu));
    }

    const T& obj() const noexcept { return this->index(); }

    double mu; // membership degree
};

template <typename T>
class FuzzySet : public IndexedSet<FuzzyElement<T>> {
public:
    using Base    = IndexedSet<FuzzyElement<T>>;
    using Element = FuzzyElement<T>;
    using Objects = std::unordered_set<T>;

    using Base::Base;
    using Base::add;

    void add(const T& obj, double mu) { Base::add(Element(obj, mu)); }

    // Membership degree of obj, 0 if it is not an element.
    double mu(const T& obj) const { return this->contains(obj) ? this->get(obj).mu : 0.0; }

    Objects objects() const {
        Objects out;
        for (const auto& e : *this) out.insert(e.obj());
        return out;
    }

    // Alpha cut: objects with mu >= a.
    Objects alpha(double a) const {
        Objects out;
        for (const auto& e : *this)
            if (e.mu >= a) out.insert(e.obj());
        return out;
    }

    // Strong alpha cut: objects with mu > a.
    Objects strong_alpha(double a) const {
        Objects out;
        for (const auto& e : *this)
            if (e.mu > a) out.insert(e.obj());
        return out;
    }

    // Largest membership degree (0 for an empty set).
    double height() const {
        double h = 0.0;
        for (const auto& e : *this)
            if (e.mu > h) h = e.mu;
        return h;
    }

    // Rescale so the height becomes 1. No-op when every degree is 0.
    void normalize() {
        const double h = height();
        if (h <= 0.0 || h == 1.0) return;
        this->forEachMutable([h](Element& e) { e.mu /= h; });
    }

    // Pointwise containment: every element of *this is in other with at
    // least the same degree.
    bool issubset(const FuzzySet& other) const {
        for (const auto& e : *this)
            if (!other.contains(e.obj()) || e.mu > other.get(e.obj()).mu) return false;
        return true;
    }

    bool issuperset(const FuzzySet& other) const { return other.issubset(*this); }

    friend bool operator==(const FuzzySet& a, const FuzzySet& b) {
        return a.issubset(b) && b.issubset(a);
    }
    friend bool operator!=(const FuzzySet& a, const FuzzySet& b) { return !(a == b); }
};

} // namespace fuzz
