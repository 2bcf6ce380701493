#pragma once
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace panelkit::layout {

class Element;

// Registry of every attached-property table so an element's entries can be
// dropped from all of them at once (on removal from a panel, or on
// destruction).
class AttachedTableBase {
public:
    AttachedTableBase(const AttachedTableBase&) = delete;
    AttachedTableBase& operator=(const AttachedTableBase&) = delete;

    static void release_all(const Element& element);

protected:
    AttachedTableBase();
    virtual ~AttachedTableBase();

    virtual void release(const Element& element) = 0;

private:
    static std::vector<AttachedTableBase*>& registry();
};

// Side-table of per-element layout metadata keyed by element identity. The
// table never owns or dereferences the element; entries live until released.
template<typename T>
class AttachedTable : public AttachedTableBase {
public:
    AttachedTable() = default;
    ~AttachedTable() override = default;

    const T* find(const Element& element) const {
        auto it = entries_.find(&element);
        return it == entries_.end() ? nullptr : &it->second;
    }

    T* find(const Element& element) {
        auto it = entries_.find(&element);
        return it == entries_.end() ? nullptr : &it->second;
    }

    T& get_or_create(const Element& element) { return entries_[&element]; }

    bool contains(const Element& element) const { return entries_.count(&element) != 0; }
    bool erase(const Element& element) { return entries_.erase(&element) != 0; }
    std::size_t size() const { return entries_.size(); }

protected:
    void release(const Element& element) override { entries_.erase(&element); }

private:
    std::unordered_map<const Element*, T> entries_;
};

} // namespace panelkit::layout
