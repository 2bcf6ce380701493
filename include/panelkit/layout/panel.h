#pragma once
#include <panelkit/layout/element.h>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace panelkit::layout {

// An element that exclusively owns an ordered list of children. Children
// keep a raw back-pointer to the panel for invalidation only.
class Panel : public Element {
public:
    Panel() = default;
    ~Panel() override;

    // Throws std::invalid_argument for a null child or one that already has
    // a parent. Returns the inserted child.
    Element& add_child(std::unique_ptr<Element> child);
    Element& insert_child(std::size_t index, std::unique_ptr<Element> child);

    template<typename T, typename... Args>
    T& emplace_child(Args&&... args) {
        auto element = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *element;
        add_child(std::move(element));
        return ref;
    }

    // Detaches `child` and drops all of its attached layout metadata.
    // Throws std::invalid_argument if `child` is not a child of this panel.
    std::unique_ptr<Element> remove_child(Element& child);
    void clear_children();

    std::size_t child_count() const { return children_.size(); }
    std::size_t visual_child_count() const override { return children_.size(); }
    Element* visual_child(std::size_t index) const override { return child_at(index); }
    Element* child_at(std::size_t index) const;
    bool contains_child(const Element& child) const;
    // -1 if not a child.
    int index_of(const Element& child) const;

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

protected:
    virtual void on_child_added(Element&) {}
    virtual void on_child_removed(Element&) {}

    const std::vector<std::unique_ptr<Element>>& children() const { return children_; }

private:
    std::vector<std::unique_ptr<Element>> children_;
};

} // namespace panelkit::layout
