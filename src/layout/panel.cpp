#include <panelkit/layout/panel.h>

#include <panelkit/layout/attached.h>

#include <algorithm>
#include <stdexcept>

namespace panelkit::layout {

Panel::~Panel() = default;

Element& Panel::add_child(std::unique_ptr<Element> child) {
    return insert_child(children_.size(), std::move(child));
}

Element& Panel::insert_child(std::size_t index, std::unique_ptr<Element> child) {
    if (!child) {
        throw std::invalid_argument("Panel: cannot add a null child");
    }
    if (child->parent_ != nullptr || child->host_ != nullptr) {
        throw std::invalid_argument("Panel: child already belongs to another tree");
    }
    if (child.get() == this || child->is_ancestor_of(*this)) {
        throw std::invalid_argument("Panel: cannot add an ancestor as a child");
    }

    index = std::min(index, children_.size());
    Element* new_child = child.get();
    new_child->parent_ = this;
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));

    on_child_added(*new_child);
    // The new child is dirty already, so bubble from the panel itself.
    invalidate_measure();
    return *new_child;
}

std::unique_ptr<Element> Panel::remove_child(Element& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<Element>& c) {
            return c.get() == &child;
        });
    if (it == children_.end()) {
        throw std::invalid_argument("Panel: element is not a child of this panel");
    }

    std::unique_ptr<Element> removed = std::move(*it);
    children_.erase(it);
    removed->parent_ = nullptr;

    on_child_removed(*removed);
    AttachedTableBase::release_all(*removed);
    invalidate_measure();
    return removed;
}

void Panel::clear_children() {
    while (!children_.empty()) {
        remove_child(*children_.back());
    }
}

Element* Panel::child_at(std::size_t index) const {
    if (index >= children_.size()) return nullptr;
    return children_[index].get();
}

bool Panel::contains_child(const Element& child) const {
    return index_of(child) >= 0;
}

int Panel::index_of(const Element& child) const {
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].get() == &child) return static_cast<int>(i);
    }
    return -1;
}

} // namespace panelkit::layout
