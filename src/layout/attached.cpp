#include <panelkit/layout/attached.h>

#include <algorithm>

namespace panelkit::layout {

std::vector<AttachedTableBase*>& AttachedTableBase::registry() {
    // Never destroyed: elements with static storage may be released after
    // every table (and any ordinary static registry) is gone.
    static auto* tables = new std::vector<AttachedTableBase*>();
    return *tables;
}

AttachedTableBase::AttachedTableBase() {
    registry().push_back(this);
}

AttachedTableBase::~AttachedTableBase() {
    auto& tables = registry();
    tables.erase(std::remove(tables.begin(), tables.end(), this), tables.end());
}

void AttachedTableBase::release_all(const Element& element) {
    for (AttachedTableBase* table : registry()) {
        table->release(element);
    }
}

} // namespace panelkit::layout
