#include <panelkit/layout/layout_root.h>

#include <sstream>
#include <stdexcept>

namespace panelkit::layout {

namespace {

constexpr const char* kStage = "pass";

} // namespace

LayoutRoot::LayoutRoot(LayoutOptions options)
    : options_(options), diagnostics_(options.max_retained_events) {
    diagnostics_.set_min_severity(options_.min_severity);
}

LayoutRoot::~LayoutRoot() {
    if (root_) {
        root_->host_ = nullptr;
    }
}

Element& LayoutRoot::set_root(std::unique_ptr<Element> root) {
    if (!root) {
        throw std::invalid_argument("LayoutRoot: root element must not be null");
    }
    if (root->parent() != nullptr || root->host_ != nullptr) {
        throw std::invalid_argument("LayoutRoot: root element is already part of another tree");
    }

    if (root_) {
        root_->host_ = nullptr;
    }
    root_ = std::move(root);
    root_->host_ = this;
    root_->invalidate_subtree();
    return *root_;
}

std::unique_ptr<Element> LayoutRoot::release_root() {
    if (root_) {
        root_->host_ = nullptr;
    }
    return std::move(root_);
}

void LayoutRoot::update_layout(const geometry::Size& viewport) {
    if (!root_) {
        return;
    }

    ++pass_count_;
    diagnostics_.set_correlation_id(pass_count_);
    {
        std::ostringstream oss;
        oss << "layout pass over " << viewport.to_string();
        diagnostics_.info(core::config::kModuleLayout, kStage, oss.str());
    }

    root_->measure(viewport);

    const geometry::Size& desired = root_->desired_size();
    float w = viewport.has_infinite_width() ? desired.width() : viewport.width();
    float h = viewport.has_infinite_height() ? desired.height() : viewport.height();
    root_->arrange(geometry::Rect(0, 0, w, h));

    {
        std::ostringstream oss;
        oss << "desired " << desired.to_string() << ", arranged " << root_->bounds().to_string();
        diagnostics_.info(core::config::kModuleLayout, kStage, oss.str());
    }
}

bool LayoutRoot::needs_layout() const {
    return root_ && (root_->needs_measure() || root_->needs_arrange());
}

void LayoutRoot::set_options(const LayoutOptions& options) {
    options_ = options;
    diagnostics_.set_min_severity(options_.min_severity);
    diagnostics_.set_capacity(options_.max_retained_events);
    if (root_) {
        // Rounding changes every desired size in the tree; the cached
        // constraints would otherwise short-circuit the next pass.
        root_->invalidate_subtree();
    }
}

} // namespace panelkit::layout
