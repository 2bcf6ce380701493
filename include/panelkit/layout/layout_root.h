#pragma once
#include <panelkit/core/config.h>
#include <panelkit/core/diagnostics.h>
#include <panelkit/geometry/size.h>
#include <panelkit/layout/element.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace panelkit::layout {

struct LayoutOptions {
    bool use_layout_rounding = false;
    // Device pixels per DIP.
    float dpi_scale = 1.0f;
    core::Severity min_severity = core::Severity::Info;
    // Oldest diagnostics are discarded past this many events.
    std::size_t max_retained_events = core::DiagnosticEmitter::kDefaultCapacity;

    static LayoutOptions for_dpi(std::uint32_t dpi) {
        LayoutOptions options;
        options.use_layout_rounding = true;
        options.dpi_scale = static_cast<float>(dpi) / static_cast<float>(core::config::kDefaultDpi);
        return options;
    }
};

// Owns the top of a visual tree and drives full layout passes over it.
// Elements reach the root's options (rounding) and diagnostics through
// Element::layout_root().
class LayoutRoot {
public:
    explicit LayoutRoot(LayoutOptions options = {});
    ~LayoutRoot();

    LayoutRoot(const LayoutRoot&) = delete;
    LayoutRoot& operator=(const LayoutRoot&) = delete;

    // Throws std::invalid_argument for a null root or one that already has
    // a parent.
    Element& set_root(std::unique_ptr<Element> root);

    template<typename T, typename... Args>
    T& emplace_root(Args&&... args) {
        auto element = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *element;
        set_root(std::move(element));
        return ref;
    }

    std::unique_ptr<Element> release_root();
    Element* root() const { return root_.get(); }

    // Measures the root against `viewport` then arranges it at the origin.
    // An infinite viewport axis is arranged at the root's desired extent.
    void update_layout(const geometry::Size& viewport);

    bool needs_layout() const;
    std::uint64_t pass_count() const { return pass_count_; }

    const LayoutOptions& options() const { return options_; }
    void set_options(const LayoutOptions& options);

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    LayoutOptions options_;
    std::unique_ptr<Element> root_;
    core::DiagnosticEmitter diagnostics_;
    std::uint64_t pass_count_ = 0;
};

} // namespace panelkit::layout
