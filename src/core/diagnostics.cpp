#include <panelkit/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace panelkit::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    if (!event.subject.empty()) {
        oss << " <" << event.subject << ">";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity) : capacity_(capacity) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module, const std::string& stage,
                             const std::string& message, const std::string& subject) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.subject = subject;
    event.message = message;
    event.correlation_id = correlation_id_;

    ++counts_[static_cast<std::size_t>(severity)];

    // Observers run before eviction so a zero capacity still notifies them.
    // A snapshot lets a callback add or remove observers; changes apply from
    // the next event.
    const std::vector<ObserverEntry> observers = observers_;
    for (const auto& entry : observers) {
        entry.callback(event);
    }

    events_.push_back(std::move(event));
    evict_overflow();
}

void DiagnosticEmitter::set_capacity(std::size_t capacity) {
    capacity_ = capacity;
    evict_overflow();
}

void DiagnosticEmitter::evict_overflow() {
    if (events_.size() <= capacity_) {
        return;
    }
    events_.erase(events_.begin(), events_.end() - static_cast<std::ptrdiff_t>(capacity_));
}

ObserverId DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    ObserverId id = next_observer_id_++;
    observers_.push_back({id, std::move(observer)});
    return id;
}

bool DiagnosticEmitter::remove_observer(ObserverId id) {
    auto it = std::find_if(observers_.begin(), observers_.end(),
        [id](const ObserverEntry& entry) { return entry.id == id; });
    if (it == observers_.end()) {
        return false;
    }
    observers_.erase(it);
    return true;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
        [severity](const DiagnosticEvent& e) { return e.severity == severity; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
        [&module](const DiagnosticEvent& e) { return e.module == module; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& module,
                                                                const std::string& stage) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
        [&](const DiagnosticEvent& e) { return e.module == module && e.stage == stage; });
    return result;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return counts_[static_cast<std::size_t>(severity)];
}

void DiagnosticEmitter::clear() {
    events_.clear();
    std::fill(std::begin(counts_), std::end(counts_), 0);
}

}  // namespace panelkit::core
