#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace panelkit::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// One record of something a layout pass noticed. `subject` names the
// element involved, when there is one.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string subject;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

// "[warning] grid/placement (cid:3) <sidebar>: message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;
using ObserverId = std::uint32_t;

// Collects layout diagnostics. Events below min_severity() are dropped
// before observers see them; only the newest capacity() events are kept.
class DiagnosticEmitter {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit DiagnosticEmitter(std::size_t capacity = kDefaultCapacity);

    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& message, const std::string& subject = {});

    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warning(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }

    // Stamped onto every subsequent event; LayoutRoot uses the pass number.
    void set_correlation_id(std::uint64_t id) { correlation_id_ = id; }
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    // Shrinking below the current size drops the oldest events.
    void set_capacity(std::size_t capacity);
    std::size_t capacity() const { return capacity_; }

    // Safe to call from inside an observer; the change applies from the
    // next emitted event.
    ObserverId add_observer(DiagnosticObserver observer);
    bool remove_observer(ObserverId id);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& module, const std::string& stage) const;

    // Counts every accepted event, including ones since evicted.
    std::size_t count(Severity severity) const;
    bool has_warnings() const { return count(Severity::Warning) + count(Severity::Error) > 0; }

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    struct ObserverEntry {
        ObserverId id;
        DiagnosticObserver callback;
    };

    void evict_overflow();

    std::vector<DiagnosticEvent> events_;
    std::vector<ObserverEntry> observers_;
    std::size_t capacity_;
    std::size_t counts_[3] = {0, 0, 0};
    ObserverId next_observer_id_ = 1;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace panelkit::core
