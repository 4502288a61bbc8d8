#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chroma::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// One step of turning color text into a value. `subject` is the text the
// step worked on ("rgb(300, 0, 0)"); `stage` names the syntax recognized
// ("hex", "rgb", "color-mix") or, for errors, the failure kind.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string subject;
    std::string message;
};

const char* severity_name(Severity severity);

// "[warning] css-parser/rgb 'rgb(300, 0, 0)': channel 1.176471 out of range, clamped"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects events from one parse or CLI run. Not shared between threads.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& subject, const std::string& message);

    void info(const std::string& module, const std::string& stage,
              const std::string& subject, const std::string& message) {
        emit(Severity::Info, module, stage, subject, message);
    }
    void warning(const std::string& module, const std::string& stage,
                 const std::string& subject, const std::string& message) {
        emit(Severity::Warning, module, stage, subject, message);
    }
    void error(const std::string& module, const std::string& stage,
               const std::string& subject, const std::string& message) {
        emit(Severity::Error, module, stage, subject, message);
    }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    // Everything recorded while handling one input text.
    std::vector<DiagnosticEvent> events_for_subject(const std::string& subject) const;

    // Worst severity recorded so far, nullopt when nothing was recorded.
    std::optional<Severity> highest_severity() const;
    bool has_errors() const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

} // namespace chroma::core
