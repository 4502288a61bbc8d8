#include <chroma/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace chroma::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string text = "[";
    text += severity_name(event.severity);
    text += "]";
    if (!event.module.empty()) {
        text += " " + event.module;
        if (!event.stage.empty()) {
            text += "/" + event.stage;
        }
    }
    if (!event.subject.empty()) {
        text += " '" + event.subject + "'";
    }
    text += ": " + event.message;
    return text;
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module, const std::string& stage,
                             const std::string& subject, const std::string& message) {
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
    events_.push_back(std::move(event));

    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), pred);
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    return select([&stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_subject(const std::string& subject) const {
    return select([&subject](const DiagnosticEvent& e) { return e.subject == subject; });
}

std::optional<Severity> DiagnosticEmitter::highest_severity() const {
    auto worst = std::max_element(events_.begin(), events_.end(),
        [](const DiagnosticEvent& a, const DiagnosticEvent& b) { return a.severity < b.severity; });
    if (worst == events_.end()) {
        return std::nullopt;
    }
    return worst->severity;
}

bool DiagnosticEmitter::has_errors() const {
    return highest_severity() == Severity::Error;
}

} // namespace chroma::core
