#pragma once
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace Bewley {

enum class Stage { Income, Household, Distribution, Market, Transition };

inline const char* stage_name(Stage s) {
    switch (s) {
        case Stage::Income:       return "Income";
        case Stage::Household:    return "VFI";
        case Stage::Distribution: return "Dist";
        case Stage::Market:       return "Market";
        case Stage::Transition:   return "Transition";
    }
    return "?";
}

struct ProgressEvent {
    Stage stage;
    int iteration = 0;
    double residual = 0.0;
    double price = 0.0;       // candidate r, when the stage has one
    std::string message;      // empty for plain iteration ticks
};

// Receives solver progress. Solvers never print on their own.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(const ProgressEvent& ev) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void on_progress(const ProgressEvent&) override {}
};

// Writes "[Bewley::VFI] Iter 12 | Resid: 1.0e-05 | r: 0.0100" lines.
class ConsoleProgressSink : public ProgressSink {
public:
    explicit ConsoleProgressSink(std::ostream& out = std::cout, bool inner = false)
        : out_(out), inner_(inner) {}

    void on_progress(const ProgressEvent& ev) override {
        // Inner sweeps are noisy; only show their summaries unless asked
        bool is_inner = ev.stage == Stage::Household || ev.stage == Stage::Distribution;
        if (is_inner && !inner_ && ev.message.empty()) return;

        out_ << "[Bewley::" << stage_name(ev.stage) << "] ";
        if (!ev.message.empty()) out_ << ev.message << " ";
        out_ << "Iter " << std::setw(4) << ev.iteration
             << " | Resid: " << std::scientific << std::setprecision(3) << ev.residual;
        if (ev.stage == Stage::Market || ev.stage == Stage::Transition) {
            out_ << " | r: " << std::fixed << std::setprecision(6) << ev.price;
        }
        out_ << std::defaultfloat << std::endl;
    }

private:
    std::ostream& out_;
    bool inner_;
};

// Keeps every event; used by tests and by callers that post-process progress.
class RecordingProgressSink : public ProgressSink {
public:
    std::vector<ProgressEvent> events;

    void on_progress(const ProgressEvent& ev) override { events.push_back(ev); }

    int count(Stage s) const {
        int n = 0;
        for (const auto& ev : events) if (ev.stage == s) ++n;
        return n;
    }
};

inline NullProgressSink& null_sink() {
    static NullProgressSink sink;
    return sink;
}

} // namespace Bewley
