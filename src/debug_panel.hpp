#pragma once
#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel: provider registry for the debug overlay / parameter inspector.
//
// Stored as a World resource. At startup, modules call
//   watch(section, label, fn)                       read-only value rows
//   tune(section, label, get, set, min, max, step)  adjustable float rows
// DebugSystem draws every section each render frame; the arrow keys move the
// selection across tunables (insertion order) and nudge the selected value.
//
// Zero engine dependencies; safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;
    using Getter   = std::function<float()>;
    using Setter   = std::function<void(float)>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Tunable {
        std::string label;
        Getter      get;
        Setter      set;
        float       min;
        float       max;
        float       step;
    };

    struct Section {
        std::string          title;
        std::vector<Row>     rows;
        std::vector<Tunable> tunables;
    };

    bool visible = false;

    // Register a named provider under a section heading.
    // Creates the section if it does not already exist.
    void watch(const std::string& section, const std::string& label, Provider fn) {
        find_or_add(section).rows.push_back({label, std::move(fn)});
    }

    void tune(const std::string& section, const std::string& label,
              Getter get, Setter set, float min, float max, float step) {
        find_or_add(section).tunables.push_back(
            {label, std::move(get), std::move(set), min, max, step});
    }

    const std::vector<Section>& sections() const { return sections_; }

    std::size_t tunable_count() const {
        std::size_t n = 0;
        for (const auto& s : sections_) n += s.tunables.size();
        return n;
    }

    // Flat index of the selected tunable; only meaningful if tunable_count() > 0
    std::size_t selected_index() const { return selected_; }

    const Tunable* selected() const {
        std::size_t i = selected_;
        for (const auto& s : sections_) {
            if (i < s.tunables.size()) return &s.tunables[i];
            i -= s.tunables.size();
        }
        return nullptr;
    }

    // Move the selection by delta, wrapping at both ends.
    void select_next(int delta) {
        const std::size_t n = tunable_count();
        if (n == 0) return;
        const long wrapped = (static_cast<long>(selected_) + delta) % static_cast<long>(n);
        selected_ = static_cast<std::size_t>(wrapped < 0 ? wrapped + static_cast<long>(n) : wrapped);
    }

    // Change the selected value by steps * step, clamped to [min, max].
    void nudge(int steps) {
        const Tunable* t = selected();
        if (!t) return;
        t->set(std::clamp(t->get() + static_cast<float>(steps) * t->step, t->min, t->max));
    }

private:
    Section& find_or_add(const std::string& title) {
        for (auto& s : sections_) {
            if (s.title == title) return s;
        }
        sections_.push_back({title, {}, {}});
        return sections_.back();
    }

    std::vector<Section> sections_;
    std::size_t          selected_ = 0;
};
