#pragma once
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel: provider registry for the F3 overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) when
// they install; DebugSystem evaluates every provider each render frame.
// lines() flattens the panel into "Section" / "  label: value" rows, which
// is what the overlay draws and what the tests compare against.
//
// No engine headers: safe to include in the headless core.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    void watch(const std::string& section, const std::string& label, Provider fn) {
        if (auto* s = find(section)) {
            s->rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    Section* find(const std::string& section) {
        for (auto& s : sections_)
            if (s.title == section) return &s;
        return nullptr;
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        for (const auto& s : sections_) {
            out.push_back(s.title);
            for (const auto& row : s.rows)
                out.push_back("  " + row.label + ": " + (row.fn ? row.fn() : std::string("-")));
        }
        return out;
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    std::vector<Section> sections_;
};
