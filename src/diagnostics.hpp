#pragma once
#include <deque>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>

// ---------------------------------------------------------------------------
// Diagnostics: report channel for the headless controller core.
//
// Stored as a World resource. The host binds `sink` (main.cpp routes it to
// TraceLog); with no sink bound, messages are only kept in the recent-lines
// buffer the debug overlay shows.
//
// warn_once() reports a keyed condition a single time until clear(key) is
// called, so a defect that persists across frames does not flood the log
// and one that was fixed and reappears is reported again.
// ---------------------------------------------------------------------------

struct Diagnostics {
    enum class Level { Info, Warning, Error };

    using Sink = std::function<void(Level, const std::string&)>;

    Sink        sink;
    std::size_t history_limit = 8;

    void emit(Level level, const std::string& message) {
        recent_.push_back(message);
        while (recent_.size() > history_limit) recent_.pop_front();
        if (sink) sink(level, message);
    }

    void warn_once(const std::string& key, const std::string& message) {
        if (!reported_.insert(key).second) return;
        emit(Level::Warning, message);
    }

    void clear(const std::string& key) { reported_.erase(key); }

    bool reported(const std::string& key) const { return reported_.count(key) != 0; }

    const std::deque<std::string>& recent() const { return recent_; }

private:
    std::unordered_set<std::string> reported_;
    std::deque<std::string>         recent_;
};
