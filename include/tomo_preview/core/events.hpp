#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace tomo_preview::core {

using json = nlohmann::json;

// JSON-lines run events. Every event carries type, run_id and ts; per-volume
// events also carry the volume name. Safe to share between volume workers.
// Human-readable lines go through log()/log_error() so they are serialized
// with the events when `out` and `console` share a terminal.
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out,
                 std::ostream& console = std::cout,
                 std::ostream& console_err = std::cerr);

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());

    void phase_start(const std::string& volume, Phase phase);
    void phase_progress(const std::string& volume, Phase phase, size_t current, size_t total);
    void phase_end(const std::string& volume, Phase phase, const std::string& status,
                   const json& extra = json::object());

    void volume_done(const std::string& volume, const json& result);

    void warning(const std::string& volume, const std::string& message);
    void error(const std::string& volume, const std::string& message);

    void log(const std::string& line);
    void log_error(const std::string& line);

private:
    json base_event(const std::string& type) const;
    void emit(const json& event);

    std::string run_id_;
    std::ostream& out_;
    std::ostream& console_;
    std::ostream& console_err_;
    std::mutex mutex_;
};

} // namespace tomo_preview::core
