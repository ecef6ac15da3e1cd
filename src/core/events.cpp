#include "tomo_preview/core/events.hpp"
#include "tomo_preview/core/utils.hpp"

namespace tomo_preview::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out,
                           std::ostream& console, std::ostream& console_err)
    : run_id_(std::move(run_id)), out_(out), console_(console),
      console_err_(console_err) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::phase_start(const std::string& volume, Phase phase) {
    json event = base_event("phase_start");
    event["volume"] = volume;
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event);
}

void EventEmitter::phase_progress(const std::string& volume, Phase phase,
                                  size_t current, size_t total) {
    json event = base_event("phase_progress");
    event["volume"] = volume;
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    emit(event);
}

void EventEmitter::phase_end(const std::string& volume, Phase phase,
                             const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["volume"] = volume;
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::volume_done(const std::string& volume, const json& result) {
    json event = base_event("volume_done");
    event["volume"] = volume;
    for (auto& [key, value] : result.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& volume, const std::string& message) {
    json event = base_event("warning");
    event["volume"] = volume;
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& volume, const std::string& message) {
    json event = base_event("error");
    event["volume"] = volume;
    event["message"] = message;
    emit(event);
}

void EventEmitter::log(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ << line << "\n";
    console_.flush();
}

void EventEmitter::log_error(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_err_ << line << "\n";
    console_err_.flush();
}

} // namespace tomo_preview::core
