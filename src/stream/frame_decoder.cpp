#include "stream/frame_decoder.hpp"
#include <cstdint>
#include <cstring>
#include <limits>

using json = nlohmann::json;

namespace taskstream {

namespace {

std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool has_data_prefix(const std::string& line) {
    return line.compare(0, std::strlen(FrameDecoder::DATA_PREFIX), FrameDecoder::DATA_PREFIX) == 0;
}

// Codes that are not integers or do not fit in int are reported as 0; the
// original value stays in the payload
int error_code(const json& value) {
    if (value.is_number_unsigned()) {
        auto code = value.get<std::uint64_t>();
        return code <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            ? static_cast<int>(code) : 0;
    }
    if (value.is_number_integer()) {
        auto code = value.get<std::int64_t>();
        return code >= std::numeric_limits<int>::min() && code <= std::numeric_limits<int>::max()
            ? static_cast<int>(code) : 0;
    }
    return 0;
}

void merge_field(const json& payload, const char* key, std::string& target) {
    auto it = payload.find(key);
    if (it != payload.end() && it->is_string()) {
        const auto& value = it->get_ref<const std::string&>();
        if (!value.empty()) {
            target = value;
        }
    }
}

} // namespace

bool is_terminal(const Event& event) {
    return std::holds_alternative<DoneEvent>(event) ||
           std::holds_alternative<ApplicationErrorEvent>(event);
}

std::vector<Event> FrameDecoder::feed(const std::string& chunk) {
    std::vector<Event> events;
    if (terminated_) {
        return events;
    }

    buffer_ += chunk;

    size_t start = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        process_line(buffer_.substr(start, newline - start), events);
        start = newline + 1;

        if (terminated_) {
            // The terminal frame is authoritative: drop whatever follows
            buffer_.clear();
            return events;
        }
    }

    buffer_.erase(0, start);
    return events;
}

std::vector<Event> FrameDecoder::finish() {
    std::vector<Event> events;
    if (terminated_) {
        return events;
    }

    std::string rest;
    rest.swap(buffer_);
    if (has_data_prefix(rest)) {
        process_line(rest, events);
    }
    return events;
}

void FrameDecoder::reset() {
    buffer_.clear();
    ids_ = StreamIds();
    terminated_ = false;
}

void FrameDecoder::process_line(const std::string& line, std::vector<Event>& out) {
    if (!has_data_prefix(line)) {
        return;
    }

    std::string content = trim(line.substr(std::strlen(DATA_PREFIX)));
    if (content == SENTINEL) {
        out.emplace_back(DoneEvent{});
        terminated_ = true;
        return;
    }

    Event event = decode_payload(content);
    if (is_terminal(event)) {
        terminated_ = true;
    }
    out.push_back(std::move(event));
}

Event FrameDecoder::decode_payload(const std::string& content) {
    json payload;
    try {
        payload = json::parse(content);
    } catch (const json::exception& e) {
        return DecodeError{content, e.what()};
    }

    if (!payload.is_object()) {
        return DataEvent{std::move(payload)};
    }

    merge_ids(payload);

    auto code = payload.find("code");
    auto message = payload.find("message");
    if (code != payload.end() && !code->is_null() &&
        message != payload.end() && !message->is_null()) {
        ApplicationErrorEvent error;
        error.code = error_code(*code);
        error.message = message->is_string() ? message->get<std::string>() : message->dump();
        error.payload = std::move(payload);
        return error;
    }

    return DataEvent{std::move(payload)};
}

void FrameDecoder::merge_ids(const json& payload) {
    merge_field(payload, "task_id", ids_.task_id);
    merge_field(payload, "conversation_id", ids_.conversation_id);
    merge_field(payload, "message_id", ids_.message_id);
}

} // namespace taskstream
