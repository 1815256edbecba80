#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace taskstream {

/**
 * Identifiers carried across a stream; merged from every decoded data frame
 */
struct StreamIds {
    std::string task_id;
    std::string conversation_id;
    std::string message_id;

    bool operator==(const StreamIds& other) const {
        return task_id == other.task_id &&
               conversation_id == other.conversation_id &&
               message_id == other.message_id;
    }
};

/**
 * Successfully decoded payload frame
 */
struct DataEvent {
    nlohmann::json payload;

    bool operator==(const DataEvent& other) const { return payload == other.payload; }
};

/**
 * Frame carrying both "code" and "message": ends the session as failed
 */
struct ApplicationErrorEvent {
    int code = 0;
    std::string message;
    nlohmann::json payload;

    bool operator==(const ApplicationErrorEvent& other) const {
        return code == other.code && message == other.message;
    }
};

/**
 * Malformed frame: reported to diagnostics, never terminal
 */
struct DecodeError {
    std::string raw;    ///< Frame content after the "data: " prefix, trimmed
    std::string cause;  ///< Parser message

    bool operator==(const DecodeError& other) const { return raw == other.raw; }
};

/**
 * The "[DONE]" sentinel
 */
struct DoneEvent {
    bool operator==(const DoneEvent&) const { return true; }
};

using Event = std::variant<DataEvent, ApplicationErrorEvent, DecodeError, DoneEvent>;

/**
 * True for the events that end a session (DoneEvent, ApplicationErrorEvent)
 */
bool is_terminal(const Event& event);

/**
 * Turns an arbitrarily chunked text stream of "data: <payload>\n" lines into
 * events.
 *
 * Feeding the same bytes in any partition of chunks yields the same ordered
 * event sequence. Between calls the internal buffer only ever holds the
 * trailing partial line. Once a terminal event is produced the decoder
 * ignores all further input until reset().
 */
class FrameDecoder {
public:
    static constexpr const char* DATA_PREFIX = "data: ";
    static constexpr const char* SENTINEL = "[DONE]";

    /**
     * Append a chunk and decode every line it completes
     */
    std::vector<Event> feed(const std::string& chunk);

    /**
     * End of transport data: decode a final unterminated data line, if any
     */
    std::vector<Event> finish();

    /**
     * Discard buffered bytes and identifiers (a retried stream decodes from byte zero)
     */
    void reset();

    bool terminated() const { return terminated_; }

    /**
     * Identifiers merged from data frames so far: a frame that lacks a field
     * keeps the previously seen value
     */
    const StreamIds& last_seen_ids() const { return ids_; }

    const std::string& buffer() const { return buffer_; }

private:
    std::string buffer_;
    StreamIds ids_;
    bool terminated_ = false;

    void process_line(const std::string& line, std::vector<Event>& out);
    Event decode_payload(const std::string& content);
    void merge_ids(const nlohmann::json& payload);
};

} // namespace taskstream
