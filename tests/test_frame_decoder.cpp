/**
 * @file test_frame_decoder.cpp
 * @brief Unit tests for FrameDecoder
 */

#include <catch2/catch_test_macros.hpp>
#include "stream/frame_decoder.hpp"
#include <random>

using namespace taskstream;

namespace {

std::vector<Event> decode_all(const std::vector<std::string>& chunks) {
    FrameDecoder decoder;
    std::vector<Event> events;
    for (const auto& chunk : chunks) {
        auto batch = decoder.feed(chunk);
        events.insert(events.end(), batch.begin(), batch.end());
    }
    auto tail = decoder.finish();
    events.insert(events.end(), tail.begin(), tail.end());
    return events;
}

bool same_events(const std::vector<Event>& a, const std::vector<Event>& b) {
    return a == b;
}

const std::string TRANSCRIPT =
    "data: {\"task_id\":\"t-1\",\"content\":\"Hel\"}\n"
    ": keep-alive\n"
    "data: {\"conversation_id\":\"c-9\",\"content\":\"lo w\\u00f6rld\"}\n"
    "\n"
    "data: {broken\n"
    "event: ignored\n"
    "data: {\"message_id\":\"m-3\",\"content\":\"\xc3\xa9t\xc3\xa9\"}\n"
    "data: [DONE]\n";

} // namespace

TEST_CASE("FrameDecoder decodes data lines", "[frame_decoder]") {
    FrameDecoder decoder;

    SECTION("Single complete frame") {
        auto events = decoder.feed("data: {\"content\":\"hi\"}\n");
        REQUIRE(events.size() == 1);
        const auto* data = std::get_if<DataEvent>(&events[0]);
        REQUIRE(data != nullptr);
        REQUIRE(data->payload["content"] == "hi");
        REQUIRE(decoder.buffer().empty());
    }

    SECTION("Partial line is held until its newline arrives") {
        REQUIRE(decoder.feed("data: {\"cont").empty());
        REQUIRE(decoder.buffer() == "data: {\"cont");
        auto events = decoder.feed("ent\":1}\n");
        REQUIRE(events.size() == 1);
        REQUIRE(std::get<DataEvent>(events[0]).payload["content"] == 1);
    }

    SECTION("Lines without the data prefix are ignored") {
        auto events = decoder.feed(": comment\nevent: update\nid: 4\n\ndata:{\"nospace\":1}\n");
        REQUIRE(events.empty());
    }

    SECTION("CRLF line endings") {
        auto events = decoder.feed("data: {\"a\":1}\r\ndata: [DONE]\r\n");
        REQUIRE(events.size() == 2);
        REQUIRE(std::holds_alternative<DataEvent>(events[0]));
        REQUIRE(std::holds_alternative<DoneEvent>(events[1]));
    }

    SECTION("Buffer never holds a complete line between calls") {
        decoder.feed("data: {\"a\":1}\ndata: {\"b\"");
        REQUIRE(decoder.buffer().find('\n') == std::string::npos);
        decoder.feed(":2}\ndata: ");
        REQUIRE(decoder.buffer() == "data: ");
    }

    SECTION("Non-object JSON payload is still a data event") {
        auto events = decoder.feed("data: [1,2,3]\ndata: \"text\"\n");
        REQUIRE(events.size() == 2);
        REQUIRE(std::get<DataEvent>(events[0]).payload.is_array());
        REQUIRE(std::get<DataEvent>(events[1]).payload == "text");
    }
}

TEST_CASE("FrameDecoder output is independent of chunking", "[frame_decoder]") {
    auto whole = decode_all({TRANSCRIPT});
    REQUIRE(whole.size() == 5);

    SECTION("Every two-way split") {
        for (size_t cut = 0; cut <= TRANSCRIPT.size(); ++cut) {
            auto split = decode_all({TRANSCRIPT.substr(0, cut), TRANSCRIPT.substr(cut)});
            INFO("cut at byte " << cut);
            REQUIRE(same_events(split, whole));
        }
    }

    SECTION("One byte at a time") {
        std::vector<std::string> bytes;
        for (char c : TRANSCRIPT) {
            bytes.emplace_back(1, c);
        }
        REQUIRE(same_events(decode_all(bytes), whole));
    }

    SECTION("Random partitions") {
        std::mt19937 rng(20240611);
        for (int round = 0; round < 200; ++round) {
            std::vector<std::string> chunks;
            size_t pos = 0;
            while (pos < TRANSCRIPT.size()) {
                size_t len = std::uniform_int_distribution<size_t>(1, 17)(rng);
                chunks.push_back(TRANSCRIPT.substr(pos, len));
                pos += len;
            }
            INFO("round " << round);
            REQUIRE(same_events(decode_all(chunks), whole));
        }
    }
}

TEST_CASE("FrameDecoder stops at the completion sentinel", "[frame_decoder]") {
    FrameDecoder decoder;

    auto events = decoder.feed("data: {\"a\":1}\ndata: [DONE]\ndata: {\"b\":2}\n");
    REQUIRE(events.size() == 2);
    REQUIRE(std::holds_alternative<DataEvent>(events[0]));
    REQUIRE(std::holds_alternative<DoneEvent>(events[1]));
    REQUIRE(decoder.terminated());
    REQUIRE(decoder.buffer().empty());

    SECTION("Later input is ignored") {
        REQUIRE(decoder.feed("data: {\"c\":3}\n").empty());
        REQUIRE(decoder.finish().empty());
    }

    SECTION("Reset starts over") {
        decoder.reset();
        REQUIRE_FALSE(decoder.terminated());
        REQUIRE(decoder.feed("data: {\"c\":3}\n").size() == 1);
    }

    SECTION("Sentinel with surrounding whitespace") {
        FrameDecoder other;
        auto done = other.feed("data:  [DONE]  \n");
        REQUIRE(done.size() == 1);
        REQUIRE(std::holds_alternative<DoneEvent>(done[0]));
    }
}

TEST_CASE("FrameDecoder survives malformed frames", "[frame_decoder]") {
    FrameDecoder decoder;

    auto events = decoder.feed("data: {bad json}\ndata: {\"ok\":true}\n");
    REQUIRE(events.size() == 2);

    const auto* error = std::get_if<DecodeError>(&events[0]);
    REQUIRE(error != nullptr);
    REQUIRE(error->raw == "{bad json}");
    REQUIRE_FALSE(error->cause.empty());
    REQUIRE_FALSE(is_terminal(events[0]));

    REQUIRE(std::get<DataEvent>(events[1]).payload["ok"] == true);
    REQUIRE_FALSE(decoder.terminated());
}

TEST_CASE("FrameDecoder recognises application errors", "[frame_decoder]") {
    FrameDecoder decoder;

    SECTION("Frame with code and message is terminal") {
        auto events = decoder.feed(
            "data: {\"code\":5001,\"message\":\"quota exceeded\"}\ndata: {\"late\":1}\n");
        REQUIRE(events.size() == 1);
        const auto* app = std::get_if<ApplicationErrorEvent>(&events[0]);
        REQUIRE(app != nullptr);
        REQUIRE(app->code == 5001);
        REQUIRE(app->message == "quota exceeded");
        REQUIRE(app->payload["code"] == 5001);
        REQUIRE(is_terminal(events[0]));
        REQUIRE(decoder.terminated());
    }

    SECTION("Only one of the two fields is ordinary data") {
        auto events = decoder.feed("data: {\"code\":200}\ndata: {\"message\":\"hello\"}\n");
        REQUIRE(events.size() == 2);
        REQUIRE(std::holds_alternative<DataEvent>(events[0]));
        REQUIRE(std::holds_alternative<DataEvent>(events[1]));
    }

    SECTION("Null fields do not count") {
        auto events = decoder.feed("data: {\"code\":null,\"message\":\"x\"}\n");
        REQUIRE(std::holds_alternative<DataEvent>(events[0]));
    }

    SECTION("Non-numeric code") {
        auto events = decoder.feed("data: {\"code\":\"E42\",\"message\":\"bad\"}\n");
        const auto* app = std::get_if<ApplicationErrorEvent>(&events[0]);
        REQUIRE(app != nullptr);
        REQUIRE(app->code == 0);
        REQUIRE(app->message == "bad");
    }

    SECTION("Codes outside the int range") {
        auto events = decoder.feed("data: {\"code\":1e20,\"message\":\"float\"}\n");
        const auto* app = std::get_if<ApplicationErrorEvent>(&events[0]);
        REQUIRE(app != nullptr);
        REQUIRE(app->code == 0);
        REQUIRE(app->payload["code"] == 1e20);

        FrameDecoder wide;
        events = wide.feed("data: {\"code\":4294967296,\"message\":\"wide\"}\n");
        app = std::get_if<ApplicationErrorEvent>(&events[0]);
        REQUIRE(app != nullptr);
        REQUIRE(app->code == 0);
        REQUIRE(app->payload["code"] == 4294967296LL);

        FrameDecoder negative;
        events = negative.feed("data: {\"code\":-7,\"message\":\"neg\"}\n");
        REQUIRE(std::get<ApplicationErrorEvent>(events[0]).code == -7);
    }
}

TEST_CASE("FrameDecoder keeps last known identifiers", "[frame_decoder]") {
    FrameDecoder decoder;

    decoder.feed("data: {\"task_id\":\"t1\"}\n");
    decoder.feed("data: {\"conversation_id\":\"c1\"}\n");
    decoder.feed("data: {\"task_id\":\"\",\"message_id\":null}\n");

    REQUIRE(decoder.last_seen_ids().task_id == "t1");
    REQUIRE(decoder.last_seen_ids().conversation_id == "c1");
    REQUIRE(decoder.last_seen_ids().message_id.empty());

    decoder.feed("data: {\"task_id\":\"t2\",\"message_id\":\"m7\"}\n");
    REQUIRE(decoder.last_seen_ids() == StreamIds{"t2", "c1", "m7"});

    decoder.reset();
    REQUIRE(decoder.last_seen_ids() == StreamIds{});
}

TEST_CASE("FrameDecoder finish handles an unterminated final line", "[frame_decoder]") {
    FrameDecoder decoder;

    SECTION("Data line") {
        decoder.feed("data: {\"a\":1}\ndata: {\"tail\":true}");
        auto events = decoder.finish();
        REQUIRE(events.size() == 1);
        REQUIRE(std::get<DataEvent>(events[0]).payload["tail"] == true);
        REQUIRE(decoder.buffer().empty());
    }

    SECTION("Sentinel") {
        decoder.feed("data: [DONE]");
        auto events = decoder.finish();
        REQUIRE(events.size() == 1);
        REQUIRE(std::holds_alternative<DoneEvent>(events[0]));
    }

    SECTION("Non-data remainder is dropped") {
        decoder.feed("event: partial");
        REQUIRE(decoder.finish().empty());
        REQUIRE(decoder.buffer().empty());
    }
}
