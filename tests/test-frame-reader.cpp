#include "frame-reader.hpp"
#include "log.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

using toolwire::Correlator;
using toolwire::FrameReader;

struct log_capture {
    std::vector<std::string> debug_lines;
};

static void capture_log(enum toolwire_log_level level, const char * text, void * user_data) {
    auto * capture = static_cast<log_capture *>(user_data);
    if (level == TOOLWIRE_LOG_LEVEL_DEBUG) {
        capture->debug_lines.push_back(text);
    }
}

static void test_routes_response_to_waiter() {
    Correlator correlator;
    FrameReader reader(nullptr, &correlator, 8);

    auto waiter = correlator.register_request(1);
    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"ok\":true}}"));

    json response = correlator.await(waiter, std::chrono::milliseconds(100));
    assert(response.at("result").at("ok") == true);
    assert(reader.backlog_size() == 0);
}

static void test_malformed_line_between_responses() {
    log_capture capture;
    toolwire_log_set(capture_log, &capture);

    Correlator correlator;
    FrameReader reader(nullptr, &correlator, 8);

    auto w1 = correlator.register_request(1);
    auto w2 = correlator.register_request(2);

    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":\"first\"}"));
    assert(!reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":"));
    assert(!reader.dispatch("[1, 2, 3]"));
    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":\"second\"}"));

    assert(correlator.await(w1, std::chrono::milliseconds(100)).at("result") == "first");
    assert(correlator.await(w2, std::chrono::milliseconds(100)).at("result") == "second");
    assert(reader.backlog_size() == 0);

    bool logged = false;
    for (const auto & line : capture.debug_lines) {
        if (line.find("malformed") != std::string::npos) {
            logged = true;
        }
    }
    assert(logged);

    toolwire_log_set(nullptr, nullptr);
}

static void test_unmatched_messages_go_to_backlog() {
    Correlator correlator;
    FrameReader reader(nullptr, &correlator, 8);

    // server notification, no id
    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/tools/list_changed\"}"));
    // late response for an id nobody waits for
    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":42,\"result\":{}}"));
    // null id
    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":null,\"error\":{\"code\":-32700}}"));

    assert(reader.backlog_size() == 3);

    std::vector<json> backlog = reader.backlog();
    assert(backlog[0].at("method") == "notifications/tools/list_changed");
    assert(backlog[1].at("id") == 42);
}

static void test_backlog_is_bounded() {
    Correlator correlator;
    FrameReader reader(nullptr, &correlator, 2);

    for (int i = 100; i < 105; ++i) {
        assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(i) + ",\"result\":{}}"));
    }

    std::vector<json> backlog = reader.backlog();
    assert(backlog.size() == 2);
    assert(backlog[0].at("id") == 103);
    assert(backlog[1].at("id") == 104);
}

static void test_server_request_is_not_a_response() {
    Correlator correlator;
    FrameReader reader(nullptr, &correlator, 8);

    auto waiter = correlator.register_request(7);

    // the server asks us something and happens to reuse our id
    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"roots/list\"}"));
    assert(correlator.is_pending(7));
    assert(reader.backlog_size() == 1);
    assert(reader.backlog()[0].at("method") == "roots/list");

    assert(reader.dispatch("{\"jsonrpc\":\"2.0\",\"id\":7,\"result\":\"answer\"}"));
    assert(correlator.await(waiter, std::chrono::milliseconds(100)).at("result") == "answer");
}

int main() {
    test_routes_response_to_waiter();
    test_malformed_line_between_responses();
    test_unmatched_messages_go_to_backlog();
    test_backlog_is_bounded();
    test_server_request_is_not_a_response();

    printf("test-frame-reader: OK\n");
    return 0;
}
