// Line-oriented JSON-RPC tool server used by the end-to-end tests.

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <signal.h>
#include <string>
#include <thread>

using json = nlohmann::ordered_json;

namespace {

struct stub_params {
    bool reject_init = false;
    bool silent_init = false;
    bool ignore_term = false;
    int  linger_ms   = 0;
};

void stub_print_usage(int /*argc*/, char ** argv) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h, --help      show this help message and exit\n");
    fprintf(stderr, "  --reject-init   answer initialize with an error\n");
    fprintf(stderr, "  --silent-init   never answer initialize\n");
    fprintf(stderr, "  --ignore-term   ignore SIGTERM\n");
    fprintf(stderr, "  --linger-ms N   keep running N ms after stdin is closed\n");
    fprintf(stderr, "\n");
}

bool stub_params_parse(int argc, char ** argv, stub_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            stub_print_usage(argc, argv);
            exit(0);
        }
        else if (arg == "--reject-init") { params.reject_init = true; }
        else if (arg == "--silent-init") { params.silent_init = true; }
        else if (arg == "--ignore-term") { params.ignore_term = true; }
        else if (arg == "--linger-ms")   { params.linger_ms   = std::stoi(argv[++i]); }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    return true;
}

class StubServer {
private:
    stub_params params;
    std::mutex  stdout_mutex;

public:
    explicit StubServer(const stub_params & params) : params(params) {}

    void send_line(const std::string & line) {
        std::lock_guard<std::mutex> lock(stdout_mutex);
        printf("%s\n", line.c_str());
        fflush(stdout);
    }

    void send_response(const json & response) {
        send_line(response.dump());
    }

    void send_result(const json & id, const json & result) {
        json response = {
            {"jsonrpc", "2.0"},
            {"result", result}
        };

        if (!id.is_null()) {
            response["id"] = id;
        }

        send_response(response);
    }

    void send_error(const json & id, int code, const std::string & message) {
        json response = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
        send_response(response);
    }

    static json text_content(const std::string & text) {
        return {
            {"content", json::array({
                {
                    {"type", "text"},
                    {"text", text}
                }
            })}
        };
    }

    void handle_initialize(const json & id) {
        if (params.silent_init) {
            fprintf(stderr, "Ignoring initialize\n");
            return;
        }
        if (params.reject_init) {
            send_error(id, -32603, "Initialization refused");
            return;
        }

        json result = {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", {
                {"tools", json::object()}
            }},
            {"serverInfo", {
                {"name", "toolwire-stub-server"},
                {"version", "1.0.0"}
            }}
        };

        send_result(id, result);
    }

    void handle_list_tools(const json & id) {
        json tools = json::array();
        for (const char * name : { "ping", "echo", "whoami", "text", "raw", "fail", "sleep", "garbage", "crash", "hybrid_search" }) {
            tools.push_back({
                {"name", name},
                {"inputSchema", {
                    {"type", "object"},
                    {"properties", json::object()}
                }}
            });
        }
        send_result(id, {{"tools", tools}});
    }

    json search_payload(const json & arguments) {
        const std::string query = arguments.contains("knn_query_texts") && arguments["knn_query_texts"].is_array()
            && !arguments["knn_query_texts"].empty() ? arguments["knn_query_texts"][0].get<std::string>() : "";

        return {
            {"success", true},
            {"data", {
                {"ids", json::array({ json::array({"p1", "p2"}) })},
                {"documents", json::array({ json::array({"first project for " + query, "second project"}) })},
                {"metadatas", json::array({ json::array({
                    {{"name", "Project One"}, {"stars", 10}},
                    {{"name", "Project Two"}, {"stars", 20}}
                }) })}
            }}
        };
    }

    void handle_tool_call(const json & id, const json & params) {
        if (!params.contains("name")) {
            send_error(id, -32602, "Missing tool name");
            return;
        }

        std::string tool_name = params["name"];
        json arguments = params.value("arguments", json::object());

        if (tool_name == "ping") {
            send_result(id, text_content("{\"ok\":true}"));
        } else if (tool_name == "echo") {
            send_result(id, text_content(arguments.dump()));
        } else if (tool_name == "whoami") {
            send_result(id, text_content(json{{"id", id}}.dump()));
        } else if (tool_name == "text") {
            send_result(id, text_content("plain words, not json"));
        } else if (tool_name == "raw") {
            send_result(id, {{"value", 42}, {"content", json::array({ {{"type", "image"}, {"data", "AAAA"}} })}});
        } else if (tool_name == "fail") {
            send_error(id, -32000, "Tool failed on purpose");
        } else if (tool_name == "sleep") {
            const int ms = arguments.value("ms", 100);
            std::thread([this, id, ms]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                send_result(id, text_content(json{{"slept", ms}}.dump()));
            }).detach();
        } else if (tool_name == "garbage") {
            send_line("{\"jsonrpc\": \"2.0\", \"id\": ");
            send_line("this is not json");
            send_result(id, text_content("{\"after_garbage\":true}"));
        } else if (tool_name == "crash") {
            fprintf(stderr, "Crashing on request\n");
            fflush(stderr);
            _Exit(3);
        } else if (tool_name == "hybrid_search" || tool_name == "query_collection") {
            send_result(id, text_content(search_payload(arguments).dump()));
        } else {
            send_error(id, -32601, "Unknown tool: " + tool_name);
        }
    }

    void run() {
        fprintf(stderr, "Stub server starting...\n");

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;

            fprintf(stderr, "Received: %s\n", line.c_str());

            try {
                json request = json::parse(line);

                if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
                    continue;
                }

                json id = nullptr;
                if (request.contains("id")) {
                    id = request["id"];
                }
                std::string method = request.value("method", "");

                if (method == "initialize") {
                    handle_initialize(id);
                } else if (method == "tools/list") {
                    handle_list_tools(id);
                } else if (method == "tools/call") {
                    handle_tool_call(id, request.value("params", json::object()));
                } else if (method == "notifications/initialized") {
                    fprintf(stderr, "Client initialization completed\n");
                } else if (!id.is_null()) {
                    send_error(id, -32601, "Method not found: " + method);
                }

            } catch (const json::parse_error & e) {
                fprintf(stderr, "JSON parse error: %s\n", e.what());
            } catch (const std::exception & e) {
                fprintf(stderr, "Error processing request: %s\n", e.what());
            }
        }
    }
};

}  // namespace

int main(int argc, char ** argv) {
    stub_params params;

    if (!stub_params_parse(argc, argv, params)) {
        stub_print_usage(argc, argv);
        return 1;
    }

    if (params.ignore_term) {
        signal(SIGTERM, SIG_IGN);
    }

    StubServer server(params);
    server.run();

    // let delayed responses finish before exiting
    std::this_thread::sleep_for(std::chrono::milliseconds(50 + params.linger_ms));

    return 0;
}
