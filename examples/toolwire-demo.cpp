#include "cached-client.hpp"
#include "common.hpp"
#include "log.hpp"
#include "normalize.hpp"
#include "stdio-client.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct demo_params {
    std::string server_command = "uvx seekdb-mcp-server";
    std::string collection     = "projects";
    std::string query          = "lightweight RAG for internal docs";
    std::string keyword        = "";

    int32_t top_k      = 5;
    int32_t timeout_ms = 30000;

    bool no_cache = false;
    bool verbose  = false;
};

void demo_print_usage(int /*argc*/, char ** argv, const demo_params & params) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,        --help              [default] show this help message and exit\n");
    fprintf(stderr, "  -s CMD,    --server-command CMD [%-7s] command that starts the tool server\n", params.server_command.c_str());
    fprintf(stderr, "  -c NAME,   --collection NAME   [%-7s] collection to search\n",                 params.collection.c_str());
    fprintf(stderr, "  -q TEXT,   --query TEXT        [%-7s] query text\n",                           params.query.c_str());
    fprintf(stderr, "  -k TEXT,   --keyword TEXT      [%-7s] full-text keyword (defaults to query)\n", params.keyword.c_str());
    fprintf(stderr, "  -n N,      --top-k N           [%-7d] number of results\n",                    params.top_k);
    fprintf(stderr, "  -to N,     --timeout N         [%-7d] request timeout in milliseconds\n",      params.timeout_ms);
    fprintf(stderr, "             --no-cache          [%-7s] disable result caching\n",               params.no_cache ? "true" : "false");
    fprintf(stderr, "  -v,        --verbose           [%-7s] show debug logging\n",                   params.verbose ? "true" : "false");
    fprintf(stderr, "\n");
}

bool demo_params_parse(int argc, char ** argv, demo_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            demo_print_usage(argc, argv, params);
            exit(0);
        }

        const bool has_value = i + 1 < argc;

        if      ((arg == "-s"  || arg == "--server-command") && has_value) { params.server_command = argv[++i]; }
        else if ((arg == "-c"  || arg == "--collection")     && has_value) { params.collection     = argv[++i]; }
        else if ((arg == "-q"  || arg == "--query")          && has_value) { params.query          = argv[++i]; }
        else if ((arg == "-k"  || arg == "--keyword")        && has_value) { params.keyword        = argv[++i]; }
        else if ((arg == "-n"  || arg == "--top-k")          && has_value) { params.top_k          = std::stoi(argv[++i]); }
        else if ((arg == "-to" || arg == "--timeout")        && has_value) { params.timeout_ms     = std::stoi(argv[++i]); }
        else if (                 arg == "--no-cache")                     { params.no_cache       = true; }
        else if (arg == "-v"   || arg == "--verbose")                      { params.verbose        = true; }
        else {
            fprintf(stderr, "error: unknown or incomplete argument: %s\n", arg.c_str());
            return false;
        }
    }

    return true;
}

void cb_log(enum toolwire_log_level level, const char * text, void * user_data) {
    const bool verbose = *static_cast<const bool *>(user_data);
    if (level == TOOLWIRE_LOG_LEVEL_DEBUG && !verbose) {
        return;
    }
    fputs(text, stderr);
    fflush(stderr);
}

void print_separator(const std::string & title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

bool is_success(const json & result) {
    return result.is_object() && result.contains("success") && result["success"] == true;
}

void print_results(const json & rows) {
    if (rows.empty()) {
        std::cout << "No results returned." << std::endl;
        return;
    }

    int idx = 0;
    for (const auto & row : rows) {
        const json & meta = row.at("meta");
        const std::string title = meta.contains("name") && meta["name"].is_string()
            ? meta["name"].get<std::string>() : row.at("id").dump();

        std::cout << ++idx << ". " << title << std::endl;
        std::cout << "   summary: " << (row.at("summary").is_string() ? row.at("summary").get<std::string>() : row.at("summary").dump()) << std::endl;
        if (!meta.empty()) {
            std::cout << "   " << meta.dump() << std::endl;
        }
    }
}

} // namespace

int main(int argc, char ** argv) {
    demo_params params;

    if (!demo_params_parse(argc, argv, params)) {
        demo_print_usage(argc, argv, params);
        return 1;
    }

    toolwire_log_set(cb_log, &params.verbose);

    try {
        const std::vector<std::string> command = toolwire::split_command(params.server_command);

        toolwire::client_params cparams;
        cparams.client_name = "toolwire-demo";
        cparams.timeout_ms  = params.timeout_ms;

        toolwire::StdioClient raw_client(cparams);

        std::unique_ptr<toolwire::CachedClient> cached;
        toolwire::ToolClient * client = &raw_client;
        if (!params.no_cache) {
            cached.reset(new toolwire::CachedClient(&raw_client));
            client = cached.get();
        }

        print_separator("STARTING SERVER");
        std::cout << "Server command: " << params.server_command << std::endl;
        raw_client.start_server(command);

        print_separator("INITIALIZING");
        json init_result = client->initialize();
        std::cout << init_result.dump(2) << std::endl;

        print_separator("SEARCHING");
        const std::string collection = toolwire::sanitize_name(params.collection);
        json search_args = {
            {"collection_name", collection},
            {"fulltext_search_keyword", params.keyword.empty() ? params.query : params.keyword},
            {"knn_query_texts", json::array({params.query})},
            {"n_results", params.top_k},
            {"include", json::array({"documents", "metadatas"})}
        };

        TOOLWIRE_LOG_INFO("%s: searching '%s' (top-k=%d)\n", __func__, params.query.c_str(), params.top_k);
        json search_result = client->call_tool("hybrid_search", search_args);

        if (!is_success(search_result)) {
            TOOLWIRE_LOG_WARN("%s: hybrid search failed, falling back to vector search\n", __func__);
            search_result = client->call_tool("query_collection", {
                {"collection_name", collection},
                {"query_texts", json::array({params.query})},
                {"n_results", params.top_k},
                {"include", json::array({"documents", "metadatas"})}
            });
        }

        if (!is_success(search_result)) {
            TOOLWIRE_LOG_ERROR("%s: search failed: %s\n", __func__, search_result.dump().c_str());
            return 1;
        }

        print_results(toolwire::collect_results(search_result.value("data", json::object())));

        if (cached) {
            const toolwire::cache_stats stats = cached->stats();
            if (stats.hits > 0 || stats.misses > 0) {
                TOOLWIRE_LOG_INFO("%s: cache stats: %zu hits, %zu misses, %zu entries\n", __func__,
                        stats.hits, stats.misses, stats.size);
            }
        }

        client->close();

    } catch (const toolwire::TimeoutError & e) {
        TOOLWIRE_LOG_ERROR("%s: timeout error: %s\n", __func__, e.what());
        return 1;
    } catch (const toolwire::Error & e) {
        TOOLWIRE_LOG_ERROR("%s: %s\n", __func__, e.what());
        return 1;
    } catch (const std::exception & e) {
        TOOLWIRE_LOG_ERROR("%s: unexpected error: %s\n", __func__, e.what());
        return 1;
    }

    print_separator("DONE");
    return 0;
}
