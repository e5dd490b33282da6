#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace toolwire {

struct client_params {
    std::string protocol_version = "2024-11-05";
    std::string client_name      = "toolwire-client";
    std::string client_version   = "0.2";

    int32_t timeout_ms = 30000; // default per-request deadline
    int32_t grace_ms   = 3000;  // SIGTERM -> SIGKILL window on close

    size_t backlog_capacity = 256; // unmatched messages kept for diagnostics
};

// Argument names used to fingerprint calls of the cached tool.
struct cache_params {
    std::string tool           = "hybrid_search";
    std::string collection_key = "collection_name";
    std::string query_key      = "knn_query_texts";
    std::string keyword_key    = "fulltext_search_keyword";
    std::string count_key      = "n_results";

    int64_t default_count = 5;

    size_t capacity = 0; // 0 = unbounded
};

} // namespace toolwire
