#include "fingerprint.hpp"

#include <openssl/evp.h>

#include <cstdio>
#include <stdexcept>

namespace toolwire {

const char * const FINGERPRINT_NONE = "None";

namespace {

std::string string_field(const json & arguments, const std::string & key) {
    const auto it = arguments.find(key);
    if (it == arguments.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

// The query may be a single string or a batch of query texts; only the first counts.
std::string query_field(const json & arguments, const std::string & key) {
    const auto it = arguments.find(key);
    if (it == arguments.end()) {
        return "";
    }
    if (it->is_array()) {
        if (it->empty()) {
            return "";
        }
        const json & first = it->front();
        return first.is_string() ? first.get<std::string>() : first.dump();
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

} // namespace

json fingerprint_fields(const json & arguments, const cache_params & params) {
    if (!arguments.is_object()) {
        return json::array({ "", "", FINGERPRINT_NONE, params.default_count });
    }

    std::string keyword = string_field(arguments, params.keyword_key);
    if (keyword.empty()) {
        keyword = FINGERPRINT_NONE;
    }

    json count = params.default_count;
    const auto it = arguments.find(params.count_key);
    if (it != arguments.end() && it->is_number()) {
        count = *it;
    }

    return json::array({
        string_field(arguments, params.collection_key),
        query_field(arguments, params.query_key),
        keyword,
        count,
    });
}

std::string fingerprint(const json & arguments, const cache_params & params) {
    return md5_hex(fingerprint_fields(arguments, params).dump());
}

std::string md5_hex(const std::string & data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    char buf[3];
    for (unsigned int i = 0; i < digest_len; ++i) {
        snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

} // namespace toolwire
