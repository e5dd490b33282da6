#pragma once

#include "error.hpp"
#include "params.hpp"

#include <string>

namespace toolwire {

// Keyword value that stands for "no keyword filter".
extern const char * const FINGERPRINT_NONE;

// Canonical tuple [collection, query, keyword, count] of a cacheable call.
// Missing optional fields are replaced by their defaults so that omitting a
// field and passing its default value give the same tuple.
json fingerprint_fields(const json & arguments, const cache_params & params);

// Lowercase hex MD5 of the canonical tuple.
std::string fingerprint(const json & arguments, const cache_params & params);

// Lowercase hex MD5 of `data`.
std::string md5_hex(const std::string & data);

} // namespace toolwire
