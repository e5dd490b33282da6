#pragma once

#include "error.hpp"

namespace toolwire {

// Flattens single-query results from a batch-shaped API:
//   null / []    -> []
//   [[a, b], ..] -> [a, b]
//   [a, b]       -> [a, b]
// Throws std::invalid_argument for anything that is not null or an array.
json normalize_results(const json & items);

// Zips the ids/documents/metadatas of a search payload into
// [{"id": .., "summary": .., "meta": {..}}, ..].
json collect_results(const json & data);

} // namespace toolwire
