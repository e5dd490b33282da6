#include "normalize.hpp"

#include <stdexcept>

namespace toolwire {

json normalize_results(const json & items) {
    if (items.is_null()) {
        return json::array();
    }
    if (!items.is_array()) {
        throw std::invalid_argument("Expected a result sequence, got " + std::string(items.type_name()));
    }
    if (items.empty()) {
        return json::array();
    }
    if (items.front().is_array()) {
        return items.front();
    }
    return items;
}

json collect_results(const json & data) {
    json results = json::array();
    if (!data.is_object()) {
        return results;
    }

    const json ids   = normalize_results(data.value("ids", json()));
    const json docs  = normalize_results(data.value("documents", json()));
    const json metas = normalize_results(data.value("metadatas", json()));

    for (size_t i = 0; i < ids.size(); ++i) {
        json meta = i < metas.size() && metas[i].is_object() ? metas[i] : json::object();
        json summary = i < docs.size() && !docs[i].is_null() ? docs[i] : json("");

        results.push_back({
            {"id", ids[i]},
            {"summary", summary},
            {"meta", meta}
        });
    }

    return results;
}

} // namespace toolwire
