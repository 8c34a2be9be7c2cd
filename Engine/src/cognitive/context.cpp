#include <cognitive/context.hpp>
#include <utils/text.hpp>

namespace Russell {

std::string normalize_context(const Context& context) {
    if (context.is_null()) return "{}";
    // nlohmann::json objects are std::map backed: keys dump in sorted order
    return context.dump();
}

std::string normalize_query(const std::string& query) {
    return text::normalize_whitespace(query);
}

std::string make_cache_key(const std::string& query, const Context& context, int depth) {
    std::string q = normalize_query(query);
    std::string c = normalize_context(context);

    std::string key;
    key.reserve(q.size() + c.size() + 32);
    key += std::to_string(q.size());
    key += ':';
    key += q;
    key += '|';
    key += std::to_string(c.size());
    key += ':';
    key += c;
    key += '|';
    key += std::to_string(depth);
    return key;
}

} // namespace Russell
