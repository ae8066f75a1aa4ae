#include "itemstream/context_key.hpp"

#include "itemstream/errors.hpp"

namespace itemstream {

std::string FormatContextKey(std::string_view stream_name, std::string_view suffix) {
    if (stream_name.empty()) {
        throw ConfigError("A stream name must be assigned to build context key '" +
                          std::string(suffix) + "'");
    }
    std::string key;
    key.reserve(stream_name.size() + 1 + suffix.size());
    key.append(stream_name);
    key.push_back('.');
    key.append(suffix);
    return key;
}

} // namespace itemstream
