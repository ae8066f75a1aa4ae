#include "itemstream/errors.hpp"

namespace itemstream {

namespace {

void AppendChain(const std::exception& e, std::string& out) {
    if (!out.empty()) out += ": ";
    out += e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        AppendChain(inner, out);
    }
}

} // namespace

std::string DescribeError(const std::exception& e) {
    std::string out;
    AppendChain(e, out);
    return out;
}

} // namespace itemstream
