/**
 * \file dispatch/HandlerResolver.cpp
 * \brief Handler name validation and script path construction.
 */
#include "HandlerResolver.hpp"

#include <utility>

namespace Hare::Dispatch {

HandlerResolver::HandlerResolver(std::string handler_key, std::filesystem::path script_root)
    : handler_key_(std::move(handler_key))
    , script_root_(std::move(script_root))
{
}

bool HandlerResolver::is_valid_name(std::string_view name) noexcept {
    if (name.empty()) return false;
    for (char c : name) {
        bool alnum = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (!alnum) return false;
    }
    return true;
}

std::optional<ResolvedHandler> HandlerResolver::resolve(const Headers& headers) const {
    return resolve(headers, handler_key_, script_root_);
}

std::optional<ResolvedHandler> HandlerResolver::resolve(const Headers& headers,
                                                        std::string_view handler_key,
                                                        const std::filesystem::path& script_root) {
    auto value = find_header(headers, handler_key);
    if (!value || !is_valid_name(*value)) {
        return std::nullopt;
    }
    // Validated before joining: the name is a single segment
    return ResolvedHandler{std::string(*value), script_root / std::string(*value)};
}

} // namespace Hare::Dispatch
