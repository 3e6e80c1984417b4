/**
 * \file dispatch/HeaderMapper.cpp
 * \brief Header to environment translation.
 */
#include "HeaderMapper.hpp"

namespace Hare::Dispatch {

std::string HeaderMapper::variable_name(std::string_view header_key) {
    std::string name;
    name.reserve(kEnvPrefix.size() + header_key.size());
    name.append(kEnvPrefix);
    for (char c : header_key) {
        // ASCII only; bytes outside a-z pass through untouched
        name.push_back((c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c);
    }
    return name;
}

EnvironmentOverlay HeaderMapper::build(const Headers& headers) {
    EnvironmentOverlay overlay;
    for (const auto& [key, value] : headers) {
        overlay.insert_or_assign(variable_name(key), value);
    }
    return overlay;
}

} // namespace Hare::Dispatch
