/**
 * \file dispatch/HeaderMapper.hpp
 * \brief Translation of message headers into handler environment variables.
 */
#pragma once

#include "message/Message.hpp"

#include <map>
#include <string>
#include <string_view>

namespace Hare::Dispatch {

/** \brief Variables added to (or overriding) the inherited environment of a handler. */
using EnvironmentOverlay = std::map<std::string, std::string>;

/** \brief Prefix given to every variable derived from a header. */
inline constexpr std::string_view kEnvPrefix = "HARE_VAR_";

/**
 * \brief Builds handler environments from header lists.
 *
 * Each header `(k, v)` becomes `HARE_VAR_<K> = v` where `<K>` is `k` with
 * ASCII letters upper-cased. Values are copied verbatim. Headers are visited
 * in order, so when two keys upper-case to the same name the later one wins.
 */
class HeaderMapper {
public:
    [[nodiscard]] static EnvironmentOverlay build(const Headers& headers);

    /** \brief Environment variable name for a single header key. */
    [[nodiscard]] static std::string variable_name(std::string_view header_key);
};

} // namespace Hare::Dispatch
