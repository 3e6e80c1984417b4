/**
 * \file dispatch/HandlerResolver.hpp
 * \brief Maps the handler header of a message onto a script under the script root.
 */
#pragma once

#include "message/Message.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace Hare::Dispatch {

/** \brief Handler name together with the script it resolves to. */
struct ResolvedHandler {
    std::string name;
    std::filesystem::path script;
};

/**
 * \brief Looks up and validates handler names.
 *
 * A handler name must be one or more ASCII letters or digits. This allow-list
 * rules out path separators, `..`, leading dashes, and whitespace, so the
 * resulting script path is always a direct child of the script root.
 * Resolution is pure: the filesystem is never consulted.
 */
class HandlerResolver {
public:
    HandlerResolver(std::string handler_key, std::filesystem::path script_root);

    /**
     * \brief Resolve the handler for a header list.
     * \return Name and script path, or std::nullopt when the key is absent or the value is rejected.
     */
    [[nodiscard]] std::optional<ResolvedHandler> resolve(const Headers& headers) const;

    /** \brief Stateless form of resolve(). */
    [[nodiscard]] static std::optional<ResolvedHandler> resolve(const Headers& headers,
                                                                std::string_view handler_key,
                                                                const std::filesystem::path& script_root);

    /** \brief True when \p name matches `^[A-Za-z0-9]+$`. */
    [[nodiscard]] static bool is_valid_name(std::string_view name) noexcept;

    const std::string& handler_key() const noexcept { return handler_key_; }
    const std::filesystem::path& script_root() const noexcept { return script_root_; }

private:
    std::string handler_key_;
    std::filesystem::path script_root_;
};

} // namespace Hare::Dispatch
