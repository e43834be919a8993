/// @file error.cpp
/// @brief Error formatting and explicit Result instantiations for tonic_core

#include <tonic/core/error.hpp>
#include <cstdint>
#include <sstream>
#include <vector>

namespace tonic_core {

namespace detail {

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.name.empty()) {
        oss << " (name: " << err.name << ")";
    }
    return oss.str();
}

std::string format_load_error(const LoadError& err) {
    std::ostringstream oss;
    oss << "[LoadError] " << err.message;
    if (!err.locator.empty()) {
        oss << " (src: " << err.locator << ")";
    }
    return oss.str();
}

std::string format_usage_error(const UsageError& err) {
    std::ostringstream oss;
    oss << "[UsageError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, LoadError>) {
            oss << detail::format_load_error(err);
        } else if constexpr (std::is_same_v<T, UsageError>) {
            oss << detail::format_usage_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<float, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace tonic_core
