#pragma once

#include <boost/system/system_error.hpp>
#include <string>

namespace pubnodes::error {

/**
 * Errors originating from the node configuration
 */
enum Config {
    ok = 0,
    /**
     * Node configuration file exists but can't be parsed
     */
    parse,
    /**
     * Node identifier is in none of the supported notations
     */
    invalid_node_id,
    /**
     * Authentication mode requires a credential but none was configured
     */
    missing_credential,
    /**
     * Creation of the session/subscription/item structures failed
     */
    build,
    /**
     * Reading or writing the node configuration file failed
     */
    io,
    /**
     * Unknown endpoint or node
     */
    not_found,
    /**
     * Bug in the pubnodes code
     */
    logic,
};

/**
 * Category of errors originating in the node configuration
 */
class ConfigErrorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "ConfigErrorCategory";
    }

    std::string message(int ev) const override {
        switch (static_cast<error::Config>(ev)) {
            case error::ok: return "Success";
            case error::parse: return "Failed to parse node configuration";
            case error::invalid_node_id: return "Invalid node identifier";
            case error::missing_credential: return "Missing authentication credential";
            case error::build: return "Failed to create node configuration structures";
            case error::io: return "Node configuration file I/O failed";
            case error::not_found: return "Not found";
            case error::logic: return "Bug in the pubnodes code";
            default: return "Unknown error";
        }
    }
};

const boost::system::error_category& config_error_category();

inline
boost::system::error_code make_error_code(error::Config e) {
    return {static_cast<int>(e), config_error_category()};
}

} // namespace pubnodes::error

namespace boost::system {
    template<> struct is_error_code_enum<pubnodes::error::Config>
    {
      static const bool value = true;
    };
} // namespace boost::system

namespace pubnodes {

[[noreturn]]
inline void throw_error(error::Config ec, std::string message) {
    throw boost::system::system_error(ec, std::move(message));
}

[[noreturn]]
inline void throw_error(error::Config ec) {
    throw boost::system::system_error(ec);
}

} // namespace pubnodes
