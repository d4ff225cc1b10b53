#include <pubnodes/error.hpp>

namespace pubnodes::error {

const boost::system::error_category& config_error_category() {
    static ConfigErrorCategory instance;
    return instance;
}

} // namespace pubnodes::error
