#include "vole/config.hpp"

namespace vole {

Config& Config::instance() {
    static Config config;
    return config;
}

} // namespace vole
