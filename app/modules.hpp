#pragma once

#include "tare.hpp"

#include <map>
#include <string>
#include <vector>

namespace tare::demo {

    // Operations of the bundled example runtime, registered into `ops`
    void register_modules(registry& ops);

    // State every trial starts from
    std::map<std::string, std::string> genesis();

    // Keys touched by every block; excluded from storage accounting
    std::vector<std::string> whitelisted_keys();

}  // namespace tare::demo
