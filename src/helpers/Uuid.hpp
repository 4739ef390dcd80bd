#pragma once

#include <string>

namespace Hyprview::Uuid {
    // random v4, lowercase and hyphenated
    std::string generate();
    bool        isValid(const std::string& uuid);
};
