#pragma once

#include <string>

namespace netwake::discovery
{
    // "AC:DE:48" style prefix registered to Apple.
    bool IsAppleOui(const std::string &colonPrefix);
}
