#include "Debug.hpp"

#include <atomic>

namespace netwake::common
{
    namespace
    {
        std::atomic<bool> g_debug{false};
    }

    void SetDebugEnabled(bool enabled)
    {
        g_debug = enabled;
    }

    bool DebugEnabled()
    {
        return g_debug;
    }
}
