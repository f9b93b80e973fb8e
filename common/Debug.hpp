#pragma once

namespace netwake::common
{
    // Process-wide switch for verbose "[Component] ..." diagnostics.
    void SetDebugEnabled(bool enabled);
    bool DebugEnabled();
}
