#pragma once

#include <memory>
#include <optional>
#include <string>
#include "../common/CommandRunner.hpp"

namespace netwake::discovery
{
    // First "xx:xx:xx:xx:xx:xx" / "x-x-x-x-x-x" style match (1-2 hex digits per
    // group), upper-cased with '-' turned into ':' and padded.
    std::optional<std::string> ExtractMac(const std::string &text);

    // Strip separators; exactly 12 hex chars -> colon form, fewer -> left-pad with '0'
    // to 12, more -> keep the first 12. "0:3e:e1:b7:57:54" -> "00:3E:E1:B7:57:54".
    std::string PadMacAddress(const std::string &mac);

    class MacResolver
    {
    public:
        explicit MacResolver(std::shared_ptr<common::CommandRunner> runner);

        // Direct neighbor-cache query first, full table scan as fallback.
        std::optional<std::string> Resolve(const std::string &ip) const;

    private:
        std::optional<std::string> QueryDirect(const std::string &ip) const;
        std::optional<std::string> ScanFullTable(const std::string &ip) const;

        std::shared_ptr<common::CommandRunner> m_runner;
    };
}
