#include "AppleOui.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace netwake::discovery
{
    bool IsAppleOui(const std::string &colonPrefix)
    {
        static const std::unordered_set<std::string> apple_prefixes = {
            "00:05:02", "00:0A:27", "00:0A:95", "00:1B:63", "00:1C:B3", "00:1D:4F", "00:1E:52", "00:1E:C2",
            "00:21:E9", "00:23:12", "00:23:32", "00:23:76", "00:23:DF", "00:24:E8", "00:25:00", "00:26:08",
            "00:26:B0", "00:26:BB", "00:30:65", "00:50:C2", "00:88:65", "00:A0:40", "00:B3:62", "00:C6:10",
            "00:D0:41", "00:E0:81", "00:F4:6D", "08:00:07", "08:66:98", "08:70:45", "0C:30:21", "0C:4D:E9",
            "0C:74:C2", "10:40:F3", "10:9A:DD", "10:DD:B1", "18:20:32", "18:34:51", "18:9E:FC", "1C:1A:C0",
            "1C:AB:A7", "1C:E6:2B", "20:3A:EF", "20:7D:74", "20:A6:CD", "20:C9:D0", "24:AB:81", "24:E4:3F",
            "28:37:37", "28:6A:B8", "28:CF:DA", "28:FF:3C", "2C:44:FD", "2C:BE:08", "30:10:E4", "34:15:9E",
            "34:51:C9", "34:C0:59", "38:48:4C", "3C:07:54", "3C:AB:8E", "3C:E0:72", "40:B0:76", "40:D3:2A",
            "44:D8:84", "48:DB:50", "4C:00:10", "4C:32:75", "4C:57:CA", "4C:8D:79", "4C:B1:99", "50:32:37",
            "50:7A:55", "50:EA:D6", "54:26:96", "54:4E:90", "54:72:4F", "58:1F:AA", "58:BD:A3", "58:E6:BA",
            "5C:09:79", "5C:8F:E0", "60:33:4B", "60:69:44", "60:FB:42", "64:B9:E8", "68:96:7B", "68:9C:5E",
            "68:AB:1E", "68:FF:7B", "6C:3E:6D", "6C:40:08", "6C:72:20", "6C:8D:C1", "6C:94:F8", "70:11:24",
            "70:56:81", "70:73:CB", "70:CD:60", "70:DE:E2", "74:E1:B6", "78:31:C1", "78:4B:87", "78:6C:1C",
            "78:A1:06", "78:CA:39", "7C:04:D0", "7C:6D:62", "7C:C3:A1", "7C:F0:5F", "80:00:6E", "80:BE:05",
            "80:D5:89", "80:EA:96", "84:29:99", "84:85:06", "84:B1:53", "88:53:95", "88:63:DF", "88:87:17",
            "88:C2:55", "8C:7B:9D", "8C:FA:22", "90:84:0D", "90:B9:31", "90:C1:6E", "94:94:26", "98:01:A7",
            "98:5A:EB", "98:CA:33", "98:D6:BB", "98:FE:94", "9C:04:EB", "9C:35:EB", "9C:84:CD", "9C:B6:D0",
            "A0:ED:CD", "A4:B1:97", "A4:C6:4F", "A8:20:66", "A8:66:7F", "A8:BB:CF", "AC:29:3A", "AC:3A:7A",
            "AC:5D:10", "AC:7F:3E", "AC:87:A3", "AC:DE:48", "B0:34:95", "B0:65:BD", "B0:9F:BA", "B4:18:82",
            "B4:2E:99", "B8:09:8A", "B8:44:4F", "B8:53:AC", "B8:78:2E", "B8:C7:5D", "B8:F6:B1", "BC:3B:AF",
            "BC:52:B7", "BC:67:78", "BC:9F:35", "C0:63:94", "C0:84:7A", "C0:CE:CD", "C4:2C:03", "C4:85:08",
            "C8:1E:E7", "C8:2A:14", "C8:33:4B", "C8:69:CD", "C8:85:50", "C8:BC:C8", "CC:08:E0", "CC:20:E8",
            "CC:29:F5", "CC:78:5F", "CC:C3:EA", "D0:23:DB", "D0:50:99", "D0:66:7B", "D0:81:7A", "D0:A6:37",
            "D0:BB:80", "D0:C5:F3", "D0:E4:82", "D4:61:9D", "D4:9A:20", "D4:F4:6F", "D8:30:62", "D8:96:95",
            "D8:A0:11", "D8:BB:2C", "D8:CF:9C", "DC:2B:2A", "DC:37:14", "DC:86:D8", "DC:A4:CA", "DC:E1:AD",
            "E0:66:78", "E0:8E:3C", "E0:B9:BA", "E0:C7:67", "E0:F5:C6", "E0:F8:47", "E4:25:E7", "E4:98:6F",
            "E4:CE:8F", "E8:04:0B", "E8:06:88", "E8:80:25", "E8:8D:28", "E8:B2:AC", "E8:CC:18", "EC:35:86",
            "EC:85:2F", "EC:FA:BC", "F0:24:75", "F0:71:C9", "F0:76:1C", "F0:9F:C2", "F0:B4:79", "F0:C1:F1",
            "F0:D1:A9", "F4:1B:A1", "F4:31:C3", "F4:37:B7", "F4:5C:89", "F4:F1:5A", "F4:F5:D8", "F4:F5:E8",
            "F8:1E:DF", "F8:27:93", "F8:95:EA", "F8:FF:C2", "FC:00:12", "FC:25:3F", "FC:42:03", "FC:64:BA",
            "FC:A8:9A", "FC:C1:11", "FC:D8:48",        };

        std::string key = colonPrefix;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return apple_prefixes.count(key) > 0;
    }
}
