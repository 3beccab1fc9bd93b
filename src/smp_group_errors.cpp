#include "smp_rc.hpp"
#include <unordered_map>

// Group-specific return codes reported in SMPv2 "err" maps. Each table
// mirrors the firmware's *_MGMT_ERR_* enumeration for that group.

namespace smp {
namespace rc {

namespace {

using Table = std::unordered_map<uint64_t, const char*>;

GroupResolver table_resolver(const Table& table) {
    return [&table](uint64_t rc) -> std::optional<std::string> {
        auto it = table.find(rc);
        if (it == table.end()) {
            return std::nullopt;
        }
        return std::string(it->second);
    };
}

const Table& os_table() {
    static const Table table = {
        {1, "Unknown OS error"},
        {2, "Invalid format"},
        {3, "Query yields no answer"},
        {4, "RTC not set"},
        {5, "RTC command failed"},
        {6, "Query response value not valid"}
    };
    return table;
}

const Table& image_table() {
    static const Table table = {
        {1,  "Unknown image error"},
        {2,  "Flash configuration query failed"},
        {3,  "No image"},
        {4,  "No TLVs"},
        {5,  "Invalid TLV"},
        {6,  "Multiple hash TLVs found"},
        {7,  "Invalid TLV size"},
        {8,  "Hash not found"},
        {9,  "No free slot"},
        {10, "Flash open failed"},
        {11, "Flash read failed"},
        {12, "Flash write failed"},
        {13, "Flash erase failed"},
        {14, "Invalid slot"},
        {15, "No free memory"},
        {16, "Flash context already set"},
        {17, "Flash context not set"},
        {18, "Flash area device is null"},
        {19, "Invalid page offset"},
        {20, "Invalid offset"},
        {21, "Invalid length"},
        {22, "Invalid image header"},
        {23, "Invalid image header magic"},
        {24, "Invalid hash"},
        {25, "Invalid flash address"},
        {26, "Version get failed"},
        {27, "Current version is newer"},
        {28, "Image already pending"},
        {29, "Invalid image vector table"},
        {30, "Image too large"},
        {31, "Image data overrun"},
        {32, "Image confirmation denied"},
        {33, "Setting test to active slot denied"}
    };
    return table;
}

const Table& stats_table() {
    static const Table table = {
        {1, "Unknown statistics error"},
        {2, "Invalid statistics group"},
        {3, "Invalid statistic name"},
        {4, "Invalid statistic size"},
        {5, "Statistics walk aborted"}
    };
    return table;
}

const Table& settings_table() {
    static const Table table = {
        {1, "Unknown settings error"},
        {2, "Key too long"},
        {3, "Key not found"},
        {4, "Read not supported"},
        {5, "Root key not found"},
        {6, "Write not supported"},
        {7, "Delete not supported"}
    };
    return table;
}

const Table& filesystem_table() {
    static const Table table = {
        {1,  "Unknown file system error"},
        {2,  "Invalid file name"},
        {3,  "File not found"},
        {4,  "File is a directory"},
        {5,  "File open failed"},
        {6,  "File seek failed"},
        {7,  "File read failed"},
        {8,  "File truncate failed"},
        {9,  "File delete failed"},
        {10, "File write failed"},
        {11, "File offset not valid"},
        {12, "File offset larger than file"},
        {13, "Checksum/hash type not found"},
        {14, "Mount point not found"},
        {15, "Read-only file system"},
        {16, "File is empty"}
    };
    return table;
}

const Table& basic_table() {
    static const Table table = {
        {1, "Unknown basic error"},
        {2, "Flash open failed"},
        {3, "Flash configuration query failed"},
        {4, "Flash erase failed"}
    };
    return table;
}

} // namespace

void register_os_errors(GroupErrorRegistry& registry) {
    registry.register_group(Group::kOs, "OS", table_resolver(os_table()));
}

void register_image_errors(GroupErrorRegistry& registry) {
    registry.register_group(Group::kImage, "Image", table_resolver(image_table()));
}

void register_stats_errors(GroupErrorRegistry& registry) {
    registry.register_group(Group::kStatistics, "Statistics", table_resolver(stats_table()));
}

void register_settings_errors(GroupErrorRegistry& registry) {
    registry.register_group(Group::kSettings, "Settings", table_resolver(settings_table()));
}

void register_filesystem_errors(GroupErrorRegistry& registry) {
    registry.register_group(Group::kFileSystem, "FileSystem", table_resolver(filesystem_table()));
}

void register_basic_errors(GroupErrorRegistry& registry) {
    registry.register_group(Group::kBasic, "Basic", table_resolver(basic_table()));
}

} // namespace rc
} // namespace smp
