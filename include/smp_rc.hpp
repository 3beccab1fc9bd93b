#pragma once
/**
 * @file smp_rc.hpp
 * @brief SMP return codes and group-scoped error tables
 *
 * Every SMP response may carry a return code. SMPv1 firmware uses the
 * generic "rc" key; SMPv2 firmware reports command-specific failures as
 * "err": {"group": <group id>, "rc": <group code>}, where the meaning of
 * the code depends on the group.
 *
 * Generic return codes:
 *   0:        OK
 *   1-13:     Generic errors (see Code)
 *   14-255:   Reserved, reported as "Unrecognized"
 *   256+:     User-defined
 *
 * Group tables are kept in a registry keyed by group id. The built-in
 * tables (OS, Image, Statistics, Settings, File System, Basic) are each
 * installed by their own registration function; applications can add
 * tables for their own groups.
 */

#include "smp.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace smp {
namespace rc {

// ============================================================================
// Generic return codes
// ============================================================================

enum class Code : uint64_t {
    Ok                = 0,
    Unknown           = 1,   ///< Unknown error
    NoMemory          = 2,   ///< Out of memory
    InValue           = 3,   ///< Invalid value in request
    Timeout           = 4,   ///< Operation timed out on the device
    NoEntry           = 5,   ///< No such file/entry
    BadState          = 6,   ///< Current state disallows the command
    ResponseTooLong   = 7,   ///< Response does not fit the buffer
    Unsupported       = 8,   ///< Command not supported
    CorruptPayload    = 9,   ///< Payload could not be parsed
    Busy              = 10,  ///< Busy with a previous request
    AccessDenied      = 11,  ///< Access denied
    UnsupportedTooOld = 12,  ///< Requested protocol version too old
    UnsupportedTooNew = 13,  ///< Requested protocol version too new
    UserDefined       = 256  ///< First user-defined code
};

constexpr uint64_t kUserDefinedBase = static_cast<uint64_t>(Code::UserDefined);

/// "No memory", "User-Defined Error (Code: 300)", "Unrecognized (RC: 20)"
std::string description(uint64_t rc);

inline std::string description(Code c) { return description(static_cast<uint64_t>(c)); }

/// Format for logging, e.g. "Busy, try again later (RC: 10)"
std::string format_for_log(uint64_t rc);

inline bool is_success(uint64_t rc) { return rc == 0; }

/// False for codes saying the command or protocol revision is unsupported
bool is_supported(uint64_t rc);

inline bool is_user_defined(uint64_t rc) { return rc >= kUserDefinedBase; }

/// True if @p rc has an entry in the generic table
bool is_known(uint64_t rc);

// ============================================================================
// Resolution
// ============================================================================

/**
 * @brief Resolve a generic return code
 * @return Error::none() for 0, otherwise an ErrorKind::ReturnCode error
 */
Error resolve(uint64_t rc);

/**
 * @brief Resolve a group-scoped return code
 *
 * Dispatches to the group's table. Unknown groups, and codes the group
 * table does not list, fall back to resolve(rc).
 */
Error resolve(uint16_t group, uint64_t rc);

// ============================================================================
// Group error registry
// ============================================================================

/// Maps a group-specific code to its description; empty if unlisted
using GroupResolver = std::function<std::optional<std::string>(uint64_t rc)>;

class GroupErrorRegistry {
public:
    /// Process-wide registry, built-in tables already installed
    static GroupErrorRegistry& instance();

    GroupErrorRegistry() = default;

    GroupErrorRegistry(const GroupErrorRegistry&) = delete;
    GroupErrorRegistry& operator=(const GroupErrorRegistry&) = delete;

    /// Install or replace the table for @p group
    void register_group(uint16_t group, std::string group_name, GroupResolver resolver);

    /// Remove the table for @p group; returns false if none was registered
    bool unregister_group(uint16_t group);

    bool has_group(uint16_t group) const;

    std::optional<std::string> group_name(uint16_t group) const;

    /// Description from the group's table; empty if group or code is unknown
    std::optional<std::string> lookup(uint16_t group, uint64_t rc) const;

    size_t size() const;

private:
    struct Entry {
        std::string name;
        GroupResolver resolver;
    };

    mutable std::mutex mutex_;
    std::map<uint16_t, Entry> groups_;
};

// ============================================================================
// Built-in group tables (smp_group_errors.cpp)
// ============================================================================

void register_os_errors(GroupErrorRegistry& registry);
void register_image_errors(GroupErrorRegistry& registry);
void register_stats_errors(GroupErrorRegistry& registry);
void register_settings_errors(GroupErrorRegistry& registry);
void register_filesystem_errors(GroupErrorRegistry& registry);
void register_basic_errors(GroupErrorRegistry& registry);

/// Install every built-in table
void register_builtin_groups(GroupErrorRegistry& registry);

} // namespace rc
} // namespace smp
