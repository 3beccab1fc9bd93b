#include "smp_rc.hpp"
#include <sstream>
#include <unordered_map>

namespace smp {
namespace rc {

// ============================================================================
// Description strings
// ============================================================================

std::string description(uint64_t rc) {
    static const std::unordered_map<uint64_t, const char*> descriptions = {
        {0,   "OK"},
        {1,   "Unknown error"},
        {2,   "No memory"},
        {3,   "Invalid value"},
        {4,   "Timeout"},
        {5,   "No entry"},
        {6,   "Bad state"},
        {7,   "Response is too long"},
        {8,   "Not supported"},
        {9,   "Corrupt payload"},
        {10,  "Busy, try again later"},
        {11,  "Access denied"},
        {12,  "Requested SMP McuMgr protocol version is too old"},
        {13,  "Requested SMP McuMgr protocol version is too new"}
    };

    auto it = descriptions.find(rc);
    if (it != descriptions.end()) {
        return it->second;
    }

    std::ostringstream oss;
    if (is_user_defined(rc)) {
        oss << "User-Defined Error (Code: " << rc << ")";
    } else {
        oss << "Unrecognized (RC: " << rc << ")";
    }
    return oss.str();
}

std::string format_for_log(uint64_t rc) {
    if (!is_known(rc)) {
        // Already carries the number
        return description(rc);
    }
    std::ostringstream oss;
    oss << description(rc) << " (RC: " << rc << ")";
    return oss.str();
}

bool is_supported(uint64_t rc) {
    switch (static_cast<Code>(rc)) {
        case Code::Unsupported:
        case Code::UnsupportedTooOld:
        case Code::UnsupportedTooNew:
            return false;
        default:
            return true;
    }
}

bool is_known(uint64_t rc) {
    return rc <= static_cast<uint64_t>(Code::UnsupportedTooNew);
}

// ============================================================================
// Resolution
// ============================================================================

Error resolve(uint64_t rc) {
    if (is_success(rc)) {
        return Error::none();
    }
    return Error::make(ErrorKind::ReturnCode, rc, description(rc));
}

Error resolve(uint16_t group, uint64_t rc) {
    if (is_success(rc)) {
        return Error::none();
    }

    auto text = GroupErrorRegistry::instance().lookup(group, rc);
    if (!text) {
        // Unknown group or unlisted code: generic numeric error
        return resolve(rc);
    }

    Error e = Error::make(ErrorKind::GroupReturnCode, rc, *text);
    e.group = group;
    return e;
}

// ============================================================================
// GroupErrorRegistry
// ============================================================================

GroupErrorRegistry& GroupErrorRegistry::instance() {
    static GroupErrorRegistry registry;
    static std::once_flag builtins;
    std::call_once(builtins, [] { register_builtin_groups(registry); });
    return registry;
}

void GroupErrorRegistry::register_group(uint16_t group, std::string group_name,
                                        GroupResolver resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_[group] = Entry{std::move(group_name), std::move(resolver)};
}

bool GroupErrorRegistry::unregister_group(uint16_t group) {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.erase(group) > 0;
}

bool GroupErrorRegistry::has_group(uint16_t group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.count(group) > 0;
}

std::optional<std::string> GroupErrorRegistry::group_name(uint16_t group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second.name;
}

std::optional<std::string> GroupErrorRegistry::lookup(uint16_t group, uint64_t rc) const {
    GroupResolver resolver;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = groups_.find(group);
        if (it == groups_.end() || !it->second.resolver) {
            return std::nullopt;
        }
        resolver = it->second.resolver;
    }
    return resolver(rc);
}

size_t GroupErrorRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}

void register_builtin_groups(GroupErrorRegistry& registry) {
    register_os_errors(registry);
    register_image_errors(registry);
    register_stats_errors(registry);
    register_settings_errors(registry);
    register_filesystem_errors(registry);
    register_basic_errors(registry);
}

} // namespace rc
} // namespace smp
