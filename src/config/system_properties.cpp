#include "config/system_properties.hpp"
#include "core/utils.hpp"

#include <mutex>

namespace vaultclient {

SystemProperties& SystemProperties::instance() {
    static SystemProperties props;
    return props;
}

void SystemProperties::set(const std::string& key, std::string value) {
    std::unique_lock lock(mutex_);
    values_.insert_or_assign(key, std::move(value));
}

void SystemProperties::erase(const std::string& key) {
    std::unique_lock lock(mutex_);
    values_.erase(key);
}

void SystemProperties::clear() {
    std::unique_lock lock(mutex_);
    values_.clear();
}

std::optional<std::string> SystemProperties::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool SystemProperties::set_from_assignment(const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos) return false;

    const std::string key = utils::trim(assignment.substr(0, eq));
    if (key.empty()) return false;

    set(key, assignment.substr(eq + 1));
    return true;
}

size_t SystemProperties::size() const {
    std::shared_lock lock(mutex_);
    return values_.size();
}

} // namespace vaultclient
