#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace vaultclient {

/**
 * @brief Process-level key/value property store
 *
 * Second configuration source next to the environment: the CLI fills it
 * from "-D key=value", ConfigLoader from the [properties] table, and
 * embedding applications may set values directly. Thread-safe.
 */
class SystemProperties {
public:
    SystemProperties() = default;

    SystemProperties(const SystemProperties&) = delete;
    SystemProperties& operator=(const SystemProperties&) = delete;

    // Shared instance used by the default providers and resolvers
    [[nodiscard]] static SystemProperties& instance();

    void set(const std::string& key, std::string value);
    void erase(const std::string& key);
    void clear();

    // Unset and empty values both read as nullopt
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

    /**
     * @brief Parse a "key=value" assignment and store it
     * @return false when there is no '=' or the key is empty
     */
    bool set_from_assignment(const std::string& assignment);

    [[nodiscard]] size_t size() const;

private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::shared_mutex mutex_;
};

} // namespace vaultclient
