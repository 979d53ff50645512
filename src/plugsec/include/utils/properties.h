#ifndef PLUGSEC_PROPERTIES_H
#define PLUGSEC_PROPERTIES_H

#include <string>
#include <map>
#include <vector>
#include <any>
#include <optional>
#include <shared_mutex>

namespace plugsec {

/**
 * @brief Thread-safe key-value property container
 *
 * Keys are strings and values can be of any type (using std::any).
 * Typed getters fall back to a default value when the key is missing
 * or the stored value cannot be converted.
 *
 * Thread-safety: All methods are thread-safe using read-write locks.
 */
class Properties {
public:
    Properties();
    Properties(const Properties& other);
    Properties(Properties&& other) noexcept;
    Properties& operator=(const Properties& other);
    Properties& operator=(Properties&& other) noexcept;
    virtual ~Properties() = default;

    /**
     * @brief Set a property value
     * @param key Property key
     * @param value Property value (any type)
     */
    void set(const std::string& key, const std::any& value);

    /**
     * @brief Get a property value as std::any
     * @return std::any containing the value, or empty std::any if not found
     */
    std::any get(const std::string& key) const;

    /**
     * @brief Get a string property
     *
     * Accepts values stored as std::string or const char*.
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get an integer property
     *
     * Accepts int values and numeric strings.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get a 64-bit integer property
     *
     * Accepts long, int and unsigned values as well as numeric strings.
     */
    long getLong(const std::string& key, long defaultValue = 0L) const;

    /**
     * @brief Get a boolean property
     *
     * Strings "true", "1", "yes" and "on" are treated as true.
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a double property
     */
    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    /**
     * @brief Get a list of strings
     *
     * Accepts a std::vector<std::string> or a comma-separated string.
     */
    std::vector<std::string> getStringList(const std::string& key,
                                           const std::vector<std::string>& defaultValue = {}) const;

    bool has(const std::string& key) const;

    /**
     * @brief Remove a property
     * @return true if property was removed, false if not found
     */
    bool remove(const std::string& key);

    std::vector<std::string> keys() const;
    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * @brief Merge another Properties object into this one
     *
     * Existing keys will be overwritten with values from other.
     */
    void merge(const Properties& other);

    /**
     * @brief Get a typed property value
     * @return Optional containing the value if found and correct type, std::nullopt otherwise
     */
    template<typename T>
    std::optional<T> getAs(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = properties_.find(key);
        if (it == properties_.end()) {
            return std::nullopt;
        }

        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

private:
    std::optional<std::string> stringValue(const std::any& value) const;

    std::map<std::string, std::any> properties_;
    mutable std::shared_mutex mutex_;
};

} // namespace plugsec

#endif // PLUGSEC_PROPERTIES_H
