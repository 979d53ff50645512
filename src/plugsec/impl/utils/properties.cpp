#include "utils/properties.h"
#include <algorithm>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace plugsec {

Properties::Properties() = default;

Properties::Properties(const Properties& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = other.properties_;
}

Properties::Properties(Properties&& other) noexcept {
    std::unique_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = std::move(other.properties_);
}

Properties& Properties::operator=(const Properties& other) {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = other.properties_;
    }
    return *this;
}

Properties& Properties::operator=(Properties&& other) noexcept {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::unique_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = std::move(other.properties_);
    }
    return *this;
}

void Properties::set(const std::string& key, const std::any& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_[key] = value;
}

std::any Properties::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it != properties_.end()) {
        return it->second;
    }
    return std::any();
}

std::optional<std::string> Properties::stringValue(const std::any& value) const {
    if (const auto* str = std::any_cast<std::string>(&value)) {
        return *str;
    }
    if (const auto* cstr = std::any_cast<const char*>(&value)) {
        return std::string(*cstr);
    }
    if (const auto* str = std::any_cast<char*>(&value)) {
        return std::string(*str);
    }
    return std::nullopt;
}

std::string Properties::getString(const std::string& key, const std::string& defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }
    return stringValue(it->second).value_or(defaultValue);
}

int Properties::getInt(const std::string& key, int defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<int>(&it->second)) {
        return *value;
    }

    // Try parsing from string
    auto str = stringValue(it->second);
    if (!str) {
        return defaultValue;
    }
    try {
        return std::stoi(*str);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

long Properties::getLong(const std::string& key, long defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    const std::any& value = it->second;
    if (const auto* v = std::any_cast<long>(&value)) return *v;
    if (const auto* v = std::any_cast<long long>(&value)) return static_cast<long>(*v);
    if (const auto* v = std::any_cast<int>(&value)) return *v;
    if (const auto* v = std::any_cast<unsigned long>(&value)) return static_cast<long>(*v);
    if (const auto* v = std::any_cast<unsigned int>(&value)) return static_cast<long>(*v);

    auto str = stringValue(value);
    if (!str) {
        return defaultValue;
    }
    try {
        return std::stol(*str);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

bool Properties::getBool(const std::string& key, bool defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<bool>(&it->second)) {
        return *value;
    }

    auto str = stringValue(it->second);
    if (!str) {
        return defaultValue;
    }
    return *str == "true" || *str == "1" || *str == "yes" || *str == "on";
}

double Properties::getDouble(const std::string& key, double defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<double>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::any_cast<int>(&it->second)) {
        return *value;
    }

    auto str = stringValue(it->second);
    if (!str) {
        return defaultValue;
    }
    try {
        return std::stod(*str);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

std::vector<std::string> Properties::getStringList(const std::string& key,
                                                   const std::vector<std::string>& defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* list = std::any_cast<std::vector<std::string>>(&it->second)) {
        return *list;
    }

    auto str = stringValue(it->second);
    if (!str) {
        return defaultValue;
    }

    // Comma-separated form, surrounding blanks trimmed
    std::vector<std::string> result;
    std::istringstream stream(*str);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        auto last = item.find_last_not_of(" \t");
        result.push_back(item.substr(first, last - first + 1));
    }
    return result;
}

bool Properties::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.find(key) != properties_.end();
}

bool Properties::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return properties_.erase(key) > 0;
}

std::vector<std::string> Properties::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(properties_.size());
    for (const auto& pair : properties_) {
        result.push_back(pair.first);
    }
    return result;
}

size_t Properties::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.size();
}

bool Properties::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.empty();
}

void Properties::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_.clear();
}

void Properties::merge(const Properties& other) {
    if (this == &other) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
    std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
    std::lock(lock1, lock2);

    for (const auto& pair : other.properties_) {
        properties_[pair.first] = pair.second;
    }
}

} // namespace plugsec
