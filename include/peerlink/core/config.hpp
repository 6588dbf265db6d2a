#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <type_traits>

#include <peerlink/core/error.hpp>

namespace peerlink::core {

class ConfigNode;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;

struct ConfigValue;
using ConfigArray = std::vector<ConfigValue>;

// Tipe nilai yang didukung dalam konfigurasi
using ConfigVariant = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    ConfigArray,
    ConfigNodePtr
>;

struct ConfigValue : ConfigVariant {
    using ConfigVariant::ConfigVariant;
    using ConfigVariant::operator=;

    ConfigValue() = default;
    ConfigValue(const char* value) : ConfigVariant(std::string(value)) {}
    ConfigValue(int value) : ConfigVariant(static_cast<int64_t>(value)) {}

    const ConfigVariant& base() const noexcept { return *this; }
};

class ConfigNode : public std::enable_shared_from_this<ConfigNode> {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    static ConfigNodePtr create() {
        return std::make_shared<ConfigNode>();
    }

    static ConfigNodePtr create(Map values) {
        return std::make_shared<ConfigNode>(std::move(values));
    }

    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::InvalidArgument, "Configuration key not found: " + key};
        }

        if (const T* value = std::get_if<T>(&it->second.base())) {
            return *value;
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

    // Nilai dengan fallback; integer dan double saling dikonversi
    template<typename T>
    T getOr(const std::string& key, T fallback) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return fallback;
        }

        const ConfigVariant& value = it->second.base();
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
            if (const T* v = std::get_if<T>(&value)) return *v;
        }
        else if constexpr (std::is_arithmetic_v<T>) {
            if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<T>(*i);
            if (const auto* d = std::get_if<double>(&value)) return static_cast<T>(*d);
        }
        else {
            if (const T* v = std::get_if<T>(&value)) return *v;
        }
        return fallback;
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = ConfigValue(std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void remove(const std::string& key) {
        values_.erase(key);
    }

    Result<ConfigNodePtr> getObject(const std::string& key) const {
        return get<ConfigNodePtr>(key);
    }

    ConfigNodePtr getOrCreateObject(const std::string& key) {
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (const auto* node = std::get_if<ConfigNodePtr>(&it->second.base())) {
                return *node;
            }
        }

        auto node = create();
        values_[key] = node;
        return node;
    }

    const Map& values() const { return values_; }
    Map& values() { return values_; }

private:
    Map values_;
};

class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;

    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    ConfigNodePtr root() { return root_; }
    const ConfigNodePtr root() const { return root_; }

    template<typename T>
    Result<T> get(const std::string& key) const {
        return root_->get<T>(key);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return root_->has(key);
    }

    void remove(const std::string& key) {
        root_->remove(key);
    }

    void clear() {
        root_ = ConfigNode::create();
    }

private:
    Config() : root_(ConfigNode::create()) {}
    ConfigNodePtr root_;
};

inline Config& config() {
    return Config::instance();
}

} // namespace peerlink::core
