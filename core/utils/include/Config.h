#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace DriveSync {

    /**
     * @brief key=value configuration store.
     *
     * Lines starting with '#' are comments. Later files in loadLayered()
     * override earlier ones unless overrideExisting is false. Unlike the
     * process-wide Logger, Config is an ordinary value so tests and the
     * daemon can hold independent instances.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;
        Config(const Config& other);
        Config& operator=(const Config& other);

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;
        std::vector<std::string> keysWithPrefix(const std::string& prefix) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        double getDouble(const std::string& key, double defaultValue = 0.0) const;
        void setDouble(const std::string& key, double value);

        /**
         * @brief Comma-separated list, entries trimmed, empty entries dropped
         */
        std::vector<std::string> getList(const std::string& key) const;

        /**
         * @brief Run validators against present keys
         * @param failedKey Receives the first key that failed, if any
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

        static std::string trim(const std::string& value);

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
