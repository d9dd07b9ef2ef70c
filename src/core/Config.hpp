#pragma once

/**
 * Config.hpp
 * 
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace fastget::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 * 
 * Manages tool settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * 
 * Only the command-line front end reads it; the download engine receives
 * its settings explicitly.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }
    
    /**
     * Load configuration from file
     * 
     * Values in the file are merged over the defaults, so a partial file
     * only overrides the keys it names.
     * 
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            if (!std::filesystem::exists(path)) {
                m_lastError = "missing config file: " + path;
                return false;
            }
            
            std::ifstream file(path);
            if (!file.is_open()) {
                m_lastError = "cannot open config file: " + path;
                return false;
            }
            
            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                m_lastError = "invalid config json: top level must be an object";
                return false;
            }
            
            m_config = defaults();
            m_config.merge_patch(loaded);
            m_configPath = path;
            m_lastError.clear();
            return true;
            
        } catch (const json::exception& e) {
            m_lastError = std::string("invalid config json: ") + e.what();
            return false;
        }
    }
    
    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }
        
        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            
            std::ofstream file(savePath);
            if (!file.is_open()) {
                m_lastError = "cannot write config file: " + savePath;
                return false;
            }
            
            file << m_config.dump(4);
            m_configPath = savePath;
            return true;
            
        } catch (const std::exception& e) {
            m_lastError = e.what();
            return false;
        }
    }
    
    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }
    
    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "download.workers")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type in the file, fall through to default
        }
        
        return defaultValue;
    }
    
    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "http.timeoutSeconds")
     * @param value Value to set
     * @return false if the key is not a valid path
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception& e) {
            m_lastError = e.what();
            return false;
        }
    }
    
    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            json::json_pointer ptr = toJsonPointer(key);
            return m_config.contains(ptr);
        } catch (const json::exception&) {
            return false;
        }
    }
    
    /**
     * Get entire configuration as JSON
     * @return JSON configuration object
     */
    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }
    
    std::string lastError() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastError;
    }
    
    std::string path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_configPath;
    }

private:
    Config() {
        m_config = defaults();
    }
    
    ~Config() = default;
    
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    
    static json defaults() {
        return {
            {"version", "1.0.0"},
            {"download", {
                {"workers", 1},
                {"writeBlockSize", 64 * 1024},
                {"unknownLengthReserve", 16 * 1024 * 1024}
            }},
            {"http", {
                {"userAgent", "fastget/1.0"},
                {"timeoutSeconds", 0},
                {"connectTimeoutSeconds", 0},
                {"verifySSL", true}
            }},
            {"mirror", {
                {"maxDepth", 8}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }
    
    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
    std::string m_lastError;
};

} // namespace fastget::core
