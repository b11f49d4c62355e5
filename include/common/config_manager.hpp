#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Process-wide key/value configuration. Values come from a .env file first and
// fall back to the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOr(const std::string& key, const std::string& default_value);
  static int GetIntOr(const std::string& key, int default_value);
  // Zero and negative values fall back to default_value with a warning.
  static int GetPositiveIntOr(const std::string& key, int default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
