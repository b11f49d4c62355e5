#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;

static inline std::string TrimWhitespace(const std::string& input) {
  size_t start = 0, end = input.size();
  while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
  return input.substr(start, end - start);
}

// KEY="value" and KEY='value' are accepted as well as bare values.
static inline std::string Unquote(const std::string& v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
    return v.substr(1, v.size() - 2);
  return v;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    Logger::Debug("no env file at " + env_path + ", using process environment only");
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = TrimWhitespace(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = Unquote(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  return std::nullopt;
}

std::string ConfigManager::GetOr(const std::string& key, const std::string& default_value) {
  auto v = Get(key);
  if (!v || v->empty()) return default_value;
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    return std::stoi(*v);
  } catch (const std::exception&) {
    Logger::Warning("ignoring non-integer config value for " + key);
    return default_value;
  }
}

int ConfigManager::GetPositiveIntOr(const std::string& key, int default_value) {
  int v = GetIntOr(key, default_value);
  if (v > 0) return v;
  Logger::Warning("ignoring non-positive config value for " + key);
  return default_value;
}
