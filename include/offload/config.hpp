/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Multi-format engine configuration with compile-time backend choice.
 *
 * Every format is flattened to "section + key = value". Backends are enabled
 * by the build:
 *   - IniBackend  : inih          (OFFLOAD_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (OFFLOAD_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (OFFLOAD_CONFIG_YAML_ENABLED)
 *
 * LoadPoolConfig() / LoadPipelineConfig() map a section onto the engine's
 * config structs, keeping defaults for absent keys:
 *
 * @code
 *   offload::Config<offload::IniBackend> cfg;
 *   if (cfg.LoadFile("engine.ini").has_value()) {
 *     auto pool_cfg = offload::LoadPoolConfig(cfg, "token_pool");
 *   }
 * @endcode
 */

#ifndef OFFLOAD_CONFIG_HPP_
#define OFFLOAD_CONFIG_HPP_

#include "offload/discrete_pool.hpp"
#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/stream_pipeline.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef OFFLOAD_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef OFFLOAD_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef OFFLOAD_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace offload {

// ============================================================================
// ConfigFormat / ConfigError
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
};

inline const char* ConfigErrorName(ConfigError err) noexcept {
  switch (err) {
    case ConfigError::kFileNotFound:
      return "file_not_found";
    case ConfigError::kParseError:
      return "parse_error";
    case ConfigError::kFormatNotSupported:
      return "format_not_supported";
  }
  return "unknown";
}

// ============================================================================
// Backend Tags
// ============================================================================

namespace detail {

inline bool CaseEqual(const std::string& a, const std::string& b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0U; i < a.size(); ++i) {
    const char la = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
    const char lb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
    if (la != lb) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/// @brief Flat section/key/value store shared by every backend.
class ConfigStore {
 public:
  /// @brief Insert or overwrite a value (section and key match case-insensitively).
  void Set(const std::string& section, const std::string& key,
           const std::string& value) {
    for (auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) && detail::CaseEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  /// @return nullopt when absent, not a number, or negative.
  std::optional<uint32_t> FindUint(const std::string& section,
                                   const std::string& key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr || e->value.empty()) {
      return std::nullopt;
    }
    char* end = nullptr;
    const long long val = std::strtoll(e->value.c_str(), &end, 10);
    if (end == e->value.c_str() || *end != '\0' || val < 0 || val > UINT32_MAX) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(val);
  }

  uint32_t GetUint(const std::string& section, const std::string& key,
                   uint32_t default_val = 0U) const {
    return FindUint(section, key).value_or(default_val);
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return default_val;
    }
    return detail::CaseEqual(e->value, "true") || e->value == "1" ||
           detail::CaseEqual(e->value, "yes") || detail::CaseEqual(e->value, "on");
  }

  bool HasSection(const std::string& section) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section)) {
        return true;
      }
    }
    return false;
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string data;
    char buf[4096];
    size_t n = 0U;
    while ((n = std::fread(buf, 1U, sizeof(buf), f)) > 0U) {
      data.append(buf, n);
    }
    (void)std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  static std::string Extension(const std::string& path) {
    const size_t dot = path.find_last_of('.');
    return (dot == std::string::npos) ? std::string() : path.substr(dot + 1U);
  }

 private:
  const Entry* FindEntry(const std::string& section, const std::string& key) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) && detail::CaseEqual(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  std::vector<Entry> entries_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Disabled backend: reports kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef OFFLOAD_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    store->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

#ifdef OFFLOAD_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& data) {
    auto root = nlohmann::json::parse(data, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) {
      return n.get<std::string>();
    }
    if (n.is_boolean()) {
      return n.get<bool>() ? "true" : "false";
    }
    if (n.is_number_integer()) {
      return std::to_string(n.get<int64_t>());
    }
    return n.dump();
  }
};
#endif

#ifdef OFFLOAD_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.Set(section, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.Set("", section, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) {
      return n.get_value<std::string>();
    }
    if (n.is_boolean()) {
      return n.get_value<bool>() ? "true" : "false";
    }
    if (n.is_integer()) {
      return std::to_string(n.get_value<int64_t>());
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const std::string& path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    auto data = ReadFile(path);
    if (!data.has_value()) {
      OFFLOAD_LOG_WARN("Config", "cannot open %s", path.c_str());
      return expected<void, ConfigError>::error(data.get_error());
    }
    if (format == ConfigFormat::kAuto) {
      format = DetectExt<Backends...>(Extension(path));
    }
    auto r = Dispatch<Backends...>(data.value(), format);
    if (!r.has_value()) {
      OFFLOAD_LOG_WARN("Config", "failed to load %s: %s", path.c_str(),
                       ConfigErrorName(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return Dispatch<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& data,
                                       ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::Parse(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(data, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const {
    if (First::MatchesExtension(ext)) {
      return First::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

#if defined(OFFLOAD_CONFIG_INI_ENABLED) && defined(OFFLOAD_CONFIG_JSON_ENABLED) && \
    defined(OFFLOAD_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
#endif

// ============================================================================
// Engine Config Mapping
// ============================================================================

/// @brief Read a pool section; absent or malformed keys keep their defaults.
inline DiscretePoolConfig LoadPoolConfig(const ConfigStore& store,
                                         const std::string& section,
                                         DiscretePoolConfig base = {}) {
  base.pool_size = store.GetUint(section, "pool_size", base.pool_size);
  base.operation_timeout_ms =
      store.GetUint(section, "operation_timeout_ms", base.operation_timeout_ms);
  base.init_timeout_ms =
      store.GetUint(section, "init_timeout_ms", base.init_timeout_ms);
  base.health_check_timeout_ms = store.GetUint(section, "health_check_timeout_ms",
                                               base.health_check_timeout_ms);
  base.health_interval_ms =
      store.GetUint(section, "health_interval_ms", base.health_interval_ms);
  base.queue_max_size = store.GetUint(section, "queue_max_size", base.queue_max_size);
  base.failure_window_ms =
      store.GetUint(section, "failure_window_ms", base.failure_window_ms);
  base.max_failures_in_window = store.GetUint(section, "max_failures_in_window",
                                              base.max_failures_in_window);
  if (base.pool_size == 0U) {
    OFFLOAD_LOG_WARN("Config", "[%s] pool_size 0 ignored, using 1", section.c_str());
    base.pool_size = 1U;
  }
  return base;
}

inline StreamPipelineConfig LoadPipelineConfig(const ConfigStore& store,
                                               const std::string& section,
                                               StreamPipelineConfig base = {}) {
  base.init_timeout_ms = store.GetUint(section, "init_timeout_ms", base.init_timeout_ms);
  base.cancel_timeout_ms =
      store.GetUint(section, "cancel_timeout_ms", base.cancel_timeout_ms);
  return base;
}

}  // namespace offload

#endif  // OFFLOAD_CONFIG_HPP_
