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
 * @file evr/config.hpp
 * @brief Runtime settings for evr loaded from INI, JSON or YAML.
 *
 * Backends are enabled at build time:
 *   EVR_CONFIG_INI_ENABLED   inih        (ini.h)
 *   EVR_CONFIG_JSON_ENABLED  nlohmann    (nlohmann/json.hpp)
 *   EVR_CONFIG_YAML_ENABLED  fkYAML      (fkYAML/node.hpp)
 *
 * Recognized settings:
 *   [log]   level = debug | info | warn | error | fatal | off
 *   [pool]  name = <string>, workers = <uint>, priority = <int>
 *   [async] log_observed_faults = <bool>
 *
 * Usage:
 *   evr::Config<evr::IniBackend> cfg;
 *   if (cfg.LoadFile("evr.ini").has_value()) {
 *     auto rc = evr::LoadRuntimeConfig(cfg);
 *     if (rc.has_value()) evr::ApplyRuntimeConfig(rc.value());
 *   }
 */

#ifndef EVR_CONFIG_HPP_
#define EVR_CONFIG_HPP_

#include "evr/fault.hpp"
#include "evr/log.hpp"
#include "evr/platform.hpp"
#include "evr/task_pool.hpp"
#include "evr/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>
#include <vector>

#ifdef EVR_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef EVR_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef EVR_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace evr {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  const char* slash = std::strrchr(path, '/');
  if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
  return dot + 1;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - flat (section, key) -> value table
// ============================================================================

#ifndef EVR_CONFIG_MAX_ENTRIES
#define EVR_CONFIG_MAX_ENTRIES 64U
#endif

class ConfigStore {
 public:
  static constexpr uint32_t kMaxNameLen = 47U;
  static constexpr uint32_t kMaxValueLen = 127U;

  /// Value of section.key, or @p fallback when absent.
  const char* GetString(const char* section, const char* key, const char* fallback = "") const noexcept {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value.c_str() : fallback;
  }

  /// Integer value; absent or unparsable yields @p fallback.
  int32_t GetInt(const char* section, const char* key, int32_t fallback = 0) const noexcept {
    auto r = FindInt(section, key);
    return r.has_value() ? r.value() : fallback;
  }

  bool GetBool(const char* section, const char* key, bool fallback = false) const noexcept {
    auto r = FindBool(section, key);
    return r.has_value() ? r.value() : fallback;
  }

  /// kInvalidValue when absent, not a number or outside the int32_t range.
  expected<int32_t, ConfigError> FindInt(const char* section, const char* key) const noexcept {
    const Entry* e = Find(section, key);
    if (e == nullptr || e->value.empty()) {
      return expected<int32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str() || *end != '\0' || errno == ERANGE || v < INT32_MIN || v > INT32_MAX) {
      return expected<int32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<int32_t, ConfigError>::success(static_cast<int32_t>(v));
  }

  expected<bool, ConfigError> FindBool(const char* section, const char* key) const noexcept {
    const Entry* e = Find(section, key);
    if (e == nullptr) {
      return expected<bool, ConfigError>::error(ConfigError::kInvalidValue);
    }
    const char* v = e->value.c_str();
    if (detail::CaseEqual(v, "true") || detail::CaseEqual(v, "yes") || detail::CaseEqual(v, "on") ||
        detail::CaseEqual(v, "1")) {
      return expected<bool, ConfigError>::success(true);
    }
    if (detail::CaseEqual(v, "false") || detail::CaseEqual(v, "no") || detail::CaseEqual(v, "off") ||
        detail::CaseEqual(v, "0")) {
      return expected<bool, ConfigError>::success(false);
    }
    return expected<bool, ConfigError>::error(ConfigError::kInvalidValue);
  }

  bool HasKey(const char* section, const char* key) const noexcept { return Find(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  /// Inserts or overwrites section.key. False when the table is full.
  bool Set(const char* section, const char* key, const char* value) {
    for (auto& e : entries_) {
      if (Matches(e, section, key)) {
        e.value.assign(TruncateToCapacity, value);
        return true;
      }
    }
    if (entries_.size() >= EVR_CONFIG_MAX_ENTRIES) {
      return false;
    }
    entries_.push_back(Entry{FixedString<kMaxNameLen>(TruncateToCapacity, section),
                             FixedString<kMaxNameLen>(TruncateToCapacity, key),
                             FixedString<kMaxValueLen>(TruncateToCapacity, value)});
    return true;
  }

 protected:
  struct Entry {
    FixedString<kMaxNameLen> section;
    FixedString<kMaxNameLen> key;
    FixedString<kMaxValueLen> value;
  };

  static bool Matches(const Entry& e, const char* section, const char* key) noexcept {
    return detail::CaseEqual(e.section.c_str(), section) && detail::CaseEqual(e.key.c_str(), key);
  }

  const Entry* Find(const char* section, const char* key) const noexcept {
    EVR_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (Matches(e, section, key)) return &e;
    }
    return nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string text;
    char chunk[1024];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      text.append(chunk, n);
    }
    (void)std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(text));
  }

  std::vector<Entry> entries_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backend compiled out: every load reports kFormatNotSupported.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef EVR_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    const int rc = ini_parse_string(text.c_str(), &OnEntry, &store);
    if (rc != 0) {
      EVR_LOG_WARN("Config", "INI parse error at line %d", rc);
      return expected<void, ConfigError>::error(rc > 0 ? ConfigError::kParseError : ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section != nullptr ? section : "", name != nullptr ? name : "", value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef EVR_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    const auto root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!store.Set("", sec.key().c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!store.Set(sec.key().c_str(), kv.key().c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& node) {
    if (node.is_string()) return node.get<std::string>();
    if (node.is_boolean()) return node.get<bool>() ? "true" : "false";
    return node.dump();
  }
};
#endif

#ifdef EVR_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception& e) {
      EVR_LOG_WARN("Config", "YAML parse error: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string section = it.key().get_value<std::string>();
      const fkyaml::node& node = *it;
      if (!node.is_mapping()) {
        if (!store.Set("", section.c_str(), Scalar(node).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = node.begin(); kv != node.end(); ++kv) {
        const std::string key = kv.key().get_value<std::string>();
        if (!store.Set(section.c_str(), key.c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& node) {
    if (node.is_string()) return node.get_value<std::string>();
    if (node.is_boolean()) return node.get_value<bool>() ? "true" : "false";
    if (node.is_integer()) return std::to_string(node.get_value<int64_t>());
    if (node.is_float_number()) return std::to_string(node.get_value<double>());
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
  /// Loads @p path; kAuto picks the backend from the file extension.
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    EVR_ASSERT(path != nullptr);
    auto text = ReadFile(path);
    if (!text.has_value()) {
      EVR_LOG_WARN("Config", "cannot open %s", path);
      return expected<void, ConfigError>::error(text.get_error());
    }
    if (format == ConfigFormat::kAuto) {
      format = Detect(path);
    }
    return Dispatch<Backends...>(text.value(), format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    EVR_ASSERT(data != nullptr);
    return Dispatch<Backends...>(std::string(data, size), format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& text, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::Parse(*this, text);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(text, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  static ConfigFormat Detect(const char* path) noexcept {
    const char* ext = detail::FileExtension(path);
    return (ext != nullptr) ? DetectExt<Backends...>(ext) : Head::kFormat;
  }

  template <typename First, typename... Rest>
  static ConfigFormat DetectExt(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// RuntimeConfig
// ============================================================================

/// Settings consumed by the library itself.
struct RuntimeConfig {
#ifdef NDEBUG
  log::Level log_level{log::Level::kInfo};
#else
  log::Level log_level{log::Level::kDebug};
#endif
  TaskPoolConfig pool{};
  bool log_observed_faults{true};
};

/**
 * @brief Reads RuntimeConfig from @p store; absent keys keep their defaults.
 *
 * @return kInvalidValue when a present key cannot be parsed.
 */
inline expected<RuntimeConfig, ConfigError> LoadRuntimeConfig(const ConfigStore& store) {
  using Result = expected<RuntimeConfig, ConfigError>;
  RuntimeConfig rc;

  if (store.HasKey("log", "level")) {
    if (!log::ParseLevel(store.GetString("log", "level"), rc.log_level)) {
      EVR_LOG_WARN("Config", "invalid log.level '%s'", store.GetString("log", "level"));
      return Result::error(ConfigError::kInvalidValue);
    }
  }

  if (store.HasKey("pool", "name")) {
    rc.pool.name.assign(TruncateToCapacity, store.GetString("pool", "name"));
  }
  if (store.HasKey("pool", "workers")) {
    auto workers = store.FindInt("pool", "workers");
    if (!workers.has_value() || workers.value() < 0) {
      EVR_LOG_WARN("Config", "invalid pool.workers '%s'", store.GetString("pool", "workers"));
      return Result::error(ConfigError::kInvalidValue);
    }
    rc.pool.worker_num = static_cast<uint32_t>(workers.value());
  }
  if (store.HasKey("pool", "priority")) {
    auto prio = store.FindInt("pool", "priority");
    if (!prio.has_value()) {
      return Result::error(ConfigError::kInvalidValue);
    }
    rc.pool.priority = prio.value();
  }

  if (store.HasKey("async", "log_observed_faults")) {
    auto flag = store.FindBool("async", "log_observed_faults");
    if (!flag.has_value()) {
      return Result::error(ConfigError::kInvalidValue);
    }
    rc.log_observed_faults = flag.value();
  }
  return Result::success(rc);
}

/**
 * @brief Applies @p rc: log level, async fault logging and the default pool.
 *
 * @return false when the default pool already exists and its configuration
 *         could not be changed (other settings are still applied).
 */
inline bool ApplyRuntimeConfig(const RuntimeConfig& rc) {
  log::SetLevel(rc.log_level);
  SetLogObservedFaults(rc.log_observed_faults);
  if (!TaskPool::ConfigureDefault(rc.pool)) {
    EVR_LOG_WARN("Config", "default pool already running, [pool] settings ignored");
    return false;
  }
  return true;
}

}  // namespace evr

#endif  // EVR_CONFIG_HPP_
