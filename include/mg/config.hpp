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
 * @brief Multi-format configuration store with tag-dispatched backends.
 *
 * Every format is flattened into "section / key = value" entries held in a
 * fixed-capacity ConfigStore. Typed option structs are built on top of the
 * store by resilience_config.hpp.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih           (MG_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (MG_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (MG_CONFIG_YAML_ENABLED)
 *
 * Usage:
 * @code
 *   mg::MultiConfig cfg;
 *   if (cfg.LoadFile("/etc/meshguard.ini").has_value()) {
 *     int32_t retries = cfg.GetInt("serial", "max_retries", 5);
 *   }
 * @endcode
 */

#ifndef MG_CONFIG_HPP_
#define MG_CONFIG_HPP_

#include "mg/platform.hpp"
#include "mg/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef MG_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef MG_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef MG_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef MG_CONFIG_MAX_FILE_SIZE
#define MG_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace mg {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
  }
  return *a == *b;
}

inline void CopyBounded(char* dst, const char* src, uint32_t dst_size) noexcept {
  uint32_t i = 0;
  if (src != nullptr) {
    for (; i + 1U < dst_size && src[i] != '\0'; ++i) dst[i] = src[i];
  }
  dst[i] = '\0';
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf") ||
           detail::CaseEqual(ext, "cfg");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat, case-insensitive section/key/value table.
 *
 * Lookups return the caller's default when a key is absent or does not parse.
 * The Find* variants distinguish "absent" from "present" so callers can
 * validate ranges only for keys the operator actually set.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 96;
  static constexpr uint32_t kMaxNameLen = 48;
  static constexpr uint32_t kMaxValueLen = 192;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Lookup(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    return FindDouble(section, key).value_or(default_val);
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);  // NOLINT
    if (end == e->value) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  optional<double> FindDouble(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    if (end == e->value) return {};
    return optional<double>(val);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = Lookup(section, key);
    if (e == nullptr) return {};
    const char* v = e->value;
    if (detail::CaseEqual(v, "true") || detail::CaseEqual(v, "yes") ||
        detail::CaseEqual(v, "on") || detail::CaseEqual(v, "1")) {
      return optional<bool>(true);
    }
    if (detail::CaseEqual(v, "false") || detail::CaseEqual(v, "no") ||
        detail::CaseEqual(v, "off") || detail::CaseEqual(v, "0")) {
      return optional<bool>(false);
    }
    return {};
  }

  bool HasKey(const char* section, const char* key) const {
    return Lookup(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /** @brief Insert or overwrite one entry. Returns false when the table is full. */
  bool Set(const char* section, const char* key, const char* value) {
    Entry* e = LookupMut(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      detail::CopyBounded(e->section, section, kMaxNameLen);
      detail::CopyBounded(e->key, key, kMaxNameLen);
    }
    detail::CopyBounded(e->value, value, kMaxValueLen);
    return true;
  }

 protected:
  static expected<uint32_t, ConfigError> Slurp(const char* path, char* buf,
                                               uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t n = std::fread(buf, 1, buf_size - 1U, f);
    bool truncated = (n == buf_size - 1U) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

 private:
  struct Entry {
    char section[kMaxNameLen];
    char key[kMaxNameLen];
    char value[kMaxValueLen];
  };

  const Entry* Lookup(const char* section, const char* key) const {
    MG_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* LookupMut(const char* section, const char* key) {
    return const_cast<Entry*>(Lookup(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Unspecialized backend: the format was not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef MG_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    return ToResult(ini_parse(path, &OnEntry, &store), true);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    return ToResult(ini_parse_string(data, &OnEntry, &store), false);
  }

 private:
  static expected<void, ConfigError> ToResult(int rc, bool from_file) {
    if (rc == 0) return expected<void, ConfigError>::success();
    if (rc == -1 && from_file) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }

  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Set(section != nullptr ? section : "",
                      name != nullptr ? name : "",
                      value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef MG_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MG_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::Slurp(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!Store(store, "", sec.key(), *sec)) return Full();
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!Store(store, sec.key(), kv.key(), *kv)) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static bool Store(ConfigStore& store, const std::string& section,
                    const std::string& key, const nlohmann::json& node) {
    char text[ConfigStore::kMaxValueLen];
    if (node.is_string()) {
      detail::CopyBounded(text, node.get_ref<const std::string&>().c_str(),
                          sizeof(text));
    } else if (node.is_boolean()) {
      detail::CopyBounded(text, node.get<bool>() ? "true" : "false",
                          sizeof(text));
    } else if (node.is_number_integer()) {
      (void)std::snprintf(text, sizeof(text), "%lld",
                          static_cast<long long>(node.get<int64_t>()));
    } else if (node.is_number_float()) {
      (void)std::snprintf(text, sizeof(text), "%g", node.get<double>());
    } else {
      detail::CopyBounded(text, node.dump().c_str(), sizeof(text));
    }
    return store.Set(section.c_str(), key.c_str(), text);
  }
};
#endif

#ifdef MG_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[MG_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::Slurp(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    fkyaml::node root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      std::string sec_name = sec.key().get_value<std::string>();
      fkyaml::node& body = *sec;
      if (!body.is_mapping()) {
        if (!Store(store, "", sec_name, body)) return Full();
        continue;
      }
      for (auto kv = body.begin(); kv != body.end(); ++kv) {
        if (!Store(store, sec_name, kv.key().get_value<std::string>(), *kv)) {
          return Full();
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static bool Store(ConfigStore& store, const std::string& section,
                    const std::string& key, const fkyaml::node& node) {
    char text[ConfigStore::kMaxValueLen];
    text[0] = '\0';
    if (node.is_string()) {
      detail::CopyBounded(text, node.get_value<std::string>().c_str(),
                          sizeof(text));
    } else if (node.is_boolean()) {
      detail::CopyBounded(text, node.get_value<bool>() ? "true" : "false",
                          sizeof(text));
    } else if (node.is_integer()) {
      (void)std::snprintf(text, sizeof(text), "%lld",
                          static_cast<long long>(node.get_value<int64_t>()));
    } else if (node.is_float_number()) {
      (void)std::snprintf(text, sizeof(text), "%g", node.get_value<double>());
    }
    return store.Set(section.c_str(), key.c_str(), text);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

  using Fallback = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    MG_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      const char* ext = Extension(path);
      format = (ext != nullptr) ? Detect<Backends...>(ext) : Fallback::kFormat;
    }
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    MG_ASSERT(data != nullptr);
    return ParseBufferAs<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  static ConfigFormat Detect(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return Detect<Rest...>(ext);
    } else {
      return Fallback::kFormat;
    }
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) {
      return ParseFileAs<Rest...>(path, format);
    } else {
      return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    }
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseBufferAs(const char* data, uint32_t size,
                                            ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return ParseBufferAs<Rest...>(data, size, format);
    } else {
      return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    }
  }
};

// ============================================================================
// Aliases
// ============================================================================

#ifdef MG_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef MG_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef MG_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

#if defined(MG_CONFIG_INI_ENABLED) && defined(MG_CONFIG_JSON_ENABLED) && \
    defined(MG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
#elif defined(MG_CONFIG_INI_ENABLED) && defined(MG_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(MG_CONFIG_INI_ENABLED) && defined(MG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, YamlBackend>;
#elif defined(MG_CONFIG_JSON_ENABLED) && defined(MG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<JsonBackend, YamlBackend>;
#elif defined(MG_CONFIG_INI_ENABLED)
using MultiConfig = Config<IniBackend>;
#elif defined(MG_CONFIG_JSON_ENABLED)
using MultiConfig = Config<JsonBackend>;
#elif defined(MG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<YamlBackend>;
#endif

}  // namespace mg

#endif  // MG_CONFIG_HPP_
