// rvir/project/tool_config.hpp - Tool configuration (rvir.yaml)
//
// Parses and validates rvir.yaml files for the command-line tool.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "rvir/store/value_store.hpp"

namespace rvir
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat {
  Text,
  Json,
};

enum class ColorMode {
  Auto,
  Always,
  Never,
};

/**
 * Store section.
 */
struct StoreConfig
{
  /// Shards per interning table (power of two)
  size_t shards = k_default_shard_count;

  [[nodiscard]] StoreOptions to_options() const { return StoreOptions{shards}; }
};

/**
 * Output section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete tool configuration (rvir.yaml).
 */
struct ToolConfig
{
  StoreConfig store;
  OutputConfig output;

  /// Directory containing rvir.yaml (empty for the built-in defaults)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a tool configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ToolConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ToolConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a tool configuration from an rvir.yaml file.
 *
 * Missing sections and keys keep their defaults.
 *
 * @param config_path Path to rvir.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_tool_config(const std::filesystem::path & config_path);

/**
 * Find a tool configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to rvir.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_tool_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the tool configuration file.
 */
inline constexpr const char * k_tool_config_file_name = "rvir.yaml";

}  // namespace rvir
