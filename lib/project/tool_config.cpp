// rvir/project/tool_config.cpp - Tool configuration implementation
//
#include "rvir/project/tool_config.hpp"

#include <yaml-cpp/yaml.h>

namespace rvir
{

namespace
{

bool is_power_of_two(long long n) { return n > 0 && (n & (n - 1)) == 0; }

/// Parse the 'store' section
std::optional<std::string> parse_store(const YAML::Node & node, StoreConfig & store)
{
  if (!node.IsMap()) {
    return "store must be a map";
  }
  if (node["shards"]) {
    const auto shards = node["shards"].as<long long>();
    if (!is_power_of_two(shards)) {
      return "store.shards must be a positive power of two (got " + std::to_string(shards) + ")";
    }
    if (static_cast<unsigned long long>(shards) > k_max_shard_count) {
      return "store.shards must not exceed " + std::to_string(k_max_shard_count) + " (got " +
             std::to_string(shards) + ")";
    }
    store.shards = static_cast<size_t>(shards);
  }
  return std::nullopt;
}

/// Parse the 'output' section
std::optional<std::string> parse_output(const YAML::Node & node, OutputConfig & output)
{
  if (!node.IsMap()) {
    return "output must be a map";
  }
  if (node["format"]) {
    const auto format = node["format"].as<std::string>();
    if (format == "text") {
      output.format = OutputFormat::Text;
    } else if (format == "json") {
      output.format = OutputFormat::Json;
    } else {
      return "invalid output.format: '" + format + "' (must be 'text' or 'json')";
    }
  }
  if (node["color"]) {
    const auto color = node["color"].as<std::string>();
    if (color == "auto") {
      output.color = ColorMode::Auto;
    } else if (color == "always") {
      output.color = ColorMode::Always;
    } else if (color == "never") {
      output.color = ColorMode::Never;
    } else {
      return "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')";
    }
  }
  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_tool_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ToolConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  // An empty document keeps every default
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    if (root["store"]) {
      if (auto error = parse_store(root["store"], config.store)) {
        return ConfigLoadResult::fail(*error);
      }
    }
    if (root["output"]) {
      if (auto error = parse_output(root["output"], config.output)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  } catch (const YAML::Exception & e) {
    // Scalar conversions (e.g. a non-numeric shard count)
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_tool_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_tool_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace rvir
