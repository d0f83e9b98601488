// treecoder/io/config_loader.cpp - Configuration file loading
//
#include "treecoder/io/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

#include "treecoder/io/json_value.hpp"
#include "treecoder/io/yaml_value.hpp"

namespace treecoder
{

std::optional<DocumentFormat> detect_format(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (ext == ".yaml" || ext == ".yml") return DocumentFormat::Yaml;
  if (ext == ".json") return DocumentFormat::Json;
  return std::nullopt;
}

LoadResult<Value> load_value_file(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(path)) {
    return LoadResult<Value>::fail("configuration file not found: " + path.string());
  }

  const auto format = detect_format(path);
  if (!format) {
    return LoadResult<Value>::fail(
      "unsupported file extension '" + path.extension().string() +
      "' (expected .yaml, .yml or .json)");
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return LoadResult<Value>::fail("failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string text = buffer.str();

  switch (*format) {
    case DocumentFormat::Yaml:
      return parse_yaml(text);
    case DocumentFormat::Json:
      return parse_json(text);
  }
  return LoadResult<Value>::fail("unsupported document format");
}

std::optional<std::filesystem::path> find_config_file(
  const std::filesystem::path & start_dir, std::string_view file_name)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / fs::path(std::string(file_name));
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace treecoder
