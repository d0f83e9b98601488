// treecoder/io/config_loader.hpp - Typed configuration files
//
// Loads a YAML or JSON file into a Value tree and decodes it into a
// configuration structure. Designed for reuse by any tool that reads typed
// configuration.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

#include "treecoder/basic/value.hpp"
#include "treecoder/decoder/decoder.hpp"
#include "treecoder/decoder/decoding.hpp"
#include "treecoder/io/load_result.hpp"

namespace treecoder
{

enum class DocumentFormat : uint8_t {
  Yaml,
  Json,
};

/**
 * Determine the document format from a file extension.
 *
 * @return Yaml for .yaml/.yml, Json for .json, std::nullopt otherwise
 */
[[nodiscard]] std::optional<DocumentFormat> detect_format(const std::filesystem::path & path);

/**
 * Load a YAML or JSON file into a Value.
 *
 * @param path Path to a .yaml, .yml or .json file
 * @return LoadResult with the value tree or an error message
 */
[[nodiscard]] LoadResult<Value> load_value_file(const std::filesystem::path & path);

/**
 * Load a configuration file and decode it into T.
 *
 * Decode failures keep their DecodeError in LoadResult::decode_error.
 */
template <typename T>
[[nodiscard]] LoadResult<T> load_config(const std::filesystem::path & path)
{
  auto loaded = load_value_file(path);
  if (!loaded.success) {
    return LoadResult<T>::fail(std::move(loaded.error));
  }

  auto decoded = decode<T>(loaded.value);
  if (!decoded) {
    return LoadResult<T>::fail(std::move(decoded).error());
  }
  return LoadResult<T>::ok(std::move(decoded).value());
}

/**
 * Find a configuration file by searching upward from a directory.
 *
 * Searches for file_name starting from start_dir and moving up the
 * directory hierarchy until the filesystem root.
 *
 * @param start_dir Directory (or file) to start searching from
 * @param file_name Name of the configuration file
 * @return Path to the file if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_config_file(
  const std::filesystem::path & start_dir, std::string_view file_name);

}  // namespace treecoder
