#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

extern const std::vector<std::string> default_types;
extern const std::vector<std::string> default_commands;
extern const std::uintmax_t default_min_length;
extern const std::string compressed_extension;

struct Configuration
{
  std::filesystem::path        root;
  std::vector<std::string>     include_types = default_types;
  std::vector<std::string>     exclude_types;
  std::optional<std::uintmax_t> min_length = default_min_length;
  std::vector<std::string>     command_candidates = default_commands;
};
