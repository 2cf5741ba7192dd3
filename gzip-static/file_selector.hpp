#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <cstdint>
#include "extension_pattern.hpp"

struct FileSelector
{
  typedef std::function<bool(const std::filesystem::path&)> Callback;

  std::filesystem::path         root;
  ExtensionPatterns             includes;
  ExtensionPatterns             excludes;
  std::optional<std::uintmax_t> min_length;

  FileSelector(const std::filesystem::path& root, const std::vector<std::string>& include_types, const std::vector<std::string>& exclude_types, std::optional<std::uintmax_t> min_length) :
    root(root),
    includes(make_extension_patterns(include_types)),
    excludes(make_extension_patterns(exclude_types)),
    min_length(min_length)
  {
  }

  bool matches_name(const std::string& filename) const;
  bool matches_size(std::uintmax_t size) const { return !min_length || size > *min_length; }

  // Walks `root` and calls `callback` for each eligible regular file.
  // Returns false when the walk fails. The callback may return false to stop
  // the walk early, in which case `stopped` is set.
  bool collect_files(Callback callback, bool& stopped) const;

  bool collect_files(std::vector<std::filesystem::path>& files) const;

protected:
  bool is_eligible(const std::filesystem::directory_entry& entry) const;
};
