#include "file_selector.hpp"
#include <iostream>

extern bool verbose_mode;

bool FileSelector::matches_name(const std::string& filename) const
{
  if (matches_any(excludes, filename))
    return false;
  return includes.size() == 0 || matches_any(includes, filename);
}

bool FileSelector::is_eligible(const std::filesystem::directory_entry& entry) const
{
  std::error_code error_code;
  auto status = entry.symlink_status(error_code);
  std::uintmax_t size;

  if (error_code || !std::filesystem::is_regular_file(status))
    return false;
  if (!matches_name(entry.path().filename().string()))
    return false;
  if (!min_length)
    return true;
  size = entry.file_size(error_code);
  if (error_code)
  {
    std::cerr << "[gzip-static] skipping `" << entry.path().string() << "`: " << error_code.message() << std::endl;
    return false;
  }
  return matches_size(size);
}

bool FileSelector::collect_files(Callback callback, bool& stopped) const
{
  std::error_code error_code;
  std::filesystem::recursive_directory_iterator dir(root, error_code);
  std::filesystem::recursive_directory_iterator end;

  stopped = false;
  if (error_code)
  {
    std::cerr << "Cannot traverse directory `" << root.string() << "`: " << error_code.message() << std::endl;
    return false;
  }
  if (verbose_mode)
    std::cout << "[gzip-static] collecting files from directory: " << root.string() << std::endl;
  while (dir != end)
  {
    if (is_eligible(*dir) && !callback(dir->path()))
    {
      stopped = true;
      return true;
    }
    dir.increment(error_code);
    if (error_code)
    {
      std::cerr << "Traversal of `" << root.string() << "` failed: " << error_code.message() << std::endl;
      return false;
    }
  }
  return true;
}

bool FileSelector::collect_files(std::vector<std::filesystem::path>& files) const
{
  bool stopped;

  return collect_files([&files](const std::filesystem::path& path) -> bool
  {
    files.push_back(path);
    return true;
  }, stopped);
}
