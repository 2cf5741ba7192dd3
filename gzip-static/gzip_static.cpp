#include "gzip_static.hpp"
#include "file_selector.hpp"
#include <algorithm>
#include <iostream>

bool verbose_mode = false;

const std::vector<std::string> default_types{
  "html", "htm", "?html", "txt", "css", "js", "xml", "rss", "atom", "svg", "mml", "kml"
};
const std::vector<std::string> default_commands{
  "zopfli",
  "gzip -kf9"
};
const std::uintmax_t default_min_length = 50;
const std::string compressed_extension = ".gz";

bool validate_root(const Configuration& configuration)
{
  std::error_code error_code;

  if (configuration.root.empty())
    std::cerr << "missing directory argument" << std::endl;
  else if (!std::filesystem::is_directory(configuration.root, error_code))
    std::cerr << "/!\\ no such directory '" << configuration.root.string() << '\'' << std::endl;
  else
    return true;
  return false;
}

static RunStatus compress_tree(const Configuration& configuration, Compressor& compressor)
{
  std::vector<std::string> exclude_types = configuration.exclude_types;
  std::string own_type = compressed_extension.substr(1);
  bool stopped = false;
  unsigned int eligible_count = 0;

  if (std::find(exclude_types.begin(), exclude_types.end(), own_type) == exclude_types.end())
    exclude_types.push_back(own_type);

  FileSelector selector(configuration.root, configuration.include_types, exclude_types, configuration.min_length);
  bool walked = selector.collect_files([&](const std::filesystem::path& source) -> bool
  {
    if (!compress_file(source, compressor))
      return false;
    eligible_count++;
    return true;
  }, stopped);

  if (stopped)
    return CompressionFailed;
  if (!walked)
    return TraversalError;
  if (verbose_mode)
    std::cout << "[gzip-static] " << eligible_count << " eligible files are up to date" << std::endl;
  return Success;
}

RunStatus generate_gzip_static(const Configuration& configuration, Compressor& compressor)
{
  if (!validate_root(configuration))
    return ConfigError;
  return compress_tree(configuration, compressor);
}

RunStatus generate_gzip_static(const Configuration& configuration, const SearchPath& search_path)
{
  ResolvedCommand command;

  if (!validate_root(configuration))
    return ConfigError;
  if (!resolve_command(configuration.command_candidates, search_path, command))
  {
    std::cerr << "Cannot compress files in `" << configuration.root.string() << "`. No compressor found." << std::endl;
    std::cerr << "Looked for:" << std::endl;
    for (const std::string& candidate : configuration.command_candidates) std::cerr << "- " << candidate << std::endl;
    return NoCompressorFound;
  }

  ExternalCompressor compressor(command);

  return compress_tree(configuration, compressor);
}

RunStatus generate_gzip_static(const Configuration& configuration)
{
  return generate_gzip_static(configuration, default_search_path());
}
