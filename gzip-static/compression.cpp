#include "compression.hpp"
#include "configuration.hpp"
#include <boost/process.hpp>
#include <iostream>

extern bool verbose_mode;

int ExternalCompressor::compress(const std::filesystem::path& source)
{
  std::vector<std::string> arguments(command.arguments.begin() + 1, command.arguments.end());

  arguments.push_back(source.string());
  if (verbose_mode)
    std::cout << "+ " << command.to_string() << ' ' << source.string() << std::endl;
  try
  {
    boost::process::child process(
      boost::process::exe = command.program.string(),
      boost::process::args = arguments
    );

    process.wait();
    return process.exit_code();
  }
  catch (const boost::process::process_error& error)
  {
    std::cerr << "Cannot run `" << command.to_string() << "`: " << error.what() << std::endl;
  }
  return -1;
}

std::filesystem::path compressed_path_for(const std::filesystem::path& source)
{
  return std::filesystem::path(source.string() + compressed_extension);
}

bool is_fresh(const std::filesystem::path& source, const std::filesystem::path& compressed)
{
  std::error_code error_code;
  auto compressed_time = std::filesystem::last_write_time(compressed, error_code);
  std::filesystem::file_time_type source_time;

  if (error_code)
    return false;
  source_time = std::filesystem::last_write_time(source, error_code);
  return !error_code && compressed_time >= source_time;
}

bool compress_file(const std::filesystem::path& source, Compressor& compressor)
{
  std::filesystem::path compressed = compressed_path_for(source);
  std::filesystem::file_time_type source_time;
  std::error_code error_code;
  int exit_status;

  if (is_fresh(source, compressed))
    return true;
  std::filesystem::remove(compressed, error_code);
  if (error_code)
  {
    std::cerr << "Cannot remove stale `" << compressed.string() << "`: " << error_code.message() << std::endl;
    return false;
  }
  exit_status = compressor.compress(source);
  if (exit_status != 0)
  {
    std::cerr << "Compression of `" << source.string() << "` failed with exit status " << exit_status << std::endl;
    return false;
  }
  std::cerr << compressed.string() << std::endl;
  // Non-fatal: only the next freshness check depends on it.
  source_time = std::filesystem::last_write_time(source, error_code);
  if (!error_code)
    std::filesystem::last_write_time(compressed, source_time, error_code);
  if (error_code)
    std::cerr << "/!\\ could not set the modification time of `" << compressed.string() << "`: " << error_code.message() << std::endl;
  return true;
}
