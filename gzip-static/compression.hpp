#pragma once
#include <filesystem>
#include "command_resolver.hpp"

class Compressor
{
public:
  virtual ~Compressor() {}

  // Produces `source + ".gz"` and returns the exit status of the operation.
  virtual int compress(const std::filesystem::path& source) = 0;
};

class ExternalCompressor : public Compressor
{
public:
  ExternalCompressor(const ResolvedCommand& command) : command(command)
  {
  }

  int compress(const std::filesystem::path& source) override;

private:
  ResolvedCommand command;
};

std::filesystem::path compressed_path_for(const std::filesystem::path& source);
bool                  is_fresh(const std::filesystem::path& source, const std::filesystem::path& compressed);
bool                  compress_file(const std::filesystem::path& source, Compressor& compressor);
