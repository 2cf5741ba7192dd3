#pragma once
#include "configuration.hpp"
#include "command_resolver.hpp"
#include "compression.hpp"

enum RunStatus
{
  Success,
  ConfigError,
  NoCompressorFound,
  TraversalError,
  CompressionFailed
};

extern bool verbose_mode;

bool      validate_root(const Configuration& configuration);
RunStatus generate_gzip_static(const Configuration& configuration, Compressor& compressor);
RunStatus generate_gzip_static(const Configuration& configuration, const SearchPath& search_path);
RunStatus generate_gzip_static(const Configuration& configuration);
