#pragma once
#include <string>
#include <vector>
#include "configuration.hpp"

enum OptionsStatus
{
  RunRequested,
  HelpRequested,
  InvalidOptions
};

std::vector<std::string> split_types(const std::vector<std::string>& params);
OptionsStatus            load_options(int argc, const char* const argv[], Configuration& configuration);
