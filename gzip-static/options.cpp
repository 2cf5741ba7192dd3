#include "options.hpp"
#include <iostream>
#include <boost/program_options.hpp>
#include <crails/utils/split.hpp>

extern bool verbose_mode;

std::vector<std::string> split_types(const std::vector<std::string>& params)
{
  std::vector<std::string> types;

  for (const std::string& param : params)
  {
    for (const std::string& type : Crails::split(param, ','))
    {
      if (type.length() > 0)
        types.push_back(type);
    }
  }
  return types;
}

static std::string join(const std::vector<std::string>& values, const std::string& separator)
{
  std::string result;

  for (const std::string& value : values)
    result += (result.length() > 0 ? separator : "") + value;
  return result;
}

OptionsStatus load_options(int argc, const char* const argv[], Configuration& configuration)
{
  boost::program_options::options_description desc("Options");
  boost::program_options::positional_options_description positional;
  boost::program_options::variables_map options;

  desc.add_options()
    ("types,t",      boost::program_options::value<std::vector<std::string>>(), ("comma separated list of file extension patterns to compress; defaults to " + join(default_types, ",")).c_str())
    ("min-length,m", boost::program_options::value<long long>(),                "files this size or smaller, in bytes, are skipped; defaults to 50")
    ("cmd,c",        boost::program_options::value<std::vector<std::string>>(), "compressor command line, may be repeated; the first one available is used. Defaults to `zopfli`, then `gzip -kf9`")
    ("directory",    boost::program_options::value<std::string>(),              "directory to traverse")
    ("verbose,v", "enable verbose mode")
    ("help,h", "display help message");
  positional.add("directory", 1);
  try
  {
    boost::program_options::store(
      boost::program_options::command_line_parser(argc, argv).options(desc).positional(positional).run(),
      options
    );
    boost::program_options::notify(options);
  }
  catch (const boost::program_options::error& error)
  {
    std::cerr << "gzip-static: " << error.what() << std::endl;
    return InvalidOptions;
  }
  if (options.count("help"))
  {
    std::cout << "usage: gzip-static [options] <directory>" << std::endl << desc << std::endl;
    return HelpRequested;
  }
  verbose_mode = options.count("verbose");
  if (!options.count("directory"))
  {
    std::cerr << "directory argument is required" << std::endl;
    return InvalidOptions;
  }
  if (options.count("min-length"))
  {
    long long min_length = options["min-length"].as<long long>();

    if (min_length < 0)
    {
      std::cerr << "min-length must be a non-negative integer" << std::endl;
      return InvalidOptions;
    }
    configuration.min_length = static_cast<std::uintmax_t>(min_length);
  }
  configuration.root = options["directory"].as<std::string>();
  if (options.count("types"))
    configuration.include_types = split_types(options["types"].as<std::vector<std::string>>());
  if (options.count("cmd"))
    configuration.command_candidates = options["cmd"].as<std::vector<std::string>>();
  return RunRequested;
}
