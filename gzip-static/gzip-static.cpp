#include "options.hpp"
#include "gzip_static.hpp"

int main (int argc, char* argv[])
{
  Configuration configuration;

  switch (load_options(argc, argv, configuration))
  {
  case HelpRequested:
    return 0;
  case InvalidOptions:
    return -1;
  default:
    break ;
  }
  return generate_gzip_static(configuration) == Success ? 0 : -1;
}
