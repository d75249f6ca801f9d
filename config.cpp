#include <string>
#include <cstdlib>
#include <cerrno>
#include <getopt.h>
#include "config.hpp"
#include "utilities.hpp"

Config::Config()
    : serverMode(false),
      clientMode(false),
      ip(DEFAULT_IP),
      port(DEFAULT_PORT),
      windowSize(DEFAULT_WINDOW_SIZE),
      discardSequence(NO_DISCARD),
      saveFolder("."),
      maxFileSize(MAX_FILE_SIZE)
{
}

static bool toInt(const char *text, int &value)
{
  char *end = NULL;
  errno = 0;
  long number = strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || number < -2147483647L || number > 2147483647L)
    return false;
  value = (int)number;
  return true;
}

std::string usage(const std::string &program)
{
  return "Usage: " + program + " (-s | -c -f FILE) [-i IP] [-p PORT] [-w WINDOW] [-d SEQ] [-o DIR]\n"
         "  -s, --server         run the receiver\n"
         "  -c, --client         run the sender\n"
         "  -i, --ip IP          IPv4 address (default 127.0.0.1)\n"
         "  -p, --port PORT      port in [1024,65535] (default 8080)\n"
         "  -f, --file FILE      file to send (client)\n"
         "  -w, --window N       sliding window size (client, default 3)\n"
         "  -d, --discard SEQ    drop this sequence number once (server, testing)\n"
         "  -o, --output-dir DIR where received files are stored (server, default .)\n"
         "  -h, --help           show this help\n";
}

ParseResult parseArguments(int argc, char *argv[], Config &config, std::string &error)
{
  static const struct option longOptions[] = {
      {"server", no_argument, NULL, 's'},
      {"client", no_argument, NULL, 'c'},
      {"ip", required_argument, NULL, 'i'},
      {"port", required_argument, NULL, 'p'},
      {"file", required_argument, NULL, 'f'},
      {"window", required_argument, NULL, 'w'},
      {"discard", required_argument, NULL, 'd'},
      {"output-dir", required_argument, NULL, 'o'},
      {"help", no_argument, NULL, 'h'},
      {NULL, 0, NULL, 0}};

  optind = 0; // full rescan, parseArguments may run more than once per process
  opterr = 0;
  int opt;
  while ((opt = getopt_long(argc, argv, "sci:p:f:w:d:o:h", longOptions, NULL)) != -1)
  {
    switch (opt)
    {
    case 's':
      config.serverMode = true;
      break;
    case 'c':
      config.clientMode = true;
      break;
    case 'i':
      config.ip = optarg;
      break;
    case 'p':
      if (!toInt(optarg, config.port))
      {
        error = "Invalid port. Must be in range [1024,65535]";
        return ARGS_INVALID;
      }
      break;
    case 'f':
      config.filePath = optarg;
      break;
    case 'w':
      if (!toInt(optarg, config.windowSize))
      {
        error = "Sliding window size must be > 0.";
        return ARGS_INVALID;
      }
      break;
    case 'd':
      if (!toInt(optarg, config.discardSequence))
      {
        error = "Discard value must be a sequence number.";
        return ARGS_INVALID;
      }
      break;
    case 'o':
      config.saveFolder = optarg;
      break;
    case 'h':
      return ARGS_HELP;
    default:
      error = "Unknown or incomplete option. See -h for help.";
      return ARGS_INVALID;
    }
  }

  if (optind < argc)
  {
    error = "Unexpected argument " + std::string(argv[optind]) + ". See -h for help.";
    return ARGS_INVALID;
  }
  if (!checkIp(config.ip))
  {
    error = "Invalid IP. Format example: 127.0.0.1";
    return ARGS_INVALID;
  }
  if (!checkPort(config.port))
  {
    error = "Invalid port. Must be in range [1024,65535]";
    return ARGS_INVALID;
  }
  if (config.serverMode && config.clientMode)
  {
    error = "You cannot enable both the server and the client at the same time";
    return ARGS_INVALID;
  }
  if (!config.serverMode && !config.clientMode)
  {
    error = "Enable either server (-s) or client (-c). See -h for help.";
    return ARGS_INVALID;
  }
  if (config.clientMode && config.filePath.empty())
  {
    error = "A file path must be provided (use -f). See -h for help.";
    return ARGS_INVALID;
  }
  if (config.windowSize < 1)
  {
    error = "Sliding window size must be > 0.";
    return ARGS_INVALID;
  }
  return ARGS_OK;
}

bool checkFileToSend(const Config &config, std::string &error)
{
  long size = fileSize(config.filePath);
  if (size < 0)
  {
    error = "File not found. Please provide a valid file path.";
    return false;
  }
  if (size > config.maxFileSize)
  {
    error = "File must be smaller than 60 MB.";
    return false;
  }
  return true;
}
