#include <string>
#include <iostream>
#include <cstdlib>
#include "config.hpp"
#include "channel.hpp"
#include "client.hpp"
#include "server.hpp"
#include "utilities.hpp"

static int runServer(const Config &config)
{
  UdpChannel channel;
  if (!channel.bindLocal(config.ip, config.port))
  {
    outputToStderr("The given IP/port is not available. Try 127.0.0.1:8080 or (10.0.1.2) in Mininet.");
    return 1;
  }
  outputToStdout("Server listening on " + config.ip + ":" + std::to_string(config.port));

  Server server(config, channel);
  return server.run() ? 0 : 1;
}

static int runClient(const Config &config)
{
  std::string error;
  if (!checkFileToSend(config, error))
  {
    outputToStderr(error);
    return 1;
  }

  UdpChannel channel;
  if (!channel.connectPeer(config.ip, config.port))
    return 1;

  Client client(config, channel);
  return client.run() ? 0 : 1;
}

int main(int argc, char *argv[])
{
  using namespace std;
  Config config;
  string error;
  ParseResult result = parseArguments(argc, argv, config, error);
  if (result == ARGS_HELP)
  {
    cout << usage(argv[0]);
    return 0;
  }
  if (result == ARGS_INVALID)
  {
    outputToStderr("ERROR: " + error);
    exit(1);
  }

  if (config.serverMode)
    return runServer(config);
  return runClient(config);
}
