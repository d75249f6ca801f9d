#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include "constants.hpp"

/**
 * @brief Everything the engines need to know about one run, handed to them at construction
 */
struct Config
{
	Config();

	bool serverMode;
	bool clientMode;
	std::string ip;         // server: bind address, client: server address
	int port;
	std::string filePath;   // client only
	int windowSize;         // client only, >= 1
	int discardSequence;    // server only, test hook: drop this sequence once
	std::string saveFolder; // server only
	long maxFileSize;       // client only, checked before the transfer starts
};

enum ParseResult
{
	ARGS_OK,
	ARGS_HELP,
	ARGS_INVALID
};

/**
 * @brief Fills `config` from the command line and validates it
 *
 * @param error set to a one line diagnostic when ARGS_INVALID is returned
 */
ParseResult parseArguments(int argc, char *argv[], Config &config, std::string &error);

/**
 * @brief Client-side checks on the file to send: existence and size
 */
bool checkFileToSend(const Config &config, std::string &error);

std::string usage(const std::string &program);

#endif // CONFIG_HPP
