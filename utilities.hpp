#ifndef UTILITIES_HPP
#define UTILITIES_HPP
#include <string>
#include <fstream>
#include <chrono>

typedef std::chrono::time_point<std::chrono::system_clock> c_time;

//////////// LOGGING

/**
 * @brief Wall clock time as HH:MM:SS.ffffff
 */
std::string timeString();

/**
 * @brief Prints `message` on stdout prefixed with the current time
 */
void outputToStdout(const std::string &message);

/**
 * @brief Prints `message` on stderr prefixed with the current time
 */
void outputToStderr(const std::string &message);

//////////// VALIDATION

bool checkIp(const std::string &ip);     // dotted-quad IPv4 only
bool checkPort(int port);                // [1024, 65535]

//////////// FILES

/**
 * @brief Lazily splits a file into chunks of at most MAX_PAYLOAD_LENGTH bytes, in file order
 */
class FileChunker
{
public:
  explicit FileChunker(const std::string &path);
  bool isOpen() const;
  bool nextChunk(std::string &chunk); // false once the file is exhausted or unreadable
  void rewind();                      // start again from the first byte
  bool failed() const;                // a read error, not end of file, stopped nextChunk

private:
  std::ifstream m_file;
};

/**
 * @brief Size of the file in bytes, -1 if it cannot be stat'ed or is not a regular file
 */
long fileSize(const std::string &path);

bool fileExists(const std::string &path);

/**
 * @brief Strips any directory part from `path`; "" and "." style names become "received_file"
 */
std::string baseName(const std::string &path);

/**
 * @brief First free name in `folder` for `fileName`: the name itself, then base(0).ext, base(1).ext, ...
 *
 * @return the full path inside `folder`
 */
std::string uniqueFileName(const std::string &folder, const std::string &fileName);

/**
 * @brief Throughput in Mbps formatted with two decimals
 */
std::string throughput(c_time start, c_time end, long bytes);

#endif // UTILITIES_HPP
