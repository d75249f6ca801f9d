#include <string>
#include <iostream>
#include <cstdio>
#include <ctime>
#include <sys/time.h>
#include <sys/stat.h>
#include <arpa/inet.h>
#include "utilities.hpp"
#include "constants.hpp"

/////////// LOGGING

std::string timeString()
{
  struct timeval now;
  gettimeofday(&now, NULL);
  struct tm local;
  localtime_r(&now.tv_sec, &local);

  char buffer[32];
  size_t len = strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
  snprintf(buffer + len, sizeof(buffer) - len, ".%06ld", (long)now.tv_usec);
  return buffer;
}

void outputToStdout(const std::string &message)
{
  std::cout << timeString() << " -- " << message << std::endl;
}

void outputToStderr(const std::string &message)
{
  std::cerr << timeString() << " -- " << message << std::endl;
}

/////////// VALIDATION

bool checkIp(const std::string &ip)
{
  struct in_addr addr;
  return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool checkPort(int port)
{
  return port >= MIN_PORT && port <= MAX_PORT;
}

/////////// FILES

FileChunker::FileChunker(const std::string &path)
    : m_file(path.c_str(), std::ios::in | std::ios::binary)
{
}

bool FileChunker::isOpen() const
{
  return m_file.is_open();
}

bool FileChunker::nextChunk(std::string &chunk)
{
  if (!m_file.is_open())
    return false;

  char buffer[MAX_PAYLOAD_LENGTH];
  m_file.read(buffer, MAX_PAYLOAD_LENGTH);
  std::streamsize bytesRead = m_file.gcount();
  if (bytesRead <= 0)
    return false;
  chunk.assign(buffer, bytesRead);
  return true;
}

bool FileChunker::failed() const
{
  return m_file.bad();
}

void FileChunker::rewind()
{
  m_file.clear(); // reading up to EOF leaves failbit set
  m_file.seekg(0, std::ios::beg);
}

long fileSize(const std::string &path)
{
  struct stat st;
  if (stat(path.c_str(), &st) == -1 || !S_ISREG(st.st_mode))
    return -1;
  return st.st_size;
}

bool fileExists(const std::string &path)
{
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

std::string baseName(const std::string &path)
{
  std::string name = path;
  while (!name.empty() && name[name.size() - 1] == '/')
    name.erase(name.size() - 1);

  size_t slash = name.find_last_of('/');
  if (slash != std::string::npos)
    name = name.substr(slash + 1);

  if (name.empty() || name == "." || name == "..")
    return "received_file";
  return name;
}

std::string uniqueFileName(const std::string &folder, const std::string &fileName)
{
  std::string path = folder + "/" + fileName;
  if (!fileExists(path))
    return path;

  // a leading dot marks a hidden file, not an extension
  size_t dot = fileName.find_last_of('.');
  std::string base = fileName;
  std::string extension;
  if (dot != std::string::npos && dot != 0)
  {
    base = fileName.substr(0, dot);
    extension = fileName.substr(dot); // keeps the dot
  }

  int copy = 0;
  do
  {
    path = folder + "/" + base + "(" + std::to_string(copy) + ")" + extension;
    ++copy;
  } while (fileExists(path));
  return path;
}

std::string throughput(c_time start, c_time end, long bytes)
{
  std::chrono::duration<double> elapsed_time = end - start;
  double elapsed_seconds = elapsed_time.count();
  if (elapsed_seconds <= 0)
    elapsed_seconds = 1e-6; // clock granularity on tiny files

  double mbps = (bytes * 8 / 1000000.0) / elapsed_seconds;
  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%.2f", mbps);
  return buffer;
}
