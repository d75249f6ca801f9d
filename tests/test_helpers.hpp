#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <dirent.h>
#include <unistd.h>
#include "channel.hpp"
#include "drtp.hpp"
#include "constants.hpp"

/**
 * @brief Single threaded channel: receives pop a preloaded inbox, an empty inbox times out
 * at once. Every send is recorded and handed to `onSend`, which may queue replies.
 */
class ScriptedChannel : public Channel
{
public:
  ScriptedChannel() : peerGone(false), accepted(false), recvCalls(0), timeouts(0), lastTimeout(0) {}

  int sendDatagram(const std::string &datagram) override
  {
    sent.push_back(datagram);
    if (onSend)
      onSend(datagram);
    return datagram.size();
  }

  RecvStatus recvDatagram(std::string &datagram, float timeoutSeconds) override
  {
    ++recvCalls;
    lastTimeout = timeoutSeconds;
    if (!inbox.empty())
    {
      datagram = inbox.front();
      inbox.pop_front();
      return RECV_OK;
    }
    if (peerGone)
      return RECV_PEER_GONE;
    ++timeouts;
    return RECV_TIMEOUT;
  }

  bool acceptPeer() override
  {
    accepted = true;
    return true;
  }

  std::string peerName() const override { return "scripted"; }

  void queue(const DRTPPacket &p) { inbox.push_back(p.getString()); }

  std::deque<std::string> inbox;
  std::vector<std::string> sent;
  std::function<void(const std::string &)> onSend;
  bool peerGone;
  bool accepted;
  int recvCalls;
  int timeouts;
  float lastTimeout;
};

inline DRTPPacket parsed(const std::string &datagram)
{
  DRTPPacket p;
  p.parse(datagram);
  return p;
}

/**
 * @brief Plays the receiver for client tests: answers the handshake, acknowledges in-order
 * packets only and answers FIN, with optional losses.
 */
struct ReceiverSimulator
{
  ReceiverSimulator(ScriptedChannel &channel)
      : channel(channel), expected(FILE_NAME_SEQ_NUM), discard(NO_DISCARD), answerSyn(true), finAcksToDrop(0)
  {
  }

  void operator()(const std::string &datagram)
  {
    DRTPPacket p;
    if (!p.parse(datagram))
      return;

    if (p.getFlags() == SYN_FLAG)
    {
      if (answerSyn)
        channel.queue(DRTPPacket(0, 0, SYN_FLAG | ACK_FLAG));
      return;
    }
    if (p.isFIN())
    {
      if (finAcksToDrop > 0)
        --finAcksToDrop;
      else
        channel.queue(DRTPPacket(0, 0, FIN_FLAG | ACK_FLAG));
      return;
    }
    if (p.getSeqNum() == CONTROL_SEQ_NUM)
      return; // handshake ACK

    if (p.getSeqNum() == discard)
    {
      discard = NO_DISCARD;
      return;
    }
    if (p.getSeqNum() == FILE_NAME_SEQ_NUM)
    {
      fileName = p.getPayload();
      channel.queue(DRTPPacket(1, 1, ACK_FLAG));
      if (expected < FIRST_DATA_SEQ_NUM)
        expected = FIRST_DATA_SEQ_NUM;
      return;
    }
    if (p.getSeqNum() == expected)
    {
      data += p.getPayload();
      channel.queue(DRTPPacket(expected, expected, ACK_FLAG));
      ++expected;
    }
  }

  ScriptedChannel &channel;
  int expected;
  int discard;
  bool answerSyn;
  int finAcksToDrop;
  std::string fileName;
  std::string data;
};

inline std::string makeTempDir()
{
  char pattern[] = "/tmp/drtp_test_XXXXXX";
  char *dir = mkdtemp(pattern);
  return dir ? std::string(dir) : std::string();
}

inline void removeDir(const std::string &dir)
{
  DIR *d = opendir(dir.c_str());
  if (d == NULL)
    return;
  struct dirent *entry;
  while ((entry = readdir(d)) != NULL)
  {
    std::string name = entry->d_name;
    if (name != "." && name != "..")
      unlink((dir + "/" + name).c_str());
  }
  closedir(d);
  rmdir(dir.c_str());
}

inline void writeFile(const std::string &path, const std::string &content)
{
  std::ofstream out(path.c_str(), std::ios::binary);
  out.write(content.data(), content.size());
}

inline std::string readFile(const std::string &path)
{
  std::ifstream in(path.c_str(), std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

/**
 * @brief `chunks` full payloads of distinct bytes, the last one shortened by `shortBy`
 */
inline std::string makeContent(int chunks, int shortBy = 0)
{
  std::string content;
  int length = chunks * MAX_PAYLOAD_LENGTH - shortBy;
  for (int i = 0; i < length; i++)
    content += (char)((i * 7 + i / MAX_PAYLOAD_LENGTH) % 256);
  return content;
}

/**
 * @brief Sequence numbers of the data packets in `sent`, in send order
 */
inline std::vector<int> dataSequences(const std::vector<std::string> &sent)
{
  std::vector<int> sequences;
  for (size_t i = 0; i < sent.size(); i++)
  {
    DRTPPacket p = parsed(sent[i]);
    if (p.getSeqNum() != CONTROL_SEQ_NUM)
      sequences.push_back(p.getSeqNum());
  }
  return sequences;
}

#endif // TEST_HELPERS_HPP
