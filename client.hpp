#ifndef CLIENT_HPP
#define CLIENT_HPP

#include <string>
#include "constants.hpp"
#include "config.hpp"
#include "channel.hpp"
#include "drtp.hpp"
#include "window.hpp"
#include "utilities.hpp"

class Client
{
public:
  Client(const Config &config, Channel &channel);
  ~Client();
  bool run(); // handshake, file transfer and handwave; false if the transfer was aborted

  bool handshake(); // SYN -> SYN-ACK -> ACK, no retry
  bool sendFile();  // file name, then every chunk of the configured file
  bool sendSegments(const std::string &fileName, FileChunker &chunker);
  bool handwave();  // FIN until FIN-ACK

  ConnectionState getState() const;
  const SlidingWindow &getWindow() const;
  int getRetransmissionCount() const; // segments resent after an RTO
  int getFinCount() const;            // FIN packets sent, retries included

private:
  bool sendPacket(const DRTPPacket &p);
  bool transmitSegment(uint16_t seq, const std::string &payload);
  bool drainWindow(bool lastSegment);
  bool retransmitWindow();
  RecvStatus recvPacket(DRTPPacket &p, bool &valid);
  bool abortConnection(const std::string &reason);

  bool verifySynAck(const DRTPPacket &synAckPacket) const;
  bool verifyAck(const DRTPPacket &ackPacket) const; // ACK for the window head
  bool verifyFinAck(const DRTPPacket &finAckPacket) const;

  Config m_config;
  Channel &m_channel;
  ConnectionState m_state;
  uint16_t m_sequenceNumber; // next sequence number to assign
  SlidingWindow m_window;
  int m_retransmissions;
  int m_finsSent;
};

#endif // CLIENT_HPP
