#include <string>
#include <vector>
#include <cstdint>
#include "constants.hpp"
#include "drtp.hpp"
#include "client.hpp"
#include "utilities.hpp"

Client::Client(const Config &config, Channel &channel)
    : m_config(config),
      m_channel(channel),
      m_state(IDLE),
      m_sequenceNumber(CONTROL_SEQ_NUM),
      m_window(config.windowSize),
      m_retransmissions(0),
      m_finsSent(0)
{
}

Client::~Client()
{
  // the channel belongs to the caller, nothing to release here
}

/**
 * @brief Entry point for running client services
 *
 * @return false if any phase aborted the transfer
 */
bool Client::run()
{
  if (!handshake())
    return false;
  if (!sendFile())
    return false;
  return handwave();
}

/**
 * @brief Sends a SYN and waits one RETRANSMISSION_TIMEOUT for the SYN-ACK, then answers with an ACK.
 *
 * The SYN is never retransmitted: no reply, an unreachable server or a reply that is not a
 * SYN-ACK aborts the connection. If this returns true the connection is ESTABLISHED.
 */
bool Client::handshake()
{
  outputToStdout("Connection Establishment Phase:");

  DRTPPacket synPacket(CONTROL_SEQ_NUM, 0, SYN_FLAG);
  if (!sendPacket(synPacket))
    return abortConnection("Could not connect to the server. Check if the server is running or if IP/port is correct");
  m_state = SYN_SENT;
  outputToStdout("SYN packet is sent");

  DRTPPacket synAckPacket;
  bool valid = false;
  RecvStatus status = recvPacket(synAckPacket, valid);
  if (status == RECV_PEER_GONE)
    return abortConnection("Could not connect to the server. Check if the server is running or if IP/port is correct");
  if (status == RECV_TIMEOUT)
    return abortConnection("The server did not respond with a SYN-ACK.");
  if (status != RECV_OK)
    return abortConnection("Receive failed while waiting for SYN-ACK");
  if (!valid || !verifySynAck(synAckPacket))
    return abortConnection("Expected a SYN-ACK, got an unexpected packet instead");
  outputToStdout("SYN-ACK packet is received");

  DRTPPacket ackPacket(CONTROL_SEQ_NUM, 0, ACK_FLAG);
  if (!sendPacket(ackPacket))
    return abortConnection("Lost contact with the server, terminating");
  outputToStdout("ACK packet is sent");

  m_state = ESTABLISHED;
  outputToStdout("Connection established");
  return true;
}

bool Client::sendFile()
{
  FileChunker chunker(m_config.filePath);
  if (!chunker.isOpen())
    return abortConnection("Unable to open file " + m_config.filePath);
  return sendSegments(baseName(m_config.filePath), chunker);
}

/**
 * @brief Go-Back-N over the file name segment followed by every chunk the chunker produces.
 *
 * A new segment is only built once the window has room; the window is drained completely
 * after the last segment.
 */
bool Client::sendSegments(const std::string &fileName, FileChunker &chunker)
{
  if (m_state != ESTABLISHED)
    return abortConnection("Data transfer attempted without an established connection");
  if ((int)fileName.size() > MAX_PAYLOAD_LENGTH)
    return abortConnection("File name does not fit in one packet");

  outputToStdout("Data Transfer:");

  std::string payload = fileName; // sequence 1 carries the name, not file content
  std::string nextChunk;
  bool haveNext = chunker.nextChunk(nextChunk);
  if (!haveNext && chunker.failed())
    return abortConnection("Unable to read file " + m_config.filePath);
  m_sequenceNumber = FILE_NAME_SEQ_NUM;

  while (true)
  {
    if (!transmitSegment(m_sequenceNumber, payload))
      return false;

    bool lastSegment = !haveNext;
    if (!drainWindow(lastSegment))
      return false;
    if (lastSegment)
      break;

    if (m_sequenceNumber == UINT16_MAX)
      return abortConnection("File has more chunks than sequence numbers");
    payload.swap(nextChunk);
    haveNext = chunker.nextChunk(nextChunk);
    if (!haveNext && chunker.failed())
      return abortConnection("Unable to read file " + m_config.filePath);
    ++m_sequenceNumber;
  }

  outputToStdout("Data transfer finished");
  return true;
}

/**
 * @brief Sends FIN until a FIN-ACK comes back. Retries are unbounded and use a fixed timeout.
 */
bool Client::handwave()
{
  if (m_state != ESTABLISHED)
    return abortConnection("Teardown attempted without an established connection");

  outputToStdout("Connection Teardown:");
  m_state = FIN_WAIT;

  DRTPPacket finPacket(CONTROL_SEQ_NUM, 0, FIN_FLAG);
  while (true)
  {
    if (!sendPacket(finPacket))
      return abortConnection("Lost contact with the server, terminating");
    ++m_finsSent;
    outputToStdout("FIN packet is sent");

    DRTPPacket finAckPacket;
    bool valid = false;
    RecvStatus status = recvPacket(finAckPacket, valid);
    if (status == RECV_PEER_GONE)
      return abortConnection("Lost contact with the server, terminating");
    if (status == RECV_ERROR)
      return abortConnection("Receive failed while waiting for FIN-ACK");

    if (status == RECV_OK && valid && verifyFinAck(finAckPacket))
      break;

    if (status == RECV_TIMEOUT)
      outputToStdout("No FIN-ACK received, resending FIN packet...");
    else
      outputToStdout("Expected FIN-ACK, got " + (valid ? finAckPacket.describe() : std::string("a malformed packet")) + ", resending FIN packet...");
  }

  outputToStdout("FIN-ACK packet is received");
  m_state = CLOSED;
  outputToStdout("Connection Closes");
  return true;
}

/**
 * @brief Builds the data packet for `seq`, admits it into the window and sends it
 */
bool Client::transmitSegment(uint16_t seq, const std::string &payload)
{
  DRTPPacket dataPacket(seq, 0, ACK_FLAG, payload);
  if (!m_window.admit(seq, dataPacket.getString()))
    return abortConnection("Sliding window rejected packet seq=" + std::to_string(seq));

  if (!sendPacket(dataPacket))
    return abortConnection("Lost contact with the server, terminating");
  outputToStdout("packet seq=" + std::to_string(seq) + " sent, sliding window=" + m_window.toString());
  return true;
}

/**
 * @brief Waits for ACKs while the window is full, or until it is empty after the last segment.
 *
 * Every ACK for the window head slides the window by one. A timeout or any other packet
 * resends the whole window.
 */
bool Client::drainWindow(bool lastSegment)
{
  while (m_window.isFull() || (lastSegment && !m_window.empty()))
  {
    DRTPPacket ackPacket;
    bool valid = false;
    RecvStatus status = recvPacket(ackPacket, valid);

    if (status == RECV_PEER_GONE)
      return abortConnection("Lost contact with the server, terminating");
    if (status == RECV_ERROR)
      return abortConnection("Receive failed while waiting for ACK");

    if (status == RECV_OK && valid && verifyAck(ackPacket))
    {
      outputToStdout("ACK for packet seq=" + std::to_string(ackPacket.getAckNum()) + " is received");
      m_window.popHead();
      continue;
    }

    if (status == RECV_TIMEOUT)
      outputToStdout("RTO occurred");
    else
      outputToStdout("unexpected " + (valid ? ackPacket.describe() : std::string("malformed packet")) + ", RTO occurred");

    if (!retransmitWindow())
      return false;
  }
  return true;
}

/**
 * @brief Resends every packet of the window, oldest first, byte for byte as first sent
 */
bool Client::retransmitWindow()
{
  std::vector<uint16_t> inFlight = m_window.sequences();
  for (size_t i = 0; i < inFlight.size(); i++)
  {
    outputToStdout("retransmitting lost packet seq=" + std::to_string(inFlight[i]));
    if (m_channel.sendDatagram(m_window.packet(inFlight[i])) < 0)
      return abortConnection("Lost contact with the server, terminating");
    ++m_retransmissions;
  }
  return true;
}

bool Client::sendPacket(const DRTPPacket &p)
{
  return m_channel.sendDatagram(p.getString()) >= 0;
}

/**
 * @brief Waits one RETRANSMISSION_TIMEOUT for a packet
 *
 * @param valid set to false if a datagram arrived but could not be parsed
 */
RecvStatus Client::recvPacket(DRTPPacket &p, bool &valid)
{
  std::string datagram;
  RecvStatus status = m_channel.recvDatagram(datagram, RETRANSMISSION_TIMEOUT);
  valid = status == RECV_OK && p.parse(datagram);
  return status;
}

bool Client::abortConnection(const std::string &reason)
{
  outputToStderr(reason);
  m_state = ABORTED;
  return false;
}

bool Client::verifySynAck(const DRTPPacket &synAckPacket) const
{
  return synAckPacket.getFlags() == (SYN_FLAG | ACK_FLAG);
}

bool Client::verifyAck(const DRTPPacket &ackPacket) const
{
  if (m_window.empty())
    return false;
  uint16_t expected = m_window.head();
  return ackPacket.getFlags() == ACK_FLAG &&
         ackPacket.getSeqNum() == expected &&
         ackPacket.getAckNum() == expected;
}

bool Client::verifyFinAck(const DRTPPacket &finAckPacket) const
{
  return finAckPacket.isFIN() && finAckPacket.isACK();
}

ConnectionState Client::getState() const
{
  return m_state;
}

const SlidingWindow &Client::getWindow() const
{
  return m_window;
}

int Client::getRetransmissionCount() const
{
  return m_retransmissions;
}

int Client::getFinCount() const
{
  return m_finsSent;
}
