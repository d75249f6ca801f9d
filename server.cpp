#include <string>
#include <string.h>
#include <chrono>
#include <cstdio>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include "server.hpp"
#include "constants.hpp"
#include "utilities.hpp"
#include "drtp.hpp"

// SERVER IMPLEMENTATION

// CONSTRUCTORS

Server::Server(const Config &config, Channel &channel)
    : m_config(config),
      m_channel(channel),
      m_state(IDLE),
      m_discardSequence(config.discardSequence),
      m_expectedSeqNum(FILE_NAME_SEQ_NUM),
      m_partialPath(config.saveFolder + "/.drtp_incoming"),
      m_fileFd(-1),
      m_bytesWritten(0)
{
}

Server::~Server()
{
  closeOutputFile();
  if (m_state != CLOSED && m_state != IDLE)
    unlink(m_partialPath.c_str()); // never leave a half received file behind
}

bool Server::run()
{
  if (!acceptConnection())
    return false;
  if (!receiveFile())
    return false;
  return closeConnection();
}

/**
 * @brief Blocks until the first packet arrives. That packet must be a SYN; its sender becomes
 * the only client of this server. Then SYN-ACK and up to CONNECTION_TIMEOUT for the ACK.
 */
bool Server::acceptConnection()
{
  std::string datagram;
  RecvStatus status = m_channel.recvDatagram(datagram, WAIT_FOREVER);
  if (status != RECV_OK)
    return abortConnection("Receive failed while waiting for SYN");

  DRTPPacket synPacket;
  if (!synPacket.parse(datagram) || synPacket.getFlags() != SYN_FLAG)
    return abortConnection("Expected a SYN packet from " + m_channel.peerName() + ", refusing the connection");
  outputToStdout("SYN packet is received");

  // one active connection: every other sender is ignored from here on
  if (!m_channel.acceptPeer())
    return abortConnection("Unable to accept client " + m_channel.peerName());
  m_state = SYN_RCVD;

  if (!sendPacket(DRTPPacket(CONTROL_SEQ_NUM, 0, SYN_FLAG | ACK_FLAG)))
    return abortConnection("Lost contact with the client");
  outputToStdout("SYN-ACK packet is sent");

  status = m_channel.recvDatagram(datagram, CONNECTION_TIMEOUT);
  if (status == RECV_TIMEOUT)
    return abortConnection("No ACK received for SYN-ACK, connection timed out");
  if (status != RECV_OK)
    return abortConnection("Lost contact with the client");

  DRTPPacket ackPacket;
  if (!ackPacket.parse(datagram) || ackPacket.getFlags() != ACK_FLAG)
    return abortConnection("Expected an ACK packet, refusing the connection");

  if (ackPacket.getSeqNum() == CONTROL_SEQ_NUM)
    outputToStdout("ACK packet is received");
  else
    outputToStdout("packet seq=" + std::to_string(ackPacket.getSeqNum()) + " completes the handshake, waiting for its retransmission");

  if (!openOutputFile())
    return abortConnection("Unable to create " + m_partialPath + ": " + std::string(strerror(errno)));

  m_state = ESTABLISHED;
  m_transferStart = std::chrono::system_clock::now();
  outputToStdout("Connection Established with " + m_channel.peerName());
  return true;
}

/**
 * @brief Receives packets until a FIN arrives. Silence for CONNECTION_TIMEOUT ends the connection.
 */
bool Server::receiveFile()
{
  if (m_state != ESTABLISHED)
    return abortConnection("Data transfer attempted without an established connection");

  while (true)
  {
    std::string datagram;
    RecvStatus status = m_channel.recvDatagram(datagram, CONNECTION_TIMEOUT);
    if (status == RECV_TIMEOUT)
      return abortConnection("No packet from the client for " + std::to_string((int)CONNECTION_TIMEOUT) + "s, connection timed out");
    if (status == RECV_PEER_GONE)
      return abortConnection("Lost contact with the client");
    if (status != RECV_OK)
      return abortConnection("Receive failed during data transfer");

    SegmentStatus segmentStatus = handleDatagram(datagram);
    if (segmentStatus == SEGMENT_FIN)
      break;
    if (segmentStatus == SEGMENT_WRITE_FAILED)
      return abortConnection("Unable to write the received file");
    if (segmentStatus == SEGMENT_SEND_FAILED)
      return abortConnection("Lost contact with the client");
  }

  m_transferEnd = std::chrono::system_clock::now();
  return true;
}

SegmentStatus Server::handleDatagram(const std::string &datagram)
{
  DRTPPacket p;
  if (!p.parse(datagram))
  {
    outputToStdout("malformed packet of " + std::to_string(datagram.size()) + " bytes dropped");
    return SEGMENT_MALFORMED;
  }
  return handleSegment(p);
}

/**
 * @brief Decides what one data-phase packet means and answers it.
 *
 * Only the next expected sequence number is written and acknowledged. Anything out of order
 * is dropped without an ACK so the client's Go-Back-N timer resends the window.
 * Sequence 1 carries the file name and is acknowledged every time it arrives.
 */
SegmentStatus Server::handleSegment(const DRTPPacket &p)
{
  int seq = p.getSeqNum();

  // test hook: simulate the loss of one packet
  if (seq == m_discardSequence)
  {
    m_discardSequence = NO_DISCARD;
    outputToStdout("packet seq=" + std::to_string(seq) + " discarded for testing");
    return SEGMENT_DISCARDED;
  }

  if (p.isFIN())
  {
    outputToStdout("FIN packet is received");
    outputToStdout("Data transfer finished");
    return SEGMENT_FIN;
  }

  if (seq == FILE_NAME_SEQ_NUM)
  {
    outputToStdout("packet seq=" + std::to_string(seq) + " is received");
    m_fileName = baseName(p.getPayload());
    if (!sendAck(FILE_NAME_SEQ_NUM))
      return SEGMENT_SEND_FAILED;
    if (m_expectedSeqNum < FIRST_DATA_SEQ_NUM) // a late copy must not rewind the counter
      m_expectedSeqNum = FIRST_DATA_SEQ_NUM;
    return SEGMENT_FILE_NAME;
  }

  if (seq == m_expectedSeqNum)
  {
    outputToStdout("packet seq=" + std::to_string(seq) + " is received, " + std::to_string(p.getPayloadLength()) + " bytes");
    if (!sendAck(p.getSeqNum()))
      return SEGMENT_SEND_FAILED;
    if (writeToFile(p.getPayload()) == -1)
      return SEGMENT_WRITE_FAILED;
    ++m_expectedSeqNum;
    return SEGMENT_ACCEPTED;
  }

  outputToStdout("out-of-order packet seq=" + std::to_string(seq) + " received");
  return SEGMENT_OUT_OF_ORDER;
}

/**
 * @brief Answers the FIN with a single FIN-ACK, then moves the received file to its final name.
 *
 * The FIN-ACK is not retransmitted. If it gets lost the client keeps resending FIN with
 * nobody left to answer.
 */
bool Server::closeConnection()
{
  if (m_state != ESTABLISHED)
    return abortConnection("Teardown attempted without an established connection");

  bool finAckSent = sendPacket(DRTPPacket(CONTROL_SEQ_NUM, 0, FIN_FLAG | ACK_FLAG));
  if (finAckSent)
    outputToStdout("FIN-ACK packet is sent");
  else
    outputToStderr("FIN-ACK packet could not be sent");

  closeOutputFile();
  if (m_fileName.empty())
    m_fileName = baseName("");
  m_outputPath = uniqueFileName(m_config.saveFolder, m_fileName);
  if (rename(m_partialPath.c_str(), m_outputPath.c_str()) == -1)
    return abortConnection("Unable to rename received file to " + m_outputPath + ": " + std::string(strerror(errno)));
  m_state = CLOSED;
  outputToStdout("Received file saved as " + m_outputPath);

  outputToStdout("The throughput is " + throughput(m_transferStart, m_transferEnd, m_bytesWritten) + " mbps");
  outputToStdout("Connection Closes");
  return finAckSent;
}

bool Server::openOutputFile()
{
  m_fileFd = open(m_partialPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  return m_fileFd != -1;
}

int Server::writeToFile(const std::string &data)
{
  size_t written = 0;
  while (written < data.size())
  {
    int bytesWrote = write(m_fileFd, data.data() + written, data.size() - written);
    if (bytesWrote == -1)
    {
      if (errno == EINTR)
        continue;
      std::string errorMessage = "File write Error: " + std::string(strerror(errno));
      outputToStderr(errorMessage);
      return -1;
    }
    written += bytesWrote;
  }
  m_bytesWritten += written;
  return written;
}

void Server::closeOutputFile()
{
  if (m_fileFd != -1)
  {
    close(m_fileFd);
    m_fileFd = -1;
  }
}

bool Server::sendPacket(const DRTPPacket &p)
{
  return m_channel.sendDatagram(p.getString()) >= 0;
}

bool Server::sendAck(uint16_t seq)
{
  if (!sendPacket(DRTPPacket(seq, seq, ACK_FLAG)))
    return false;
  outputToStdout("sending ACK for packet seq=" + std::to_string(seq));
  return true;
}

bool Server::abortConnection(const std::string &reason)
{
  outputToStderr(reason);
  closeOutputFile();
  if (m_state != IDLE)
    unlink(m_partialPath.c_str());
  m_state = ABORTED;
  return false;
}

ConnectionState Server::getState() const
{
  return m_state;
}

uint16_t Server::getExpectedSeqNum() const
{
  return m_expectedSeqNum;
}

const std::string &Server::getFileName() const
{
  return m_fileName;
}

const std::string &Server::getOutputPath() const
{
  return m_outputPath;
}

long Server::getBytesWritten() const
{
  return m_bytesWritten;
}
