#include <string>
#include <cstring>
#include <sys/types.h>
#include <endian.h>
#include "drtp.hpp"
#include "constants.hpp"

/*------------------------------------------------------------
UTILITY FUNCTIONS
-------------------------------------------------------------*/

static void uint16ToChar(uint16_t num, char *arr)
{
  uint16_t number = htobe16(num); // Changing to Big Endian
  memcpy(arr, &number, sizeof(number));
}

static uint16_t charToUint16(const char *arr)
{
  uint16_t number;
  memcpy(&number, arr, sizeof(number));
  return be16toh(number);
}

std::string encodeHeader(uint16_t seq, uint16_t ack, uint16_t flags)
{
  char header[HEADER_LEN];
  uint16ToChar(seq, header);
  uint16ToChar(ack, header + 2);
  uint16ToChar(flags, header + 4);
  return std::string(header, HEADER_LEN); // can't rely on c_str because of null bytes
}

bool decodeHeader(const std::string &bytes, uint16_t &seq, uint16_t &ack, uint16_t &flags)
{
  if ((int)bytes.size() < HEADER_LEN)
    return false;
  const char *header = bytes.data();
  seq = charToUint16(header);
  ack = charToUint16(header + 2);
  flags = charToUint16(header + 4);
  return true;
}

bool isValidFlagCombination(uint16_t flags)
{
  switch (flags)
  {
  case SYN_FLAG:
  case SYN_FLAG | ACK_FLAG:
  case ACK_FLAG:
  case FIN_FLAG:
  case FIN_FLAG | ACK_FLAG:
    return true;
  default:
    return false;
  }
}

/*------------------------------------------------------------
CONSTRUCTOR
-------------------------------------------------------------*/

DRTPPacket::DRTPPacket()
    : m_seq(0), m_ack(0), m_flags(0)
{
}

DRTPPacket::DRTPPacket(uint16_t seq, uint16_t ack, uint16_t flags, const std::string &payload)
    : m_seq(seq), m_ack(ack), m_flags(flags), m_payload(payload)
{
}

bool DRTPPacket::parse(const std::string &datagram)
{
  uint16_t seq, ack, flags;
  if (!decodeHeader(datagram, seq, ack, flags))
    return false;
  if (!isValidFlagCombination(flags))
    return false;

  m_seq = seq;
  m_ack = ack;
  m_flags = flags;
  m_payload = datagram.substr(HEADER_LEN); // no length field, the rest of the datagram is payload
  return true;
}

/*------------------------------------------------------------
GETTER FUNCTIONS
-------------------------------------------------------------*/

std::string DRTPPacket::getString() const
{
  return encodeHeader(m_seq, m_ack, m_flags) + m_payload;
}

uint16_t DRTPPacket::getSeqNum() const
{
  return m_seq;
}

uint16_t DRTPPacket::getAckNum() const
{
  return m_ack;
}

uint16_t DRTPPacket::getFlags() const
{
  return m_flags;
}

int DRTPPacket::getPayloadLength() const
{
  return m_payload.size();
}

bool DRTPPacket::isACK() const
{
  return m_flags & ACK_FLAG;
}

bool DRTPPacket::isFIN() const
{
  return m_flags & FIN_FLAG;
}

bool DRTPPacket::isSYN() const
{
  return m_flags & SYN_FLAG;
}

const std::string &DRTPPacket::getPayload() const
{
  return m_payload;
}

std::string DRTPPacket::describe() const
{
  std::string message = "seq=" + std::to_string(m_seq) + " ack=" + std::to_string(m_ack) + " ";
  if (isSYN())
    message += "SYN ";
  if (isACK())
    message += "ACK ";
  if (isFIN())
    message += "FIN ";
  message.pop_back(); // remove the trailing space
  return message;
}
