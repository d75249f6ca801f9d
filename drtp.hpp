#ifndef DRTP_HPP
#define DRTP_HPP
#include <cstdint>
#include <string>

/**
 * @brief Packs the three header fields into 6 bytes of network byte order
 */
std::string encodeHeader(uint16_t seq, uint16_t ack, uint16_t flags);

/**
 * @brief Unpacks the first 6 bytes of `bytes` into the header fields
 *
 * @return false if fewer than 6 bytes were given, the out parameters are untouched then
 */
bool decodeHeader(const std::string &bytes, uint16_t &seq, uint16_t &ack, uint16_t &flags);

/**
 * @brief true for SYN, SYN|ACK, ACK, FIN and FIN|ACK, false for anything else
 */
bool isValidFlagCombination(uint16_t flags);

class DRTPPacket
{
public:
  // Constructors
  DRTPPacket();
  DRTPPacket(uint16_t seq, uint16_t ack, uint16_t flags, const std::string &payload = "");

  // fills the packet from a received datagram; false if it is too short or the flags are illegal
  bool parse(const std::string &datagram);

  // Getter Functions
  uint16_t getSeqNum() const;
  uint16_t getAckNum() const;
  uint16_t getFlags() const;
  int getPayloadLength() const;
  bool isACK() const;
  bool isFIN() const;
  bool isSYN() const;
  const std::string &getPayload() const;
  std::string getString() const; // header + payload, ready for the wire
  std::string describe() const;  // "seq=3 ack=0 ACK" for the logs

private:
  // Data Members
  uint16_t m_seq, m_ack;
  uint16_t m_flags;
  std::string m_payload;
};

#endif // DRTP_HPP
