#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <string>
#include <netinet/in.h>
#include "constants.hpp"

/**
 * @brief Unreliable datagram transport the protocol engines run on.
 *
 * Exactly one peer is served at a time. A client channel knows its peer from the start,
 * a server channel learns it from the first datagram and locks onto it with acceptPeer().
 */
class Channel
{
public:
  virtual ~Channel() {}

  /**
   * @brief Sends one datagram to the peer
   *
   * @return bytes sent, -1 on failure (peer unreachable included)
   */
  virtual int sendDatagram(const std::string &datagram) = 0;

  /**
   * @brief Waits at most `timeoutSeconds` for one datagram, WAIT_FOREVER blocks indefinitely
   */
  virtual RecvStatus recvDatagram(std::string &datagram, float timeoutSeconds) = 0;

  /**
   * @brief Makes the sender of the last received datagram the only peer of this channel
   */
  virtual bool acceptPeer() = 0;

  virtual std::string peerName() const = 0;
};

class UdpChannel : public Channel
{
public:
  UdpChannel();
  ~UdpChannel();

  bool bindLocal(const std::string &ip, int port);   // server side
  bool connectPeer(const std::string &ip, int port); // client side

  int sendDatagram(const std::string &datagram) override;
  RecvStatus recvDatagram(std::string &datagram, float timeoutSeconds) override;
  bool acceptPeer() override;
  std::string peerName() const override;
  int localPort() const; // the bound port, useful after binding port 0
  void closeSocket();

private:
  bool openSocket();

  int m_sockFd;
  bool m_peerSet;
  struct sockaddr_in m_peerInfo;
  struct sockaddr_in m_lastSender; // needed by acceptPeer() on the server
  bool m_lastSenderValid;
};

#endif // CHANNEL_HPP
