#include <string>
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include <poll.h>
#include <chrono>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include "channel.hpp"
#include "utilities.hpp"

static std::string addressToString(const struct sockaddr_in &addr)
{
  char ip[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
  return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

static bool fillAddress(const std::string &ip, int port, struct sockaddr_in &addr)
{
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET; // IPv4 only
  addr.sin_port = htons(port);
  return inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

UdpChannel::UdpChannel()
    : m_sockFd(-1), m_peerSet(false), m_lastSenderValid(false)
{
  memset(&m_peerInfo, 0, sizeof(m_peerInfo));
  memset(&m_lastSender, 0, sizeof(m_lastSender));
}

UdpChannel::~UdpChannel()
{
  closeSocket();
}

bool UdpChannel::openSocket()
{
  if (m_sockFd != -1)
    return true;
  m_sockFd = socket(AF_INET, SOCK_DGRAM, 0);
  if (m_sockFd == -1)
  {
    outputToStderr("ERROR: in socket " + std::string(strerror(errno)));
    return false;
  }
  return true;
}

bool UdpChannel::bindLocal(const std::string &ip, int port)
{
  struct sockaddr_in local;
  if (!fillAddress(ip, port, local))
  {
    outputToStderr("ERROR: invalid address " + ip);
    return false;
  }
  if (!openSocket())
    return false;

  if (bind(m_sockFd, (struct sockaddr *)&local, sizeof(local)) == -1)
  {
    outputToStderr("ERROR: in bind " + addressToString(local) + ": " + std::string(strerror(errno)));
    closeSocket();
    return false;
  }
  return true;
}

bool UdpChannel::connectPeer(const std::string &ip, int port)
{
  if (!fillAddress(ip, port, m_peerInfo))
  {
    outputToStderr("ERROR: invalid address " + ip);
    return false;
  }
  if (!openSocket())
    return false;

  // a connected UDP socket reports ICMP port unreachable as ECONNREFUSED
  if (connect(m_sockFd, (struct sockaddr *)&m_peerInfo, sizeof(m_peerInfo)) == -1)
  {
    outputToStderr("ERROR: in connect " + std::string(strerror(errno)));
    return false;
  }
  m_peerSet = true;
  return true;
}

bool UdpChannel::acceptPeer()
{
  if (m_peerSet)
    return true;
  if (!m_lastSenderValid)
    return false;

  // from now on the kernel filters out every other client
  if (connect(m_sockFd, (struct sockaddr *)&m_lastSender, sizeof(m_lastSender)) == -1)
  {
    outputToStderr("ERROR: in connect " + std::string(strerror(errno)));
    return false;
  }
  m_peerInfo = m_lastSender;
  m_peerSet = true;
  return true;
}

std::string UdpChannel::peerName() const
{
  if (m_peerSet)
    return addressToString(m_peerInfo);
  if (m_lastSenderValid)
    return addressToString(m_lastSender);
  return "unknown";
}

int UdpChannel::localPort() const
{
  struct sockaddr_in local;
  socklen_t localLen = sizeof(local);
  if (m_sockFd == -1 || getsockname(m_sockFd, (struct sockaddr *)&local, &localLen) == -1)
    return -1;
  return ntohs(local.sin_port);
}

int UdpChannel::sendDatagram(const std::string &datagram)
{
  if (m_sockFd == -1 || !m_peerSet)
    return -1;

  int bytesSent = send(m_sockFd, datagram.data(), datagram.size(), 0);
  if (bytesSent == -1)
  {
    std::string errorMessage = "Packet send Error: " + std::string(strerror(errno));
    outputToStderr(errorMessage);
  }
  return bytesSent;
}

static bool sameAddress(const struct sockaddr_in &a, const struct sockaddr_in &b)
{
  return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

RecvStatus UdpChannel::recvDatagram(std::string &datagram, float timeoutSeconds)
{
  if (m_sockFd == -1)
    return RECV_ERROR;

  c_time deadline = std::chrono::system_clock::now() + std::chrono::microseconds((long)(timeoutSeconds * 1000000));
  struct pollfd p;
  p.fd = m_sockFd;
  p.events = POLLIN;

  while (true)
  {
    int timeoutMs = -1;
    if (timeoutSeconds >= 0)
    {
      std::chrono::milliseconds left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::system_clock::now());
      timeoutMs = left.count() > 0 ? (int)left.count() : 0;
    }

    p.revents = 0;
    int ready = poll(&p, 1, timeoutMs);
    if (ready == -1)
    {
      if (errno == EINTR)
        continue;
      outputToStderr("ERROR: in poll " + std::string(strerror(errno)));
      return RECV_ERROR;
    }
    if (ready == 0)
      return RECV_TIMEOUT;

    char buffer[MAX_PACKET_LENGTH];
    struct sockaddr_in sender;
    socklen_t senderLen = sizeof(sender);
    int bytes = recvfrom(m_sockFd, buffer, MAX_PACKET_LENGTH, 0, (struct sockaddr *)&sender, &senderLen);
    if (bytes == -1)
    {
      if (errno == ECONNREFUSED || errno == ECONNRESET)
        return RECV_PEER_GONE;
      outputToStderr("ERROR: in recvfrom " + std::string(strerror(errno)));
      return RECV_ERROR;
    }

    // connect() does not flush datagrams queued before the peer was fixed
    if (m_peerSet && !sameAddress(sender, m_peerInfo))
    {
      outputToStdout("datagram from " + addressToString(sender) + " ignored, serving " + addressToString(m_peerInfo));
      continue;
    }

    m_lastSender = sender;
    m_lastSenderValid = true;
    datagram.assign(buffer, bytes);
    return RECV_OK;
  }
}

void UdpChannel::closeSocket()
{
  if (m_sockFd != -1)
  {
    close(m_sockFd);
    m_sockFd = -1;
  }
  m_peerSet = false;
  m_lastSenderValid = false;
}
