#include <string>
#include "window.hpp"

SlidingWindow::SlidingWindow(int capacity)
    : m_capacity(capacity < 1 ? 1 : capacity)
{
}

bool SlidingWindow::admit(uint16_t seq, const std::string &packet)
{
  if (isFull())
    return false;
  if (!m_inFlight.empty() && seq != m_inFlight.back() + 1)
    return false;

  m_inFlight.push_back(seq);
  m_packetStore[seq] = packet;
  return true;
}

bool SlidingWindow::popHead()
{
  if (m_inFlight.empty())
    return false;
  m_packetStore.erase(m_inFlight.front());
  m_inFlight.pop_front();
  return true;
}

uint16_t SlidingWindow::head() const
{
  return m_inFlight.front();
}

const std::string &SlidingWindow::packet(uint16_t seq) const
{
  return m_packetStore.at(seq);
}

bool SlidingWindow::isFull() const
{
  return (int)m_inFlight.size() >= m_capacity;
}

bool SlidingWindow::empty() const
{
  return m_inFlight.empty();
}

int SlidingWindow::size() const
{
  return m_inFlight.size();
}

int SlidingWindow::capacity() const
{
  return m_capacity;
}

std::vector<uint16_t> SlidingWindow::sequences() const
{
  return std::vector<uint16_t>(m_inFlight.begin(), m_inFlight.end());
}

std::string SlidingWindow::toString() const
{
  std::string result = "[";
  for (size_t i = 0; i < m_inFlight.size(); i++)
  {
    if (i > 0)
      result += ", ";
    result += std::to_string(m_inFlight[i]);
  }
  return result + "]";
}
