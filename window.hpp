#ifndef WINDOW_HPP
#define WINDOW_HPP

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Go-Back-N send window: the in-flight sequence numbers, oldest first, and
 * the exact bytes last transmitted for each of them.
 *
 * The sequences always form a contiguous increasing run and never exceed the capacity.
 */
class SlidingWindow
{
public:
  explicit SlidingWindow(int capacity);

  bool admit(uint16_t seq, const std::string &packet); // false when full or not contiguous
  bool popHead();                                       // slides the window by exactly one
  uint16_t head() const;
  const std::string &packet(uint16_t seq) const;        // seq must be in the window

  bool isFull() const;
  bool empty() const;
  int size() const;
  int capacity() const;
  std::vector<uint16_t> sequences() const;
  std::string toString() const; // "[2, 3, 4]"

private:
  int m_capacity;
  std::deque<uint16_t> m_inFlight;
  std::map<uint16_t, std::string> m_packetStore;
};

#endif // WINDOW_HPP
