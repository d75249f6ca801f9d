#ifndef SERVER_HPP
#define SERVER_HPP

#include <string>
#include <cstdint>
#include "constants.hpp"
#include "config.hpp"
#include "channel.hpp"
#include "drtp.hpp"
#include "utilities.hpp"

class Server
{
public:
	// #1
	Server(const Config &config, Channel &channel);
	~Server(); // closes the output file, a partial file is removed
	bool run(); // engine function of the server, serves exactly one client

	// #2
	bool acceptConnection(); // SYN -> SYN-ACK -> ACK, fixes the peer
	bool receiveFile();      // data loop until FIN
	bool closeConnection();  // FIN-ACK, then the output file gets its final name
	SegmentStatus handleDatagram(const std::string &datagram);
	SegmentStatus handleSegment(const DRTPPacket &p);

	ConnectionState getState() const;
	uint16_t getExpectedSeqNum() const;
	const std::string &getFileName() const;
	const std::string &getOutputPath() const; // set once closeConnection() has renamed the file
	long getBytesWritten() const;

private:
	bool openOutputFile();
	int writeToFile(const std::string &data);
	void closeOutputFile();
	bool sendPacket(const DRTPPacket &p);
	bool sendAck(uint16_t seq);
	bool abortConnection(const std::string &reason);

	Config m_config;
	Channel &m_channel;
	ConnectionState m_state;
	int m_discardSequence;     // NO_DISCARD once used
	uint16_t m_expectedSeqNum; // next in-order sequence number
	std::string m_fileName;    // from the sequence 1 packet
	std::string m_partialPath; // output target while the transfer runs
	std::string m_outputPath;
	int m_fileFd;
	long m_bytesWritten;
	c_time m_transferStart;
	c_time m_transferEnd;
};

#endif // SERVER_HPP
