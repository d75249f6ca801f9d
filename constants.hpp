#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <cstdint>

// header flags (low 4 bits of the third header field)
const uint16_t SYN_FLAG = 0x8; // b1000
const uint16_t ACK_FLAG = 0x4; // b0100
const uint16_t FIN_FLAG = 0x2; // b0010

// packet layout
const int HEADER_LEN = 6;
const int MAX_PACKET_LENGTH = 1000;
const int MAX_PAYLOAD_LENGTH = MAX_PACKET_LENGTH - HEADER_LEN; // 994

// sequence numbers
const uint16_t CONTROL_SEQ_NUM = 0;
const uint16_t FILE_NAME_SEQ_NUM = 1;
const uint16_t FIRST_DATA_SEQ_NUM = 2;
const int NO_DISCARD = -1;

// timers
const float RETRANSMISSION_TIMEOUT = 0.5; // seconds, client link timeout
const float CONNECTION_TIMEOUT = 5;       // seconds, server inactivity
const float WAIT_FOREVER = -1;

// client constants
const long MAX_FILE_SIZE = 60000000; // bytes, keeps sequence numbers below 2^16
const int DEFAULT_WINDOW_SIZE = 3;

// common defaults
const char *const DEFAULT_IP = "127.0.0.1";
const int DEFAULT_PORT = 8080;
const int MIN_PORT = 1024;
const int MAX_PORT = 65535;

enum ConnectionState // Connection States enum
{
	IDLE,
	SYN_SENT,
	SYN_RCVD,
	ESTABLISHED,
	FIN_WAIT,
	CLOSED,
	ABORTED
};

enum RecvStatus
{
	RECV_OK,
	RECV_TIMEOUT,
	RECV_PEER_GONE,
	RECV_ERROR
};

enum SegmentStatus
{
	SEGMENT_DISCARDED,
	SEGMENT_MALFORMED,
	SEGMENT_FIN,
	SEGMENT_FILE_NAME,
	SEGMENT_ACCEPTED,
	SEGMENT_OUT_OF_ORDER,
	SEGMENT_WRITE_FAILED,
	SEGMENT_SEND_FAILED
};

#endif // CONSTANTS_HPP
