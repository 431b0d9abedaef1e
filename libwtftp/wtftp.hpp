#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <deque>
#include <variant>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#define WTFTP_DEFAULT_PORT          6969
#define WTFTP_DEFAULT_BLKSIZE       512
#define WTFTP_DEFAULT_TIMEOUT       5       // seconds
#define WTFTP_DEFAULT_WINDOWSIZE    1
#define WTFTP_DEFAULT_RETRIES       6

#define WTFTP_HEADER_SIZE           4       // opcode + block number
#define WTFTP_MAX_DATA_SIZE         65464   // RFC 2348 block size limit
#define WTFTP_MAX_PACKET_SIZE       (WTFTP_MAX_DATA_SIZE + WTFTP_HEADER_SIZE)
#define WTFTP_MIN_BLKSIZE           8       // RFC 2348 lower bound
#define WTFTP_MAX_WINDOWSIZE        65535
#define WTFTP_MAX_WINDOW_BYTES      (32 * 1024 * 1024)  // buffered per transfer

/* Wire opcodes */
enum opcode_t : uint16_t {
    WTFTP_OP_RRQ = 1,
    WTFTP_OP_WRQ,
    WTFTP_OP_DATA,
    WTFTP_OP_ACK,
    WTFTP_OP_ERROR,
    WTFTP_OP_OACK
};

/* Wire error codes */
enum errcode_t : uint16_t {
    WTFTP_ERRC_NOTDEF,
    WTFTP_ERRC_NOFILE,
    WTFTP_ERRC_ACCESS,
    WTFTP_ERRC_DISKFULL,
    WTFTP_ERRC_ILLEGAL,
    WTFTP_ERRC_TID,
    WTFTP_ERRC_EXISTS,
    WTFTP_ERRC_NOUSER
};

/* Negotiable options, "blksize", "tsize", "timeout", "windowsize" */
enum option_type_t : uint8_t {
    WTFTP_OPT_BLKSIZE,
    WTFTP_OPT_TSIZE,
    WTFTP_OPT_TIMEOUT,
    WTFTP_OPT_WINDOWSIZE
};

struct option_t {
    option_type_t type;
    uint64_t value;
};

/* Packets */
struct request_t {
    std::string filename;
    std::string mode;
    std::vector<option_t> options;
};

struct rrq_t : request_t {};
struct wrq_t : request_t {};

struct data_t {
    uint16_t block;
    std::vector<uint8_t> payload;
};

struct ack_t {
    uint16_t block;
};

struct errmsg_t {
    errcode_t code;
    std::string msg;
};

struct oack_t {
    std::vector<option_t> options;
};

// alternatives are kept in opcode order, see wtftp_packet_opcode()
typedef std::variant<rrq_t, wrq_t, data_t, ack_t, errmsg_t, oack_t> packet_t;

/* Resolved transfer parameters */
struct options_t {
    uint64_t blksize = WTFTP_DEFAULT_BLKSIZE;
    uint64_t tsize = 0;
    uint64_t timeout = WTFTP_DEFAULT_TIMEOUT;
    uint16_t windowsize = WTFTP_DEFAULT_WINDOWSIZE;
};

typedef std::vector<uint8_t> chunk_t;

/* State of one outgoing file */
struct transfer_t {
    std::ifstream file;
    std::filesystem::path path;
    options_t options;
    uint16_t block = 1;             // next block the client must acknowledge
    std::deque<chunk_t> window;     // unacknowledged chunks, starting at block
    bool finished = false;          // last (short or empty) chunk is queued
    bool negotiating = false;       // OACK sent, waiting for ack 0
    size_t maxbytes = WTFTP_MAX_WINDOW_BYTES;
};

/* Path check result, never sent on the wire */
enum path_stat_t {
    WTFTP_PATH_EXISTS,
    WTFTP_PATH_NOFILE,
    WTFTP_PATH_ACCESS
};

enum {
    WTFTP_OK,
/* Packet parse errors */
    WTFTP_PERR_OPCODE,          /* Unrecognised opcode */
    WTFTP_PERR_SIZE,            /* Packet truncated */
    WTFTP_PERR_STRING,          /* String not NUL terminated */
    WTFTP_PERR_OPTION,          /* Invalid option value */
    WTFTP_PERR_CODE,            /* Unrecognised error code */
/* Packet encode errors */
    WTFTP_EERR_SIZE,            /* Field too big */
    WTFTP_EERR_STRING,          /* String contains NUL */
    WTFTP_EERR_OPTION,          /* Unknown option type */
    WTFTP_EERR_CODE,            /* Unknown error code */
/* Negotiation errors */
    WTFTP_NERR_TIMEOUT,         /* Invalid timeout value */
    WTFTP_NERR_WINDOWSIZE,      /* Invalid windowsize value */
    WTFTP_NERR_BLKSIZE,         /* Invalid blksize value */
/* System errors */
    WTFTP_SYSERR_SOCKET,        /* Unable to create socket */
    WTFTP_SYSERR_RESOLV,        /* Unable to resolve host */
    WTFTP_SYSERR_NOIP,          /* No IP address found for host */
    WTFTP_SYSERR_BIND,          /* Error binding socket */
    WTFTP_SYSERR_RECV,          /* Error receiving */
    WTFTP_SYSERR_SEND,          /* Error sending */
    WTFTP_SYSERR_CLOSE,         /* Error closing */
    WTFTP_SYSERR_TIMEOUT,       /* Receive timed out */
    WTFTP_SYSERR_OPEN,          /* Unable to open file */
    WTFTP_SYSERR_READ,          /* Error reading file */
    WTFTP_SYSERR_NOMEM,         /* Out of memory */
    WTFTP_SYSERR_STAT,          /* Unable to stat file */
/* Implementation errors */
    WTFTP_IERR_BSIZE            /* Buffer size too small */
};

#define WTFTP_CHECK(x) if ((x) != WTFTP_OK) { std::cout << "Error: " << wtftp_get_last_error_str(); if (wtftp_get_last_error() >= WTFTP_SYSERR_SOCKET && wtftp_get_last_error() <= WTFTP_SYSERR_STAT) { std::cout << ": " << wtftp_get_last_sys_error_str(); } std::cout << std::endl; }
#define WTFTP_CHECK_A(x, a) if ((x) != WTFTP_OK) { std::cout << "Error: " << wtftp_get_last_error_str(); if (wtftp_get_last_error() >= WTFTP_SYSERR_SOCKET && wtftp_get_last_error() <= WTFTP_SYSERR_STAT) { std::cout << ": " << wtftp_get_last_sys_error_str(); } std::cout << std::endl; a; }

/* Errors */
int wtftp_get_last_error();
const char *wtftp_get_last_error_str();
int wtftp_get_last_sys_error();
const char *wtftp_get_last_sys_error_str();
int wtftp_set_error(int error);
int wtftp_set_sys_error(int error, int syserror);
const char *wtftp_errcode_str(errcode_t code);

/* Codec */
opcode_t wtftp_packet_opcode(const packet_t& packet);
const char *wtftp_option_name(option_type_t type);
int wtftp_encode(const packet_t& packet, std::vector<uint8_t> *buf);
int wtftp_decode(const uint8_t *data, size_t size, packet_t *packet);
std::string wtftp_packet_str(const packet_t& packet);

/* Negotiation, rewrites the tsize value in place for the OACK echo */
int wtftp_negotiate(std::vector<option_t>& options, uint64_t fsize, options_t *resolved);

/* Files */
path_stat_t wtftp_check_path(const std::filesystem::path& root, const std::string& filename, std::filesystem::path *resolved);
int wtftp_open_transfer(const std::filesystem::path& path, const options_t& options, bool negotiated, transfer_t *transfer);
int wtftp_fill_window(transfer_t& transfer, bool *room);
bool wtftp_drain_window(transfer_t& transfer, uint16_t ack);

/* Network */
int wtftp_resolve(const char *host, uint16_t port, bool passive, struct addrinfo **addrs);
int wtftp_open(const struct addrinfo *addr);
int wtftp_bind(const struct addrinfo *addr);
int wtftp_get_sa_addr_str(const struct sockaddr *addr, char *str, size_t strlen);
int wtftp_set_timeout(int fd, int seconds);
int wtftp_send_packet(int fd, const struct sockaddr *to, socklen_t tolen, const packet_t& packet);
int wtftp_recv_packet(int fd, struct sockaddr_storage *from, socklen_t *fromlen, packet_t *packet);
int wtftp_close(int fd);
