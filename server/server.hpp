#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include <sys/socket.h>

#include <libwtftp/wtftp.hpp>

struct server_config {
    std::string address = "0.0.0.0";
    uint16_t port = WTFTP_DEFAULT_PORT;
    std::filesystem::path root = "/srv/tftp";
    unsigned maxretries = WTFTP_DEFAULT_RETRIES;   // 0 keeps idle transfers forever
    bool verbose = false;
};

struct connection {
    struct sockaddr_storage addr;
    socklen_t addrlen;
    std::string name;
    transfer_t transfer;
    std::chrono::steady_clock::time_point seen;
};

/*
 * Single socket, single thread. Every datagram is handled to completion
 * before the next one is read, the server never sends on its own: data
 * only goes out in answer to a request or an acknowledgement.
 */
class server {
public:
    explicit server(const server_config& config);
    ~server();

    int open();
    void listen();

    void handle(const struct sockaddr_storage& from, socklen_t fromlen, const packet_t& packet);
    // drops transfers the client stopped acknowledging
    void sweep(std::chrono::steady_clock::time_point now);

    int fd() const { return sockfd; }
    uint16_t port() const;
    size_t connections() const { return connmap.size(); }
    const connection *find(const std::string& name) const;

private:
    void handle_rrq(const struct sockaddr_storage& from, socklen_t fromlen, const std::string& name, const rrq_t& rrq);
    void handle_ack(const std::string& name, uint16_t block);
    void send_window(connection& c);
    void send_error(const struct sockaddr_storage& to, socklen_t tolen, const std::string& name, errcode_t code, const std::string& msg);

    server_config config;
    int sockfd;
    std::map<std::string, connection> connmap;
};
