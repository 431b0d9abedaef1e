#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <iostream>
#include <system_error>

#include <netinet/in.h>
#include <unistd.h>

#include "server.hpp"

namespace fs = std::filesystem;

// RFC 2349 upper bound, caps the idle limit of a transfer
static const uint64_t max_timeout = 255;

static void print_error(const std::string& name, const char *what) {
    int e = wtftp_get_last_error();
    std::cout << name << ": Error while " << what << ": " << wtftp_get_last_error_str();
    if (e >= WTFTP_SYSERR_SOCKET && e <= WTFTP_SYSERR_STAT)
        std::cout << ": " << wtftp_get_last_sys_error_str();
    std::cout << std::endl;
}

server::server(const server_config& config) : config(config), sockfd(-1) { }

server::~server() {
    if (sockfd >= 0) {
        WTFTP_CHECK(wtftp_close(sockfd))
    }
}

int server::open() {
    struct addrinfo *ai = NULL;
    int r = wtftp_resolve(config.address.c_str(), config.port, true, &ai);
    if (r != WTFTP_OK) return r;

    int fd = -1;
    for (struct addrinfo *p = ai; p; p = p->ai_next) {
        if ((fd = wtftp_bind(p)) >= 0) break;
    }
    freeaddrinfo(ai);

    if (fd < 0) return wtftp_get_last_error();
    sockfd = fd;
    return WTFTP_OK;
}

uint16_t server::port() const {
    struct sockaddr_storage ss;
    socklen_t len = sizeof(ss);
    if (getsockname(sockfd, (struct sockaddr*)&ss, &len) < 0) return 0;
    if (ss.ss_family == AF_INET6) return ntohs(((struct sockaddr_in6*)&ss)->sin6_port);
    return ntohs(((struct sockaddr_in*)&ss)->sin_port);
}

const connection *server::find(const std::string& name) const {
    auto it = connmap.find(name);
    return it == connmap.end() ? NULL : &it->second;
}

void server::listen() {
    packet_t packet;
    struct sockaddr_storage from;
    socklen_t fromlen;
    char addrstr[256];

    while (true) {
        int r = wtftp_recv_packet(sockfd, &from, &fromlen, &packet);
        sweep(std::chrono::steady_clock::now());

        if (r == WTFTP_SYSERR_RECV || r == WTFTP_SYSERR_TIMEOUT) {
            WTFTP_CHECK(r)
            continue;
        }
        if (r != WTFTP_OK) {
            if (wtftp_get_sa_addr_str((struct sockaddr*)&from, addrstr, sizeof(addrstr)) != WTFTP_OK)
                std::snprintf(addrstr, sizeof(addrstr), "unknown");
            std::cout << addrstr << ": Malformed packet: " << wtftp_get_last_error_str() << std::endl;
            continue;
        }

        handle(from, fromlen, packet);
    }
}

void server::handle(const struct sockaddr_storage& from, socklen_t fromlen, const packet_t& packet) {
    char addrstr[256];
    WTFTP_CHECK_A(wtftp_get_sa_addr_str((const struct sockaddr*)&from, addrstr, sizeof(addrstr)), return)
    std::string name(addrstr);

    if (config.verbose)
        std::cout << name << ": [Packet] " << wtftp_packet_str(packet) << std::endl;

    switch (wtftp_packet_opcode(packet)) {
        case WTFTP_OP_RRQ:
            handle_rrq(from, fromlen, name, std::get<rrq_t>(packet));
            break;
        case WTFTP_OP_ACK:
            handle_ack(name, std::get<ack_t>(packet).block);
            break;
        case WTFTP_OP_ERROR: {
            const errmsg_t& err = std::get<errmsg_t>(packet);
            std::cout << name << ": Received ERROR " << err.code << ": " << err.msg << std::endl;
        } break;
        case WTFTP_OP_WRQ:
        case WTFTP_OP_DATA:
        case WTFTP_OP_OACK:
            std::cout << name << ": Received invalid packet " << wtftp_packet_str(packet) << std::endl;
            send_error(from, fromlen, name, WTFTP_ERRC_ILLEGAL, "invalid request");
            break;
    }
}

void server::handle_rrq(const struct sockaddr_storage& from, socklen_t fromlen, const std::string& name, const rrq_t& rrq) {
    std::cout << name << ": RRQ " << rrq.filename << " (" << rrq.mode << "): ";

    fs::path path;
    switch (wtftp_check_path(config.root, rrq.filename, &path)) {
        case WTFTP_PATH_ACCESS:
            std::cout << "EACCESS" << std::endl;
            send_error(from, fromlen, name, WTFTP_ERRC_ACCESS, "file access violation");
            return;
        case WTFTP_PATH_NOFILE:
            std::cout << "ENOFILE" << std::endl;
            send_error(from, fromlen, name, WTFTP_ERRC_NOFILE, "file does not exist");
            return;
        case WTFTP_PATH_EXISTS:
            break;
    }

    std::error_code ec;
    uint64_t fsize = fs::file_size(path, ec);
    if (ec) {
        wtftp_set_sys_error(WTFTP_SYSERR_STAT, ec.value());
        std::cout << "ESYS " << wtftp_get_last_sys_error_str() << std::endl;
        send_error(from, fromlen, name, WTFTP_ERRC_NOTDEF, "unexpected error");
        return;
    }

    std::vector<option_t> options = rrq.options;
    options_t resolved;
    if (wtftp_negotiate(options, fsize, &resolved) != WTFTP_OK) {
        std::cout << "EOPTION " << wtftp_get_last_error_str() << std::endl;
        send_error(from, fromlen, name, WTFTP_ERRC_NOTDEF, wtftp_get_last_error_str());
        return;
    }

    connection c;
    c.addr = from;
    c.addrlen = fromlen;
    c.name = name;
    c.seen = std::chrono::steady_clock::now();
    if (wtftp_open_transfer(path, resolved, !options.empty(), &c.transfer) != WTFTP_OK) {
        if (wtftp_get_last_sys_error() == EACCES) {
            std::cout << "EACCESS" << std::endl;
            send_error(from, fromlen, name, WTFTP_ERRC_ACCESS, "permission denied");
        } else {
            std::cout << "ESYS " << wtftp_get_last_sys_error_str() << std::endl;
            send_error(from, fromlen, name, WTFTP_ERRC_NOTDEF, "unexpected error");
        }
        return;
    }

    if (connmap.count(name)) std::cout << "restart ";
    auto it = connmap.insert_or_assign(name, std::move(c)).first;

    if (!options.empty()) {
        std::cout << "OACK " << fsize << " bytes" << std::endl;
        oack_t oack;
        oack.options = options;
        if (wtftp_send_packet(sockfd, (const struct sockaddr*)&from, fromlen, oack) != WTFTP_OK)
            print_error(name, "sending OACK");
    } else {
        std::cout << "DATA " << fsize << " bytes" << std::endl;
        send_window(it->second);
    }
}

void server::handle_ack(const std::string& name, uint16_t block) {
    auto it = connmap.find(name);
    if (it == connmap.end()) {
        std::cout << name << ": Error while handling ack " << block << ": missing state" << std::endl;
        return;
    }

    connection& c = it->second;
    transfer_t& t = c.transfer;
    c.seen = std::chrono::steady_clock::now();

    if (config.verbose) {
        uint16_t diff = static_cast<uint16_t>(block - t.block);
        std::cout << name << ": Received ack " << block << " (diff " << diff << ") (ws=" << t.options.windowsize << ")" << std::endl;
    }

    if (!wtftp_drain_window(t, block)) {
        if (t.negotiating) {
            std::cout << name << ": Ignored ack " << block << " while waiting for ack 0" << std::endl;
            return;
        }
        if (config.verbose)
            std::cout << name << ": Stale ack " << block << ", resending window at " << t.block << std::endl;
    }

    if (t.finished && t.window.empty()) {
        std::cout << name << ": Sent file " << t.path.string() << std::endl;
        connmap.erase(it);
        return;
    }

    send_window(c);
}

void server::send_window(connection& c) {
    transfer_t& t = c.transfer;
    if (wtftp_fill_window(t, NULL) != WTFTP_OK) {
        print_error(c.name, "reading file");
        return;
    }

    uint16_t block = t.block;
    for (const chunk_t& chunk : t.window) {
        if (config.verbose)
            std::cout << c.name << ": Sending block " << block << " with " << chunk.size() << " bytes" << std::endl;

        data_t data;
        data.block = block;
        data.payload = chunk;
        if (wtftp_send_packet(sockfd, (const struct sockaddr*)&c.addr, c.addrlen, data) != WTFTP_OK) {
            print_error(c.name, "sending data");
            return;
        }
        block++;
    }
}

void server::send_error(const struct sockaddr_storage& to, socklen_t tolen, const std::string& name, errcode_t code, const std::string& msg) {
    errmsg_t err;
    err.code = code;
    err.msg = msg;
    if (wtftp_send_packet(sockfd, (const struct sockaddr*)&to, tolen, err) != WTFTP_OK)
        print_error(name, "sending error");
}

void server::sweep(std::chrono::steady_clock::time_point now) {
    if (config.maxretries == 0) return;

    for (auto it = connmap.begin(); it != connmap.end();) {
        const connection& c = it->second;
        uint64_t timeout = std::min(c.transfer.options.timeout, max_timeout);
        std::chrono::seconds limit(timeout * config.maxretries + 1);
        if (now - c.seen > limit) {
            std::cout << c.name << ": Evicted idle transfer of " << c.transfer.path.string() << std::endl;
            it = connmap.erase(it);
        } else {
            ++it;
        }
    }
}
