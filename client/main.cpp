#include <iostream>
#include <fstream>
#include <cstring>
#include <stdexcept>
#include <string>

#include <cxxopts.hpp>

#include <libwtftp/wtftp.hpp>

#define MAX_TRIES 6

int connect(const std::string& host, uint16_t port, struct sockaddr_storage *server, socklen_t *serverlen) {
    struct addrinfo *addr = NULL, *p = NULL;
    char addrstr[256];
    WTFTP_CHECK_A(wtftp_resolve(host.c_str(), port, false, &addr), return -1)
    p = addr;
    int fd = -1;

    while (p) {
        WTFTP_CHECK(wtftp_get_sa_addr_str(p->ai_addr, addrstr, 256))
        std::cout << "Trying " << addrstr << "..." << std::endl;

        if ((fd = wtftp_open(p)) < 0) {
            std::cout << "Error: " << wtftp_get_last_error_str() << ": " << wtftp_get_last_sys_error_str() << std::endl;
        } else {
            std::memcpy(server, p->ai_addr, p->ai_addrlen);
            *serverlen = p->ai_addrlen;
            break;
        }

        p = p->ai_next;
    }

    freeaddrinfo(addr);
    return fd;
}

bool add_option(const cxxopts::ParseResult& result, const char *name, option_type_t type, rrq_t *rrq) {
    if (!result.count(name)) return true;
    try {
        option_t o;
        o.type = type;
        o.value = std::stoull(result[name].as<std::string>());
        rrq->options.push_back(o);
    } catch (const std::exception&) {
        std::cout << "Invalid " << name << " " << result[name].as<std::string>() << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char **argv) {
    cxxopts::Options options("wtftp-get", "wtftp-get: Download a file over TFTP");

    options.add_options()
        ("h,help", "Display this message", cxxopts::value<bool>())
        ("v,verbose", "Verbose output", cxxopts::value<bool>())
        ("p,port", "Specify port", cxxopts::value<std::string>())
        ("o,output", "Output file", cxxopts::value<std::string>())
        ("b,blksize", "Request block size", cxxopts::value<std::string>())
        ("w,windowsize", "Request window size", cxxopts::value<std::string>())
        ("t,timeout", "Request timeout in seconds", cxxopts::value<std::string>())
        ("s,tsize", "Request transfer size", cxxopts::value<bool>())
        ("host", "The host to download from", cxxopts::value<std::string>())
        ("file", "The remote file", cxxopts::value<std::string>());

    options.parse_positional({"host", "file"});
    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("host") || !result.count("file")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    bool verbose = result.count("verbose") > 0;
    uint16_t port = WTFTP_DEFAULT_PORT;
    if (result.count("port")) {
        try {
            int p = std::stoi(result["port"].as<std::string>());
            if (p <= 0 || p > 65535) throw std::out_of_range("port");
            port = static_cast<uint16_t>(p);
        } catch (const std::exception&) {
            std::cout << "Error: invalid port " << result["port"].as<std::string>() << std::endl;
            return 1;
        }
    }

    rrq_t rrq;
    rrq.filename = result["file"].as<std::string>();
    rrq.mode = "octet";
    if (!add_option(result, "blksize", WTFTP_OPT_BLKSIZE, &rrq)) return 1;
    if (!add_option(result, "windowsize", WTFTP_OPT_WINDOWSIZE, &rrq)) return 1;
    if (!add_option(result, "timeout", WTFTP_OPT_TIMEOUT, &rrq)) return 1;
    if (result.count("tsize"))
        rrq.options.push_back(option_t{WTFTP_OPT_TSIZE, 0});

    std::string output = result.count("output") ? result["output"].as<std::string>()
        : std::filesystem::path(rrq.filename).filename().string();

    struct sockaddr_storage server;
    socklen_t serverlen = 0;
    int fd = connect(result["host"].as<std::string>(), port, &server, &serverlen);
    if (fd < 0) return 1;

    WTFTP_CHECK_A(wtftp_set_timeout(fd, WTFTP_DEFAULT_TIMEOUT), return 1)

    std::ofstream out(output, std::ios::binary);
    if (!out.is_open()) {
        std::cout << "Error: cannot open " << output << std::endl;
        return 1;
    }

    // adopted from the OACK, the server may ignore the request's options
    options_t opts;
    uint16_t expected = 1;
    unsigned inwindow = 0;
    uint64_t received = 0;
    bool gapacked = false;
    bool started = false;
    bool done = false;
    int tries = 0;

    packet_t last = rrq;
    WTFTP_CHECK_A(wtftp_send_packet(fd, (struct sockaddr*)&server, serverlen, last), return 1)

    while (!done) {
        packet_t packet;
        struct sockaddr_storage from;
        socklen_t fromlen;
        int r = wtftp_recv_packet(fd, &from, &fromlen, &packet);

        if (r == WTFTP_SYSERR_TIMEOUT) {
            if (++tries == MAX_TRIES) {
                std::cout << "Error: transfer timed out after " << MAX_TRIES << " tries" << std::endl;
                return 1;
            }
            // a partial window is acknowledged up to the last block received
            if (inwindow > 0) {
                last = ack_t{static_cast<uint16_t>(expected - 1)};
                inwindow = 0;
            }
            if (verbose) std::cout << "Timeout, resending " << wtftp_packet_str(last) << std::endl;
            WTFTP_CHECK_A(wtftp_send_packet(fd, (struct sockaddr*)&server, serverlen, last), return 1)
            continue;
        }
        if (r == WTFTP_SYSERR_RECV) {
            WTFTP_CHECK(r)
            return 1;
        }
        if (r != WTFTP_OK) {
            WTFTP_CHECK(r)
            continue;
        }

        // replies may come from a transfer port other than the request port
        if (!started) {
            server = from;
            serverlen = fromlen;
            started = true;
        }

        if (verbose) std::cout << "Received " << wtftp_packet_str(packet) << std::endl;

        switch (wtftp_packet_opcode(packet)) {
            case WTFTP_OP_OACK: {
                if (received || expected != 1) break;
                for (const option_t& o : std::get<oack_t>(packet).options) {
                    switch (o.type) {
                        case WTFTP_OPT_BLKSIZE: opts.blksize = o.value; break;
                        case WTFTP_OPT_WINDOWSIZE: opts.windowsize = static_cast<uint16_t>(o.value); break;
                        case WTFTP_OPT_TSIZE: std::cout << "Size: " << o.value << " bytes" << std::endl; break;
                        case WTFTP_OPT_TIMEOUT:
                            opts.timeout = o.value;
                            WTFTP_CHECK(wtftp_set_timeout(fd, static_cast<int>(o.value)))
                            break;
                    }
                }
                tries = 0;
                last = ack_t{0};
                WTFTP_CHECK_A(wtftp_send_packet(fd, (struct sockaddr*)&server, serverlen, last), return 1)
            } break;
            case WTFTP_OP_DATA: {
                const data_t& d = std::get<data_t>(packet);
                if (d.block != expected) {
                    // ahead of us means a lost block, behind is a duplicate
                    if (static_cast<uint16_t>(d.block - expected) < 0x8000 && !gapacked) {
                        last = ack_t{static_cast<uint16_t>(expected - 1)};
                        WTFTP_CHECK_A(wtftp_send_packet(fd, (struct sockaddr*)&server, serverlen, last), return 1)
                        gapacked = true;
                        inwindow = 0;
                    }
                    break;
                }

                out.write(reinterpret_cast<const char*>(d.payload.data()), d.payload.size());
                if (!out.good()) {
                    std::cout << "Error: writing " << output << " failed" << std::endl;
                    return 1;
                }
                received += d.payload.size();
                expected++;
                inwindow++;
                gapacked = false;
                tries = 0;

                done = d.payload.size() < opts.blksize;
                if (done || inwindow >= opts.windowsize) {
                    last = ack_t{d.block};
                    WTFTP_CHECK_A(wtftp_send_packet(fd, (struct sockaddr*)&server, serverlen, last), return 1)
                    inwindow = 0;
                }
            } break;
            case WTFTP_OP_ERROR: {
                const errmsg_t& e = std::get<errmsg_t>(packet);
                std::cout << "Error: server: " << wtftp_errcode_str(e.code) << ": " << e.msg << std::endl;
                return 1;
            }
            case WTFTP_OP_RRQ:
            case WTFTP_OP_WRQ:
            case WTFTP_OP_ACK:
                std::cout << "Unexpected packet " << wtftp_packet_str(packet) << std::endl;
                break;
        }
    }

    std::cout << "Received " << output << ": " << received << " bytes" << std::endl;
    WTFTP_CHECK(wtftp_close(fd))
    return 0;
}
