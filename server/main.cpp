#include <iostream>
#include <stdexcept>
#include <string>

#include <cxxopts.hpp>

#include "config.hpp"
#include "server.hpp"

const std::string conffname = "server.conf";

int main(int argc, char **argv) {
    cxxopts::Options options("wtftpd", "wtftpd: Transmit-only TFTP server with windowed transfers");

    options.add_options()
        ("h,help", "Display this message", cxxopts::value<bool>())
        ("v,verbose", "Log every packet", cxxopts::value<bool>())
        ("c,config", "Config file", cxxopts::value<std::string>())
        ("a,address", "Bind address", cxxopts::value<std::string>())
        ("p,port", "Bind port", cxxopts::value<std::string>())
        ("r,root", "Directory to serve", cxxopts::value<std::string>());

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    std::cout << "Starting wtftpd" << std::endl;

    // Parse config
    std::string confpath = result.count("config") ? result["config"].as<std::string>() : conffname;
    server_config config;
    int r = load_config(confpath, &config);
    if (r == CONFIG_ENOFILE) {
        std::cout << "Config file not found, creating one..." << std::endl;
        create_config(confpath);
        return 1;
    }
    if (r > 0) {
        std::cout << "Error: " << confpath << ": syntax error on line " << r << std::endl;
        return 1;
    }
    if (r != CONFIG_OK) return 1;

    // Command line overrides
    if (result.count("address"))
        config.address = result["address"].as<std::string>();
    if (result.count("port")) {
        try {
            int port = std::stoi(result["port"].as<std::string>());
            if (port < 0 || port > 65535) throw std::out_of_range("port");
            config.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            std::cout << "Error: invalid port " << result["port"].as<std::string>() << std::endl;
            return 1;
        }
    }
    if (result.count("root"))
        config.root = result["root"].as<std::string>();
    if (result.count("verbose"))
        config.verbose = true;

    if (!resolve_root(&config)) return 1;

    std::cout << "Address: " << config.address << std::endl
        << "Port: " << config.port << std::endl
        << "Root: " << config.root.string() << std::endl
        << "Max retries: " << config.maxretries << (config.maxretries ? "" : " (no idle eviction)") << std::endl;

    server srv(config);
    WTFTP_CHECK_A(srv.open(), return 1)

    std::cout << "Listening on " << config.address << " port " << srv.port() << std::endl;
    srv.listen();

    return 0;
}
