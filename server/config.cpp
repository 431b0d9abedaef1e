#include <fstream>
#include <iostream>
#include <system_error>

#include <INIReader.h>

#include "config.hpp"

namespace fs = std::filesystem;

int load_config(const std::string& path, server_config *config) {
    INIReader reader(path);
    if (reader.ParseError() != 0)
        return reader.ParseError() < 0 ? CONFIG_ENOFILE : reader.ParseError();

    config->address = reader.Get("", "address", "0.0.0.0");

    long port = reader.GetInteger("", "port", WTFTP_DEFAULT_PORT);
    if (port < 0 || port > 65535) {
        std::cout << "Error: port out of range: " << port << std::endl;
        return CONFIG_EVALUE;
    }
    config->port = static_cast<uint16_t>(port);

    config->root = reader.Get("", "root", "/srv/tftp");

    long retries = reader.GetInteger("", "maxretries", WTFTP_DEFAULT_RETRIES);
    if (retries < 0) {
        std::cout << "Error: maxretries must not be negative" << std::endl;
        return CONFIG_EVALUE;
    }
    config->maxretries = static_cast<unsigned>(retries);

    config->verbose = reader.GetBoolean("", "verbose", false);
    return CONFIG_OK;
}

void create_config(const std::string& path) {
    std::ofstream conffile(path);
    if (!conffile.is_open()) {
        std::cout << "Error writing config file" << std::endl;
        return;
    }
    conffile << "# Sample config file\naddress=0.0.0.0\nport=6969\nroot=/srv/tftp\nmaxretries=6\nverbose=false\n";
}

bool resolve_root(server_config *config) {
    std::error_code ec;
    fs::path root = fs::canonical(config->root, ec);
    if (ec || !fs::is_directory(root, ec)) {
        std::cout << "Error: root " << config->root.string() << " is not a directory" << std::endl;
        return false;
    }
    config->root = root;
    return true;
}
