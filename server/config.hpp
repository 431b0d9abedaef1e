#pragma once

#include <string>

#include "server.hpp"

enum {
    CONFIG_EVALUE = -2,     /* Value out of range */
    CONFIG_ENOFILE = -1,    /* File missing or unreadable */
    CONFIG_OK = 0           /* > 0: line of the first syntax error */
};

int load_config(const std::string& path, server_config *config);
void create_config(const std::string& path);
bool resolve_root(server_config *config);
