#include <cstring>

#include <netdb.h>

#include "wtftp.hpp"

static int lasterror = WTFTP_OK;
static int lastsyserror = 0;

static const char *errorstrs[] = {
    "Success",
    "Unrecognised opcode",
    "Packet truncated",
    "String not terminated",
    "Invalid option value",
    "Unrecognised error code",
    "Field too big",
    "String contains NUL",
    "Unknown option type",
    "Unknown error code",
    "Invalid timeout value",
    "Invalid windowsize value",
    "Invalid blksize value",
    "Unable to create socket",
    "Unable to resolve host",
    "No IP address found for host",
    "Error binding socket",
    "Error receiving",
    "Error sending",
    "Error closing",
    "Receive timed out",
    "Unable to open file",
    "Error reading file",
    "Out of memory",
    "Unable to stat file",
    "Buffer size too small"
};

static const char *errcodestrs[] = {
    "Not defined",
    "File not found",
    "Access violation",
    "Disk full",
    "Illegal operation",
    "Unknown transfer ID",
    "File already exists",
    "No such user"
};

int wtftp_get_last_error() {
    return lasterror;
}

const char *wtftp_get_last_error_str() {
    if (lasterror < WTFTP_OK || lasterror > WTFTP_IERR_BSIZE)
        return "Unknown error";
    return errorstrs[lasterror];
}

int wtftp_get_last_sys_error() {
    return lastsyserror;
}

const char *wtftp_get_last_sys_error_str() {
    // resolver failures carry a getaddrinfo code, not an errno
    if (lasterror == WTFTP_SYSERR_RESOLV)
        return gai_strerror(lastsyserror);
    return strerror(lastsyserror);
}

int wtftp_set_error(int error) {
    lasterror = error;
    return error;
}

int wtftp_set_sys_error(int error, int syserror) {
    lasterror = error;
    lastsyserror = syserror;
    return error;
}

const char *wtftp_errcode_str(errcode_t code) {
    if (code > WTFTP_ERRC_NOUSER) return "Unknown";
    return errcodestrs[code];
}
