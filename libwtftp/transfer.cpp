#include <cerrno>
#include <new>
#include <system_error>

#include "wtftp.hpp"

namespace fs = std::filesystem;

// component-wise prefix test, trailing separators on root are ignored
static bool inside(const fs::path& root, const fs::path& p) {
    auto it = p.begin();
    for (const fs::path& c : root) {
        if (c.empty()) continue;
        if (it == p.end() || *it != c) return false;
        ++it;
    }
    return true;
}

path_stat_t wtftp_check_path(const fs::path& root, const std::string& filename, fs::path *resolved) {
    fs::path name(filename);
    for (const fs::path& c : name)
        if (c == "..") return WTFTP_PATH_ACCESS;

    // absolute names replace root here and must still land inside it
    fs::path full = (root / name).lexically_normal();
    if (!inside(root.lexically_normal(), full))
        return WTFTP_PATH_ACCESS;

    std::error_code ec;
    fs::path realroot = fs::weakly_canonical(root, ec);
    if (ec) return WTFTP_PATH_ACCESS;
    fs::path real = fs::weakly_canonical(full, ec);
    if (ec || !inside(realroot, real))
        return WTFTP_PATH_ACCESS;

    if (!fs::is_regular_file(real, ec))
        return WTFTP_PATH_NOFILE;

    *resolved = real;
    return WTFTP_PATH_EXISTS;
}

int wtftp_open_transfer(const fs::path& path, const options_t& options, bool negotiated, transfer_t *transfer) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return wtftp_set_sys_error(WTFTP_SYSERR_OPEN, errno);

    transfer->file = std::move(file);
    transfer->path = path;
    transfer->options = options;
    // an OACK goes out first and is acknowledged as block 0
    transfer->block = negotiated ? 0 : 1;
    transfer->negotiating = negotiated;
    transfer->window.clear();
    transfer->finished = false;
    return WTFTP_OK;
}

// windowsize chunks, but never more than maxbytes buffered (at least one chunk)
static bool window_full(const transfer_t& transfer) {
    const options_t& o = transfer.options;
    if (transfer.window.size() >= o.windowsize) return true;
    if (transfer.window.empty()) return false;
    return (transfer.window.size() + 1) * o.blksize > transfer.maxbytes;
}

int wtftp_fill_window(transfer_t& transfer, bool *room) {
    const options_t& o = transfer.options;
    if (o.blksize > WTFTP_MAX_DATA_SIZE)
        return wtftp_set_error(WTFTP_EERR_SIZE);

    // nothing is read before the OACK is acknowledged
    while (!transfer.negotiating && !transfer.finished && !window_full(transfer)) {
        chunk_t chunk;
        try {
            chunk.resize(o.blksize);
        } catch (const std::bad_alloc&) {
            return wtftp_set_sys_error(WTFTP_SYSERR_NOMEM, ENOMEM);
        }

        transfer.file.read(reinterpret_cast<char*>(chunk.data()), chunk.size());
        if (transfer.file.bad())
            return wtftp_set_sys_error(WTFTP_SYSERR_READ, errno);

        size_t n = static_cast<size_t>(transfer.file.gcount());
        if (n == 0 || n < chunk.size()) {
            chunk.resize(n);
            transfer.finished = true;
        }
        transfer.window.push_back(std::move(chunk));
    }

    if (room) *room = !window_full(transfer);
    return WTFTP_OK;
}

bool wtftp_drain_window(transfer_t& transfer, uint16_t ack) {
    // only ack 0 answers the OACK
    if (transfer.negotiating) {
        if (ack != 0) return false;
        transfer.negotiating = false;
        transfer.block = 1;
        return true;
    }

    uint16_t diff = static_cast<uint16_t>(ack - transfer.block);
    if (diff > transfer.options.windowsize)
        return false;

    transfer.block = static_cast<uint16_t>(ack + 1);
    for (uint32_t i = 0; i <= diff && !transfer.window.empty(); i++)
        transfer.window.pop_front();
    return true;
}
