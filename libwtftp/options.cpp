#include "wtftp.hpp"

int wtftp_negotiate(std::vector<option_t>& options, uint64_t fsize, options_t *resolved) {
    options_t r;
    r.tsize = fsize;

    // later duplicates overwrite earlier ones
    for (option_t& o : options) {
        switch (o.type) {
            case WTFTP_OPT_BLKSIZE:
                if (o.value < WTFTP_MIN_BLKSIZE)
                    return wtftp_set_error(WTFTP_NERR_BLKSIZE);
                r.blksize = o.value;
                break;
            case WTFTP_OPT_TSIZE:
                o.value = fsize;
                break;
            case WTFTP_OPT_TIMEOUT:
                if (o.value == 0)
                    return wtftp_set_error(WTFTP_NERR_TIMEOUT);
                r.timeout = o.value;
                break;
            case WTFTP_OPT_WINDOWSIZE:
                if (o.value == 0 || o.value > WTFTP_MAX_WINDOWSIZE)
                    return wtftp_set_error(WTFTP_NERR_WINDOWSIZE);
                r.windowsize = static_cast<uint16_t>(o.value);
                break;
        }
    }

    *resolved = r;
    return WTFTP_OK;
}
