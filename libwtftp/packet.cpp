#include <algorithm>
#include <charconv>
#include <cctype>
#include <sstream>

#include "wtftp.hpp"

static const char *optionnames[] = {
    "blksize",
    "tsize",
    "timeout",
    "windowsize"
};

static const char *opcodenames[] = {
    "RRQ",
    "WRQ",
    "DATA",
    "ACK",
    "ERROR",
    "OACK"
};

const char *wtftp_option_name(option_type_t type) {
    if (type > WTFTP_OPT_WINDOWSIZE) return "unknown";
    return optionnames[type];
}

opcode_t wtftp_packet_opcode(const packet_t& packet) {
    return static_cast<opcode_t>(packet.index() + WTFTP_OP_RRQ);
}

// Encoding

static void put_u16(std::vector<uint8_t> *buf, uint16_t v) {
    buf->push_back(static_cast<uint8_t>(v >> 8));
    buf->push_back(static_cast<uint8_t>(v & 0xff));
}

static int put_str(std::vector<uint8_t> *buf, const std::string& s) {
    if (s.find('\0') != std::string::npos)
        return wtftp_set_error(WTFTP_EERR_STRING);
    buf->insert(buf->end(), s.begin(), s.end());
    buf->push_back('\0');
    return WTFTP_OK;
}

static int put_options(std::vector<uint8_t> *buf, const std::vector<option_t>& options) {
    for (const option_t& o : options) {
        if (o.type > WTFTP_OPT_WINDOWSIZE)
            return wtftp_set_error(WTFTP_EERR_OPTION);
        int e = put_str(buf, wtftp_option_name(o.type));
        if (e != WTFTP_OK) return e;
        if ((e = put_str(buf, std::to_string(o.value))) != WTFTP_OK) return e;
    }
    return WTFTP_OK;
}

static int put_request(std::vector<uint8_t> *buf, opcode_t op, const request_t& r) {
    put_u16(buf, op);
    int e = put_str(buf, r.filename);
    if (e != WTFTP_OK) return e;
    if ((e = put_str(buf, r.mode)) != WTFTP_OK) return e;
    return put_options(buf, r.options);
}

struct encoder {
    std::vector<uint8_t> *buf;

    int operator()(const rrq_t& p) const { return put_request(buf, WTFTP_OP_RRQ, p); }
    int operator()(const wrq_t& p) const { return put_request(buf, WTFTP_OP_WRQ, p); }

    int operator()(const data_t& p) const {
        if (p.payload.size() > WTFTP_MAX_DATA_SIZE)
            return wtftp_set_error(WTFTP_EERR_SIZE);
        put_u16(buf, WTFTP_OP_DATA);
        put_u16(buf, p.block);
        buf->insert(buf->end(), p.payload.begin(), p.payload.end());
        return WTFTP_OK;
    }

    int operator()(const ack_t& p) const {
        put_u16(buf, WTFTP_OP_ACK);
        put_u16(buf, p.block);
        return WTFTP_OK;
    }

    int operator()(const errmsg_t& p) const {
        if (p.code > WTFTP_ERRC_NOUSER)
            return wtftp_set_error(WTFTP_EERR_CODE);
        put_u16(buf, WTFTP_OP_ERROR);
        put_u16(buf, p.code);
        return put_str(buf, p.msg);
    }

    int operator()(const oack_t& p) const {
        put_u16(buf, WTFTP_OP_OACK);
        return put_options(buf, p.options);
    }
};

int wtftp_encode(const packet_t& packet, std::vector<uint8_t> *buf) {
    buf->clear();
    int e = std::visit(encoder{buf}, packet);
    if (e != WTFTP_OK) return e;
    if (buf->size() > WTFTP_MAX_PACKET_SIZE)
        return wtftp_set_error(WTFTP_EERR_SIZE);
    return WTFTP_OK;
}

// Decoding

static uint16_t get_u16(const uint8_t *p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static int get_str(const uint8_t *&p, const uint8_t *end, std::string *out) {
    const uint8_t *nul = std::find(p, end, '\0');
    if (nul == end)
        return wtftp_set_error(WTFTP_PERR_STRING);
    out->assign(reinterpret_cast<const char*>(p), nul - p);
    p = nul + 1;
    return WTFTP_OK;
}

static std::string lower(std::string s) {
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Unknown option names are skipped, a known one with a non-numeric value is an error
static int get_options(const uint8_t *p, const uint8_t *end, std::vector<option_t> *options) {
    std::string name, value;
    while (p < end) {
        int e = get_str(p, end, &name);
        if (e != WTFTP_OK) return e;
        if ((e = get_str(p, end, &value)) != WTFTP_OK) return e;

        name = lower(name);
        const char **it = std::find_if(std::begin(optionnames), std::end(optionnames),
            [&name](const char *n) { return name == n; });
        if (it == std::end(optionnames)) continue;

        option_t o;
        o.type = static_cast<option_type_t>(it - std::begin(optionnames));
        const char *first = value.data();
        const char *last = value.data() + value.size();
        auto res = std::from_chars(first, last, o.value);
        if (value.empty() || res.ec != std::errc() || res.ptr != last)
            return wtftp_set_error(WTFTP_PERR_OPTION);

        options->push_back(o);
    }
    return WTFTP_OK;
}

static int get_request(const uint8_t *p, const uint8_t *end, request_t *r) {
    int e = get_str(p, end, &r->filename);
    if (e != WTFTP_OK) return e;
    if ((e = get_str(p, end, &r->mode)) != WTFTP_OK) return e;
    return get_options(p, end, &r->options);
}

int wtftp_decode(const uint8_t *data, size_t size, packet_t *packet) {
    if (size < 2)
        return wtftp_set_error(WTFTP_PERR_SIZE);

    const uint8_t *p = data + 2;
    const uint8_t *end = data + size;

    switch (get_u16(data)) {
        case WTFTP_OP_RRQ: {
            rrq_t rrq;
            int e = get_request(p, end, &rrq);
            if (e != WTFTP_OK) return e;
            *packet = std::move(rrq);
        } break;
        case WTFTP_OP_WRQ: {
            wrq_t wrq;
            int e = get_request(p, end, &wrq);
            if (e != WTFTP_OK) return e;
            *packet = std::move(wrq);
        } break;
        case WTFTP_OP_DATA: {
            if (size < WTFTP_HEADER_SIZE)
                return wtftp_set_error(WTFTP_PERR_SIZE);
            data_t d;
            d.block = get_u16(p);
            d.payload.assign(p + 2, end);
            *packet = std::move(d);
        } break;
        case WTFTP_OP_ACK: {
            if (size < WTFTP_HEADER_SIZE)
                return wtftp_set_error(WTFTP_PERR_SIZE);
            *packet = ack_t{get_u16(p)};
        } break;
        case WTFTP_OP_ERROR: {
            if (size < WTFTP_HEADER_SIZE)
                return wtftp_set_error(WTFTP_PERR_SIZE);
            uint16_t code = get_u16(p);
            if (code > WTFTP_ERRC_NOUSER)
                return wtftp_set_error(WTFTP_PERR_CODE);
            errmsg_t err;
            err.code = static_cast<errcode_t>(code);
            p += 2;
            int e = get_str(p, end, &err.msg);
            if (e != WTFTP_OK) return e;
            *packet = std::move(err);
        } break;
        case WTFTP_OP_OACK: {
            oack_t oack;
            int e = get_options(p, end, &oack.options);
            if (e != WTFTP_OK) return e;
            *packet = std::move(oack);
        } break;
        default:
            return wtftp_set_error(WTFTP_PERR_OPCODE);
    }

    return WTFTP_OK;
}

static void print_options(std::ostringstream& ss, const std::vector<option_t>& options) {
    for (const option_t& o : options)
        ss << " " << wtftp_option_name(o.type) << "=" << o.value;
}

std::string wtftp_packet_str(const packet_t& packet) {
    std::ostringstream ss;
    ss << opcodenames[packet.index()];

    if (const request_t *r = std::get_if<rrq_t>(&packet)) {
        ss << " " << r->filename << " (" << r->mode << ")";
        print_options(ss, r->options);
    } else if (const request_t *w = std::get_if<wrq_t>(&packet)) {
        ss << " " << w->filename << " (" << w->mode << ")";
        print_options(ss, w->options);
    } else if (const data_t *d = std::get_if<data_t>(&packet)) {
        ss << " " << d->block << " (" << d->payload.size() << " bytes)";
    } else if (const ack_t *a = std::get_if<ack_t>(&packet)) {
        ss << " " << a->block;
    } else if (const errmsg_t *e = std::get_if<errmsg_t>(&packet)) {
        ss << " " << e->code << " " << wtftp_errcode_str(e->code) << ": " << e->msg;
    } else if (const oack_t *o = std::get_if<oack_t>(&packet)) {
        print_options(ss, o->options);
    }

    return ss.str();
}
