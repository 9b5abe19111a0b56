#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>
#include <arpa/inet.h>

#include <string>

#include "config.hh"
#include "exceptions.hh"
#include "io.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_IO_BEGIN


// Loops over short reads and EINTR. Returns the number of bytes
// read, which is only less than len at end of stream.
static ssize_t
read_exact(int fd, uint8_t* buf, size_t len)
{
    size_t got = 0;

    while(got < len) {
        ssize_t ret = ::read(fd, buf + got, len - got);
        if(ret == 0) {
            break;
        } else if(ret < 0) {
            if(errno == EINTR) {
                continue;
            }
            return -1;
        }
        got += (size_t) ret;
    }

    return (ssize_t) got;
}


static bool
write_exact(int fd, const uint8_t* buf, size_t len)
{
    size_t done = 0;

    while(done < len) {
        ssize_t ret = ::write(fd, buf + done, len - done);
        if(ret < 0) {
            if(errno == EINTR) {
                continue;
            }
            return false;
        }
        done += (size_t) ret;
    }

    return true;
}


void
Timer::start()
{
    gettimeofday(&(this->tv), NULL);
}


double
Timer::elapsed_ms()
{
    struct timeval now;
    gettimeofday(&now, NULL);

    double secs = (double) (now.tv_sec - this->tv.tv_sec);
    double usecs = (double) (now.tv_usec - this->tv.tv_usec);

    return secs * 1000.0 + usecs / 1000.0;
}


Bytes::Ptr
Bytes::create(uint32_t len)
{
    return Ptr(new Bytes(len));
}


Bytes::Ptr
Bytes::copy(const uint8_t* const data, uint32_t len)
{
    Ptr p(new Bytes(len));
    if(len > 0) {
        memcpy(p->get(), data, len);
    }
    return p;
}


Bytes::Ptr
Bytes::copy(const std::string& data)
{
    return Bytes::copy((const uint8_t*) data.data(), (uint32_t) data.size());
}


Bytes::Ptr
Bytes::proxy(const char* data)
{
    return Ptr(new Bytes((uint8_t*) data, strlen(data), false));
}


Bytes::Bytes(uint32_t len)
{
    this->owner = true;
    this->data = new uint8_t[len];
    this->len = len;
}


Bytes::Bytes(uint8_t* data, uint32_t len, bool owner)
{
    this->owner = owner;
    this->data = data;
    this->len = len;
}


Bytes::~Bytes()
{
    if(owner) {
        delete [] this->data;
    }
}


uint8_t*
Bytes::get()
{
    return this->data;
}


uint32_t
Bytes::size()
{
    return this->len;
}


std::string
Bytes::str()
{
    return std::string((const char*) this->data, this->len);
}


Reader::Ptr
Reader::recv()
{
    uint32_t packet_len;
    ssize_t ret;

    ret = read_exact(GEORANGE_STREAM_IN, (uint8_t*) &packet_len, sizeof(uint32_t));
    if(ret == 0) {
        return NULL;
    } else if(ret != sizeof(uint32_t)) {
        throw GeorangeExit(GEORANGE_ERROR_BAD_READ);
    }

    packet_len = ntohl(packet_len);

    Bytes::Ptr data = Bytes::create(packet_len);
    ret = read_exact(GEORANGE_STREAM_IN, data->get(), packet_len);
    if(ret != (ssize_t) packet_len) {
        throw GeorangeExit(GEORANGE_ERROR_BAD_READ);
    }

    return Ptr(new Reader(data));
}


Reader::Ptr
Reader::create(Bytes::Ptr data)
{
    return Ptr(new Reader(data));
}


Reader::Reader(Bytes::Ptr data)
{
    this->data = data;
    this->pos = 0;

    if(!this->data) {
        throw GeorangeException("Invalid data source for Reader.");
    }

    int vsn;
    if(ei_decode_version(this->buf(), &(this->pos), &vsn) != 0) {
        throw GeorangeException("Invalid version data in Reader data.");
    }
}


Reader::~Reader()
{
}


const char*
Reader::buf()
{
    return (const char*) this->data->get();
}


bool
Reader::read(bool& val)
{
    int b;

    if(ei_decode_boolean(this->buf(), &(this->pos), &b) != 0) {
        return false;
    }

    val = b ? true : false;

    return true;
}


bool
Reader::read(int64_t& val)
{
    long long v;

    if(ei_decode_longlong(this->buf(), &(this->pos), &v) != 0) {
        return false;
    }

    val = (int64_t) v;
    return true;
}


bool
Reader::read(uint64_t& val)
{
    unsigned long long v;

    if(ei_decode_ulonglong(this->buf(), &(this->pos), &v) != 0) {
        return false;
    }

    val = (uint64_t) v;
    return true;
}


bool
Reader::read(double& val)
{
    if(ei_decode_double(this->buf(), &(this->pos), &val) != 0) {
        return false;
    }

    return true;
}


bool
Reader::read(std::string& val)
{
    int type;
    int size;

    if(ei_get_type(this->buf(), &(this->pos), &type, &size) != 0) {
        return false;
    }

    switch(type) {
        case ERL_ATOM_EXT:
        case ERL_SMALL_ATOM_EXT:
        case ERL_ATOM_UTF8_EXT:
        case ERL_SMALL_ATOM_UTF8_EXT: {
            char atom[MAXATOMLEN_UTF8];
            if(ei_decode_atom(this->buf(), &(this->pos), atom) != 0) {
                return false;
            }
            val = atom;
            return true;
        }
        case ERL_BINARY_EXT: {
            Bytes::Ptr b = this->read_bytes();
            if(!b) {
                return false;
            }
            val = b->str();
            return true;
        }
        case ERL_STRING_EXT: {
            std::unique_ptr<char[]> str(new char[size + 1]);
            if(ei_decode_string(this->buf(), &(this->pos), str.get()) != 0) {
                return false;
            }
            val = std::string(str.get(), size);
            return true;
        }
        default:
            return false;
    }
}


bool
Reader::read_number(double& val)
{
    int type;
    int size;

    if(ei_get_type(this->buf(), &(this->pos), &type, &size) != 0) {
        return false;
    }

    switch(type) {
        case ERL_FLOAT_EXT:
        case NEW_FLOAT_EXT:
            return this->read(val);
        case ERL_SMALL_INTEGER_EXT:
        case ERL_INTEGER_EXT:
        case ERL_SMALL_BIG_EXT:
        case ERL_LARGE_BIG_EXT: {
            int64_t i;
            if(!this->read(i)) {
                return false;
            }
            val = (double) i;
            return true;
        }
        default:
            return false;
    }
}


Bytes::Ptr
Reader::read_bytes()
{
    int type;
    int size;

    if(ei_get_type(this->buf(), &(this->pos), &type, &size) != 0) {
        return NULL;
    }

    if(type != ERL_BINARY_EXT) {
        return NULL;
    }

    Bytes::Ptr b = Bytes::create((uint32_t) size);
    long len;
    if(ei_decode_binary(this->buf(), &(this->pos), b->get(), &len) != 0) {
        return NULL;
    }

    return b;
}


bool
Reader::read_tuple(int32_t& arity)
{
    int found;

    if(ei_decode_tuple_header(this->buf(), &(this->pos), &found) != 0) {
        return false;
    }

    arity = found;
    return true;
}


bool
Reader::read_tuple_n(int32_t arity)
{
    int32_t found;

    if(!this->read_tuple(found)) {
        return false;
    }

    if(found != arity) {
        return false;
    }

    return true;
}


bool
Reader::read_list(int32_t& arity)
{
    int found;

    if(ei_decode_list_header(this->buf(), &(this->pos), &found) != 0) {
        return false;
    }

    arity = found;
    return true;
}


bool
Reader::read_list_n(int32_t arity)
{
    int32_t found;

    if(!this->read_list(found)) {
        return false;
    }

    if(found != arity) {
        return false;
    }

    return true;
}


bool
Reader::read_empty_list()
{
    return this->read_list_n(0);
}


bool
Reader::read_list_end(int32_t arity)
{
    if(arity == 0) {
        return true;
    }

    return this->read_empty_list();
}


bool
Reader::at_end()
{
    return this->pos >= (int32_t) this->data->size();
}


Writer::Ptr
Writer::create()
{
    return Ptr(new Writer());
}


Writer::Writer() : buff(new ei_x_buff)
{
    if(ei_x_new_with_version(this->buff.get()) != 0) {
        throw GeorangeException("Error initializing Writer buffer.");
    }
}


Writer::~Writer()
{
    ei_x_free(this->buff.get());
}


void
Writer::send()
{
    uint32_t packet_len = htonl((uint32_t) this->buff->index);

    if(!write_exact(GEORANGE_STREAM_OUT,
            (const uint8_t*) &packet_len, sizeof(uint32_t))) {
        throw GeorangeExit(GEORANGE_ERROR_BAD_WRITE);
    }

    if(!write_exact(GEORANGE_STREAM_OUT,
            (const uint8_t*) this->buff->buff, this->buff->index)) {
        throw GeorangeExit(GEORANGE_ERROR_BAD_WRITE);
    }
}


Bytes::Ptr
Writer::serialize()
{
    // Copied so the result can outlive this writer.
    return Bytes::copy((uint8_t*) this->buff->buff, this->buff->index);
}


void
Writer::write(bool val)
{
    if(ei_x_encode_boolean(this->buff.get(), val) != 0) {
        throw GeorangeException("Unable to encode boolean value.");
    }
}


void
Writer::write(const char* val)
{
    if(ei_x_encode_atom(this->buff.get(), val) != 0) {
        throw GeorangeException("Unable to encode atom value.");
    }
}


void
Writer::write(int64_t val)
{
    if(ei_x_encode_longlong(this->buff.get(), val) != 0) {
        throw GeorangeException("Unable to encode int64_t value.");
    }
}


void
Writer::write(uint64_t val)
{
    if(ei_x_encode_ulonglong(this->buff.get(), val) != 0) {
        throw GeorangeException("Unable to encode uint64_t value.");
    }
}


void
Writer::write(double val)
{
    if(ei_x_encode_double(this->buff.get(), val) != 0) {
        throw GeorangeException("Unable to encode double value.");
    }
}


void
Writer::write(Bytes::Ptr val)
{
    if(ei_x_encode_binary(this->buff.get(), val->get(), val->size()) != 0) {
        throw GeorangeException("Unable to encode binary value.");
    }
}


void
Writer::start_tuple(int32_t arity)
{
    if(ei_x_encode_tuple_header(this->buff.get(), arity) != 0) {
        throw GeorangeException("Unable to encode tuple header.");
    }
}


void
Writer::start_list(int32_t arity)
{
    if(ei_x_encode_list_header(this->buff.get(), arity) != 0) {
        throw GeorangeException("Unable to encode list header.");
    }
}


void
Writer::write_empty_list()
{
    if(ei_x_encode_empty_list(this->buff.get()) != 0) {
        throw GeorangeException("Unable to encode empty list.");
    }
}


void
Writer::end_list(int32_t arity)
{
    if(arity > 0) {
        this->write_empty_list();
    }
}


NS_GEORANGE_IO_END
NS_GEORANGE_END
