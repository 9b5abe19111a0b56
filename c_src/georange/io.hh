
#ifndef GEORANGE_IO_HH
#define GEORANGE_IO_HH

#include <sys/time.h>

#include <string>

#include "ei.h"

#include "georange.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_IO_BEGIN


class Timer
{
    public:
        void start();
        double elapsed_ms();

    private:
        struct timeval tv;
};


class Bytes
{
    public:
        typedef std::shared_ptr<Bytes> Ptr;
        typedef std::vector<Ptr> Vector;
        typedef std::vector<Ptr>::iterator VIter;

        // Create objects that own the underlying memory
        static Ptr create(uint32_t len);

        // Create objects by copying the provided memory
        static Ptr copy(const uint8_t* const data, uint32_t len);
        static Ptr copy(const std::string& data);

        // Create objects that only proxy to the underlying memory
        static Ptr proxy(const char* data);

        ~Bytes();

        uint8_t* get();
        uint32_t size();

        std::string str();

    private:
        Bytes();
        Bytes(uint32_t len);
        Bytes(uint8_t* data, uint32_t len, bool owner);
        Bytes(const Bytes& other);

        bool owner;
        uint8_t* data;
        uint32_t len;
};


class Reader
{
    public:
        typedef std::shared_ptr<Reader> Ptr;

        // Returns NULL when the port has been closed.
        static Ptr recv();
        static Ptr create(Bytes::Ptr data);
        ~Reader();

        bool read(bool& val);
        bool read(int64_t& val);
        bool read(uint64_t& val);
        bool read(double& val);
        bool read(std::string& val);

        // Accepts either an integer or a float term.
        bool read_number(double& val);

        Bytes::Ptr read_bytes();

        // The read_SOMETHING_n functions are to assert
        // that the given arity was found for the data
        // type rather than an investigatory what is the
        // arity.

        bool read_tuple(int32_t& arity);
        bool read_tuple_n(int32_t arity);

        bool read_list(int32_t& arity);
        bool read_list_n(int32_t arity);
        bool read_empty_list();

        // Consumes the tail of a list read with read_list. Empty
        // lists have no separate tail.
        bool read_list_end(int32_t arity);

        bool at_end();

    private:
        Reader();
        Reader(Bytes::Ptr data);
        Reader(const Reader& other);

        const char* buf();

        Bytes::Ptr data;
        int32_t pos;
};


class Writer
{
    public:
        typedef std::shared_ptr<Writer> Ptr;
        typedef std::unique_ptr<ei_x_buff> EIXBuffPtr;

        static Ptr create();
        ~Writer();

        void send();
        Bytes::Ptr serialize();

        void write(bool val);
        void write(const char* val);
        void write(int64_t val);
        void write(uint64_t val);
        void write(double val);
        void write(Bytes::Ptr val);

        void start_tuple(int32_t arity);
        void start_list(int32_t arity);
        void write_empty_list();

        // Closes a list opened with start_list(arity).
        void end_list(int32_t arity);

    private:
        Writer();
        Writer(const Writer& other);

        EIXBuffPtr buff;
};


NS_GEORANGE_IO_END
NS_GEORANGE_END

#endif
