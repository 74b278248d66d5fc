#pragma once
#include <cstdint>

class io_handler
{
public:
    virtual ~io_handler() = default;
    virtual void on_cqe(struct io_uring_cqe* cqe) = 0;
};

enum op_type : uint8_t
{
    op_accept  = 0,
    op_read    = 1,
    op_write   = 2,
    op_timeout = 3,
    op_notify  = 4     // eventfd read: worker results are ready
};

struct io_request
{
    io_handler* owner;
    char* buffer;
    int fd;
    uint32_t length;
    op_type type;
};
