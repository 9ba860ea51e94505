//
// Created by zavier on 2021/12/15.
//

#include "shardkv/common/stream.h"

namespace shardkv {

ssize_t Stream::readFixSize(void *buffer, size_t length) {
    size_t offset = 0;
    size_t left = length;
    while (left > 0) {
        ssize_t n = read((char*)buffer + offset, left);
        if(n <= 0) {
            return n;
        }
        offset += n;
        left -= n;
    }
    return length;
}

ssize_t Stream::writeFixSize(const void *buffer, size_t length) {
    size_t offset = 0;
    size_t left = length;
    while (left > 0) {
        ssize_t n = write((const char*)buffer + offset, left);
        if(n <= 0) {
            return n;
        }
        offset += n;
        left -= n;
    }
    return length;
}

}
