//
// Created by zavier on 2021/12/15.
//

#ifndef SHARDKV_STREAM_H
#define SHARDKV_STREAM_H
#include <sys/types.h>
#include <memory>
namespace shardkv {
/**
 * @brief 字节流接口，由 SocketStream 实现
 */
class Stream {
public:
    using ptr = std::shared_ptr<Stream>;
    virtual ~Stream() {};
    virtual ssize_t read(void* buffer, size_t length) = 0;
    virtual ssize_t write(const void* buffer, size_t length) = 0;
    virtual void close() = 0;

    /**
     * @brief 读满 length 个字节，出错或对端关闭时返回 <= 0
     */
    ssize_t readFixSize(void* buffer, size_t length);
    /**
     * @brief 写满 length 个字节，出错或对端关闭时返回 <= 0
     */
    ssize_t writeFixSize(const void* buffer, size_t length);
};
}
#endif //SHARDKV_STREAM_H
