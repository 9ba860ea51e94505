//
// Created by zavier on 2021/10/22.
//

#ifndef SHARDKV_NONCOPYABLE_H
#define SHARDKV_NONCOPYABLE_H
namespace shardkv{
class Noncopyable{
public:
    Noncopyable() = default;
    ~Noncopyable() = default;
    Noncopyable(const Noncopyable& noncopyable) = delete;
    Noncopyable& operator=(const Noncopyable& noncopyable) = delete;
};
}
#endif //SHARDKV_NONCOPYABLE_H
