//
// Created by zavier on 2021/12/13.
//

#ifndef SHARDKV_PARSE_H
#define SHARDKV_PARSE_H
#include <memory>
#include <string>
#include <string_view>
#include "shardkv/common/task.h"
#include "http.h"
namespace shardkv::http{

/**
 * @brief HTTP 解析基类
 * 数据可以分多次喂进来，parser 把不完整的行缓存在内部。
 * 解析过程写成一个无栈协程，每次 resume 拿到一整行，或者一段固定长度的数据(chunk)。
 */
class HttpParser{
public:
    /// 错误码
    enum Error {
        NO_ERROR = 0,
        INVALID_METHOD,
        INVALID_PATH,
        INVALID_VERSION,
        INVALID_LINE,
        INVALID_HEADER,
        INVALID_CODE,
        INVALID_CHUNK,
        LINE_TOO_LONG,
    };

    virtual ~HttpParser() = default;

    /**
     * @brief 解析协议
     * @param data 协议文本内存
     * @param len 协议文本内存长度
     * @param chunk 头部解析完成后，用 true 继续解析 chunk 格式的消息体
     * @return 消费掉的长度，剩余未消费的数据会被移到 data 开头
     */
    size_t execute(char* data, size_t len, bool chunk = false);
    /**
     * @brief 1 完成，0 未完成，-1 出错
     */
    int isFinished() const;
    int hasError() const { return m_error;}

    uint64_t getContentLength() const { return m_message.getContentLength();}

protected:
    HttpParser(HttpMessage& message, uint64_t maxLine, uint64_t maxBody);

    virtual Error parseStartLine(std::string_view line) = 0;
    virtual void onChunkedBody(std::string body) { m_message.setBody(std::move(body));}

private:
    Task<Error> parseMessage();
    Task<Error> parseChunked();
    Error parseHeaderLine(std::string_view line);
    /**
     * @brief 收下一个字节，凑够协程要的输入时返回 true
     */
    bool collect(char c);
private:
    HttpMessage& m_message;
    uint64_t m_maxLine;
    uint64_t m_maxBody;
    Task<Error> m_parser;
    // 0 表示要一整行，否则是要的字节数
    size_t m_want = 0;
    std::string m_input;
    int m_error = NO_ERROR;
    bool m_finish = false;
    bool m_chunk = false;
};

class HttpRequestParser : public HttpParser{
public:
    using ptr = std::shared_ptr<HttpRequestParser>;
    HttpRequestParser();

    HttpRequest::ptr getData() const { return m_data;}

    /**
     * @brief 解析缓存大小，也是请求行和单个头部的最大长度
     */
    static uint64_t GetHttpRequestBufferSize();
    static uint64_t GetHttpRequestMaxBodySize();

protected:
    Error parseStartLine(std::string_view line) override;

private:
    explicit HttpRequestParser(HttpRequest::ptr data);
private:
    HttpRequest::ptr m_data;
};

class HttpResponseParser : public HttpParser{
public:
    using ptr = std::shared_ptr<HttpResponseParser>;
    HttpResponseParser();

    HttpResponse::ptr getData() const { return m_data;}

    bool isChunked() const;

    static uint64_t GetHttpResponseBufferSize();
    static uint64_t GetHttpResponseMaxBodySize();

protected:
    Error parseStartLine(std::string_view line) override;

private:
    explicit HttpResponseParser(HttpResponse::ptr data);
private:
    HttpResponse::ptr m_data;
};

}

#endif //SHARDKV_PARSE_H
