//
// Created by zavier on 2021/12/11.
//

#define BOOST_TEST_MODULE test_http_parse

#include <boost/test/unit_test.hpp>
#include "shardkv/http/parse.h"
#include "shardkv/http/servlets/api_response.h"

using namespace shardkv::http;

namespace {
const char test_request_data[] = "POST /put?key=a%20b&flag HTTP/1.1\r\n"
                                 "Host: 127.0.0.1:8011\r\n"
                                 "Content-Type: application/json\r\n"
                                 "Content-Length: 10\r\n\r\n"
                                 "0123456789";

const char test_response_data[] = "HTTP/1.1 404 Not Found\r\n"
                                  "Content-Type: application/json\r\n"
                                  "Connection: close\r\n"
                                  "Content-Length: 17\r\n\r\n"
                                  "{\"success\":false}";

const char test_chunk_data[] = "HTTP/1.1 200 OK\r\n"
                               "Transfer-Encoding: chunked\r\n\r\n";

HttpRequest::ptr MakeRequest(const std::string& contentType, const std::string& query, const std::string& body) {
    HttpRequest::ptr request = std::make_shared<HttpRequest>();
    request->setMethod(HttpMethod::POST);
    request->setPath("/put");
    request->setQuery(query);
    if (!contentType.empty()) {
        request->setHeader("Content-Type", contentType);
    }
    request->setBody(body);
    request->initParams();
    return request;
}
}

BOOST_AUTO_TEST_SUITE(http_parse_tests)

BOOST_AUTO_TEST_CASE(request_line_and_headers) {
    HttpRequestParser parser;
    std::string tmp = test_request_data;
    size_t s = parser.execute(&tmp[0], tmp.size());
    BOOST_CHECK_EQUAL(parser.isFinished(), 1);
    BOOST_CHECK_EQUAL(parser.hasError(), 0);
    BOOST_CHECK_EQUAL(parser.getContentLength(), 10);
    // 解析过的数据被移除，剩下的是 body
    tmp.resize(tmp.size() - s);
    BOOST_CHECK_EQUAL(tmp, "0123456789");

    auto req = parser.getData();
    BOOST_CHECK(req->getMethod() == HttpMethod::POST);
    BOOST_CHECK_EQUAL(req->getPath(), "/put");
    BOOST_CHECK_EQUAL(req->getQuery(), "key=a%20b&flag");
    BOOST_CHECK_EQUAL(req->getHeader("host"), "127.0.0.1:8011");
    BOOST_CHECK(req->getContentType() == HttpContentType::APPLICATION_JSON);
    BOOST_CHECK(!req->isClose());

    req->initParams();
    BOOST_CHECK_EQUAL(req->getParam("key"), "a b");
    BOOST_CHECK(req->hasParam("flag"));
}

BOOST_AUTO_TEST_CASE(request_fed_in_pieces) {
    HttpRequestParser parser;
    std::string data = "GET /get?key=name HTTP/1.0\r\nConnection: keep-alive\r\n\r\n";
    std::string first = data.substr(0, 20);
    std::string second = data.substr(20);
    size_t s = parser.execute(&first[0], first.size());
    BOOST_CHECK_EQUAL(s, first.size());
    BOOST_CHECK_EQUAL(parser.isFinished(), 0);
    parser.execute(&second[0], second.size());
    BOOST_CHECK_EQUAL(parser.isFinished(), 1);
    auto req = parser.getData();
    BOOST_CHECK(req->getMethod() == HttpMethod::GET);
    BOOST_CHECK_EQUAL(req->getVersion(), 0x10);
    BOOST_CHECK(!req->isClose());
}

BOOST_AUTO_TEST_CASE(invalid_request) {
    HttpRequestParser parser;
    std::string data = "FETCH / HTTP/1.1\r\n\r\n";
    parser.execute(&data[0], data.size());
    BOOST_CHECK_EQUAL(parser.isFinished(), -1);
    BOOST_CHECK_EQUAL(parser.hasError(), HttpParser::INVALID_METHOD);

    HttpRequestParser version_parser;
    data = "GET / HTTP/2.0\r\n\r\n";
    version_parser.execute(&data[0], data.size());
    BOOST_CHECK_EQUAL(version_parser.hasError(), HttpParser::INVALID_VERSION);
}

BOOST_AUTO_TEST_CASE(malformed_lines) {
    HttpRequestParser bare_lf;
    std::string data = "GET / HTTP/1.1\n\n";
    bare_lf.execute(&data[0], data.size());
    BOOST_CHECK_EQUAL(bare_lf.hasError(), HttpParser::INVALID_LINE);

    HttpRequestParser no_colon;
    data = "GET / HTTP/1.1\r\nHost 127.0.0.1\r\n\r\n";
    no_colon.execute(&data[0], data.size());
    BOOST_CHECK_EQUAL(no_colon.hasError(), HttpParser::INVALID_HEADER);

    HttpRequestParser too_long;
    data = "GET /" + std::string(HttpRequestParser::GetHttpRequestBufferSize(), 'a');
    too_long.execute(&data[0], data.size());
    BOOST_CHECK_EQUAL(too_long.isFinished(), -1);
    BOOST_CHECK_EQUAL(too_long.hasError(), HttpParser::LINE_TOO_LONG);
}

BOOST_AUTO_TEST_CASE(response) {
    HttpResponseParser parser;
    std::string tmp = test_response_data;
    size_t s = parser.execute(&tmp[0], tmp.size());
    BOOST_CHECK_EQUAL(parser.isFinished(), 1);
    tmp.resize(tmp.size() - s);
    BOOST_CHECK_EQUAL(tmp, "{\"success\":false}");
    auto resp = parser.getData();
    BOOST_CHECK(resp->getStatus() == HttpStatus::NOT_FOUND);
    BOOST_CHECK_EQUAL(resp->getReason(), "Not Found");
    BOOST_CHECK_EQUAL(parser.getContentLength(), 17);
    BOOST_CHECK(resp->isClose());
    BOOST_CHECK(!parser.isChunked());
}

BOOST_AUTO_TEST_CASE(chunked_response) {
    HttpResponseParser parser;
    std::string tmp = test_chunk_data;
    parser.execute(&tmp[0], tmp.size());
    BOOST_REQUIRE_EQUAL(parser.isFinished(), 1);
    BOOST_REQUIRE(parser.isChunked());
    std::string body = "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n";
    size_t s = parser.execute(&body[0], body.size(), true);
    BOOST_CHECK_EQUAL(s, body.size());
    BOOST_CHECK_EQUAL(parser.isFinished(), 1);
    BOOST_CHECK_EQUAL(parser.getData()->getBody(), "hello world");
}

BOOST_AUTO_TEST_CASE(read_json_params) {
    auto request = MakeRequest("application/json; charset=utf-8", "extra=1", R"({"key":"k","val":"v","nodeid":"7"})");
    auto params = ReadParams(request);
    BOOST_REQUIRE(params);
    BOOST_CHECK_EQUAL(GetString(*params, "key").value_or(""), "k");
    BOOST_CHECK_EQUAL(GetString(*params, "extra").value_or(""), "1");
    BOOST_CHECK_EQUAL(GetInt(*params, "nodeid").value_or(0), 7);
    BOOST_CHECK(!GetString(*params, "missing"));

    BOOST_CHECK(!ReadParams(MakeRequest("application/json", "", "{not json")));
    BOOST_CHECK(!ReadParams(MakeRequest("application/json", "", "[1,2]")));
}

BOOST_AUTO_TEST_CASE(read_form_params) {
    auto request = MakeRequest("application/x-www-form-urlencoded", "", "shardID=2&shardAddress=127.0.0.1%3A8021");
    auto params = ReadParams(request);
    BOOST_REQUIRE(params);
    BOOST_CHECK_EQUAL(GetInt(*params, "shardID").value_or(0), 2);
    BOOST_CHECK_EQUAL(GetString(*params, "shardAddress").value_or(""), "127.0.0.1:8021");

    params = ReadParams(MakeRequest("", "nodeid=abc", ""));
    BOOST_REQUIRE(params);
    BOOST_CHECK(!GetInt(*params, "nodeid"));
}

BOOST_AUTO_TEST_CASE(kv_error_response) {
    HttpResponse::ptr response = std::make_shared<HttpResponse>();
    WriteKVError(response, shardkv::kv::WRONG_LEADER, "ignored", "127.0.0.1:8011");
    BOOST_CHECK(response->getStatus() == HttpStatus::BAD_REQUEST);
    Json body = Json::parse(response->getBody());
    BOOST_CHECK_EQUAL(body["success"], false);
    BOOST_CHECK_EQUAL(body["error"], kNotLeaderError);
    BOOST_CHECK_EQUAL(body["leader"], "127.0.0.1:8011");

    BOOST_CHECK(KVErrorToStatus(shardkv::kv::NO_KEY) == HttpStatus::NOT_FOUND);
    BOOST_CHECK(KVErrorToStatus(shardkv::kv::TIMEOUT) == HttpStatus::SERVICE_UNAVAILABLE);
    BOOST_CHECK(KVErrorToStatus(shardkv::kv::MEMBERSHIP) == HttpStatus::INTERNAL_SERVER_ERROR);

    WriteSuccess(response, "Key-value pair stored successfully", Json{{"key", "k"}});
    body = Json::parse(response->getBody());
    BOOST_CHECK(response->getStatus() == HttpStatus::OK);
    BOOST_CHECK_EQUAL(body["data"]["key"], "k");
}

BOOST_AUTO_TEST_SUITE_END()
