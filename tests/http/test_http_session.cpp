//
// Created by zavier on 2021/12/15.
//

#define BOOST_TEST_MODULE test_http_session

#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <libgo/libgo.h>
#include "shardkv/http/http_session.h"
#include "shardkv/net/address.h"
#include "shardkv/net/socket.h"

using namespace shardkv;
using namespace shardkv::http;

namespace {
struct SchedulerFixture {
    SchedulerFixture() {
        m_thread = std::thread([] {
            co_sched.Start(2);
        });
    }
    ~SchedulerFixture() {
        co_sched.Stop();
        m_thread.join();
    }
    std::thread m_thread;
};

/**
 * 在回环地址上接受一条连接，把收到的请求记录为 "method path?query body"，对端关闭后返回
 */
std::vector<std::string> ServeOnce(const std::string& data) {
    co::co_chan<Address::ptr> listening(1);
    co::co_chan<std::vector<std::string>> received(1);
    go [listening, received] {
        std::vector<std::string> requests;
        auto address = Address::Resolve("127.0.0.1", 0);
        auto server = Socket::CreateTCP(address);
        if (!server->bind(address) || !server->listen()) {
            listening << Address::ptr();
            received << requests;
            return;
        }
        listening << server->getLocalAddress();
        auto client = server->accept();
        if (client) {
            HttpSession session(client);
            while (auto request = session.recvRequest()) {
                requests.push_back(fmt::format("{} {}?{} {}", HttpMethodToString(request->getMethod()),
                                               request->getPath(), request->getQuery(), request->getBody()));
            }
        }
        received << requests;
    };
    Address::ptr local;
    listening.TimedPop(local, std::chrono::seconds(3));
    if (local) {
        go [local, data] {
            auto sock = Socket::CreateTCP(local);
            if (sock->connect(local, 1000)) {
                sock->send(data.data(), data.size());
                sock->close();
            }
        };
    }
    std::vector<std::string> requests;
    received.TimedPop(requests, std::chrono::seconds(5));
    return requests;
}
}

BOOST_TEST_GLOBAL_FIXTURE(SchedulerFixture);

BOOST_AUTO_TEST_SUITE(http_session_tests)

BOOST_AUTO_TEST_CASE(pipelined_requests_on_one_connection) {
    // 三个请求在同一次 send 里发出
    std::string data = "POST /put HTTP/1.1\r\n"
                       "Content-Length: 3\r\n\r\n"
                       "abc"
                       "GET /get?key=k HTTP/1.1\r\n\r\n"
                       "DELETE /delete HTTP/1.1\r\n"
                       "Content-Length: 1\r\n\r\n"
                       "x";
    auto requests = ServeOnce(data);
    std::vector<std::string> expect = {"POST /put? abc", "GET /get?key=k ", "DELETE /delete? x"};
    BOOST_CHECK_EQUAL_COLLECTIONS(requests.begin(), requests.end(), expect.begin(), expect.end());
}

BOOST_AUTO_TEST_CASE(incomplete_request_is_dropped) {
    std::string data = "POST /put HTTP/1.1\r\n"
                       "Content-Length: 3\r\n\r\n"
                       "abc"
                       "GET /get?key=k HTTP/1.1\r\n";
    auto requests = ServeOnce(data);
    BOOST_REQUIRE_EQUAL(requests.size(), 1);
    BOOST_CHECK_EQUAL(requests[0], "POST /put? abc");
}

BOOST_AUTO_TEST_SUITE_END()
