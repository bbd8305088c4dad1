#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <filesystem>
#include <string>
#include "network/http_server.hpp"
#include "tests/test_utils.hpp"

using namespace lfs::network;
namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {
constexpr uint16_t TEST_PORT = 12345;
}

class HTTPServerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::unique_ptr<HTTP_Server> server;

    void SetUp() override {
        init_test_logging();
        test_dir = make_temp_dir("lfs_server_test");

        lfs::config::ServerOptions options;
        options.root = test_dir.string();
        options.address = "127.0.0.1";
        options.port = TEST_PORT;
        options.threads = 2;
        options.valid = true;
        server = std::make_unique<HTTP_Server>(options);
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
            server.reset();
        }
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    // Connected client stream to the test server
    std::unique_ptr<beast::tcp_stream> connect() {
        auto stream = std::make_unique<beast::tcp_stream>(io_context);
        stream->connect(boost::asio::ip::tcp::endpoint(
            boost::asio::ip::make_address("127.0.0.1"), TEST_PORT));
        return stream;
    }

    http::response<http::string_body> exchange(beast::tcp_stream& stream, http::verb method,
                                               const std::string& target,
                                               const std::string& host = "localhost") {
        http::request<http::empty_body> request{method, target, 11};
        if (!host.empty()) {
            request.set(http::field::host, host);
        }
        http::write(stream, request);

        http::response_parser<http::string_body> parser;
        parser.body_limit(16 * 1024 * 1024);
        // Responses to HEAD announce a length but carry no body
        parser.skip(method == http::verb::head);
        http::read(stream, buffer, parser);
        return parser.release();
    }

    http::response<http::string_body> request(http::verb method, const std::string& target,
                                              const std::string& host = "localhost") {
        auto stream = connect();
        auto response = exchange(*stream, method, target, host);
        beast::error_code ec;
        stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        return response;
    }

    boost::asio::io_context io_context;
    beast::flat_buffer buffer;
};

TEST_F(HTTPServerTest, StartAndShutdown) {
    ASSERT_TRUE(server->start_listener());
    EXPECT_TRUE(server->is_running());
    ASSERT_FALSE(server->start_listener()); // Second start should fail

    server->shutdown();
    EXPECT_FALSE(server->is_running());

    // Should be able to start again after shutdown
    ASSERT_TRUE(server->start_listener());
}

TEST_F(HTTPServerTest, BindFailureIsReported) {
    ASSERT_TRUE(server->start_listener());

    lfs::config::ServerOptions options;
    options.root = test_dir.string();
    options.port = TEST_PORT;
    HTTP_Server second(options);
    EXPECT_FALSE(second.start_listener());
}

TEST_F(HTTPServerTest, MetadataRequest) {
    const std::string content = "hello lfs";
    const std::string oid = put_object(test_dir, content);
    ASSERT_TRUE(server->start_listener());

    auto response = request(http::verb::get, "/objects/" + oid, "localhost:12345");
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], "application/vnd.git-lfs+json");

    auto body = nlohmann::json::parse(response.body());
    EXPECT_EQ(body["oid"], oid);
    EXPECT_EQ(body["size"].get<std::uint64_t>(), content.size());
    EXPECT_EQ(body["_links"]["self"]["href"], "http://localhost:12345/objects/" + oid);
    EXPECT_EQ(body["_links"]["download"]["href"], "http://localhost:12345/data/objects/" + oid);
}

TEST_F(HTTPServerTest, HeadMetadataHasNoBody) {
    const std::string oid = put_object(test_dir, "head me");
    ASSERT_TRUE(server->start_listener());

    auto get = request(http::verb::get, "/objects/" + oid);
    auto head = request(http::verb::head, "/objects/" + oid);

    EXPECT_EQ(head.result(), http::status::ok);
    EXPECT_TRUE(head.body().empty());
    EXPECT_EQ(head[http::field::content_type], get[http::field::content_type]);
    EXPECT_EQ(head[http::field::content_length], get[http::field::content_length]);
}

TEST_F(HTTPServerTest, DownloadStreamsObject) {
    std::string content;
    for (int i = 0; i < 200000; ++i) {
        content += static_cast<char>(i % 251);
    }
    const std::string oid = put_object(test_dir, content);
    ASSERT_TRUE(server->start_listener());

    auto response = request(http::verb::get, "/data/objects/" + oid);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], "application/octet-stream");
    EXPECT_EQ(response.body().size(), content.size());
    EXPECT_TRUE(response.body() == content);

    auto head = request(http::verb::head, "/data/objects/" + oid);
    EXPECT_EQ(head.result(), http::status::ok);
    EXPECT_TRUE(head.body().empty());
    EXPECT_EQ(head[http::field::content_type], "application/octet-stream");
    EXPECT_EQ(head[http::field::content_length], std::to_string(content.size()));
}

TEST_F(HTTPServerTest, ErrorResponses) {
    ASSERT_TRUE(server->start_listener());
    const std::string missing(64, '1');

    auto not_found = request(http::verb::get, "/objects/" + missing);
    EXPECT_EQ(not_found.result(), http::status::not_found);
    EXPECT_EQ(nlohmann::json::parse(not_found.body()), nlohmann::json({{"message", "Object not found"}}));

    auto wrong_path = request(http::verb::get, "/somewhere/else");
    EXPECT_EQ(wrong_path.result(), http::status::not_found);
    EXPECT_EQ(nlohmann::json::parse(wrong_path.body()), nlohmann::json({{"message", "Wrong path"}}));

    auto post = request(http::verb::post, "/objects/batch");
    EXPECT_EQ(post.result(), http::status::not_implemented);
    EXPECT_EQ(post[http::field::content_type], "application/vnd.git-lfs+json");
    EXPECT_EQ(nlohmann::json::parse(post.body()), nlohmann::json({{"message", "Not implemented"}}));

    auto no_host = request(http::verb::get, "/objects/" + missing, "");
    EXPECT_EQ(no_host.result(), http::status::bad_request);
    EXPECT_EQ(nlohmann::json::parse(no_host.body()), nlohmann::json({{"message", "Wrong host"}}));
}

TEST_F(HTTPServerTest, KeepAliveServesSequentialRequests) {
    const std::string oid = put_object(test_dir, "keep alive");
    ASSERT_TRUE(server->start_listener());

    auto stream = connect();
    auto first = exchange(*stream, http::verb::head, "/data/objects/" + oid);
    auto second = exchange(*stream, http::verb::get, "/data/objects/" + oid);
    auto third = exchange(*stream, http::verb::get, "/objects/" + oid);

    EXPECT_EQ(first.result(), http::status::ok);
    EXPECT_EQ(second.body(), "keep alive");
    EXPECT_EQ(third.result(), http::status::ok);
}

TEST_F(HTTPServerTest, NonAsciiHostDoesNotStopSingleThreadServer) {
    const std::string oid = put_object(test_dir, "still here");

    lfs::config::ServerOptions options;
    options.root = test_dir.string();
    options.address = "127.0.0.1";
    options.port = TEST_PORT;
    options.threads = 1;
    options.valid = true;
    server = std::make_unique<HTTP_Server>(options);
    ASSERT_TRUE(server->start_listener());

    auto before = request(http::verb::get, "/objects/" + oid);
    EXPECT_EQ(before.result(), http::status::ok);

    auto bad = request(http::verb::get, "/objects/" + oid, "h\xff\xfe");
    EXPECT_EQ(bad.result(), http::status::bad_request);
    EXPECT_EQ(nlohmann::json::parse(bad.body()), nlohmann::json({{"message", "Wrong host"}}));

    auto after = request(http::verb::get, "/data/objects/" + oid);
    EXPECT_EQ(after.result(), http::status::ok);
    EXPECT_EQ(after.body(), "still here");
    EXPECT_TRUE(server->is_running());
}
