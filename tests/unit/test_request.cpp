#include "../framework/SimpleTest.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

import std;

import model;
import net;
import request;
import testing;

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = boost::beast::http;

using namespace std::chrono_literals;

static auto pinged(asio::io_context & Context, request::Channel & Channel) -> bool {
	bool Reachable = false;
	testing::drive(Context, [](request::Channel & Channel, bool & Reachable)
	                            -> asio::awaitable<void> { Reachable = co_await Channel.ping(); }(
	                                Channel, Reachable));
	return Reachable;
}

TEST_CASE(successfulPingsMakeTheDisplayReachable) {
	asio::io_context Context;
	auto Exchanges = std::make_shared<testing::Exchanges>();
	request::Channel Channel(testing::recordingExchange(Exchanges));
	std::vector<bool> Changes;
	Channel.onReachabilityChange([&](bool Now) { Changes.push_back(Now); });

	ASSERT_FALSE(Channel.isReachable());
	ASSERT_TRUE(pinged(Context, Channel));
	ASSERT_TRUE(pinged(Context, Channel));
	ASSERT_EQ(Exchanges->Requests_.size(), 2u);
	ASSERT_EQ(Exchanges->Requests_[0].Method, "GET");
	ASSERT_EQ(Exchanges->Requests_[0].Target, "/ping");
	ASSERT_EQ(Changes, std::vector<bool>{ true });
}

TEST_CASE(failedPingsMakeTheDisplayUnreachable) {
	asio::io_context Context;
	auto Exchanges = std::make_shared<testing::Exchanges>();
	request::Channel Channel(testing::recordingExchange(Exchanges));
	ASSERT_TRUE(pinged(Context, Channel));

	Exchanges->Status_ = 404;
	ASSERT_FALSE(pinged(Context, Channel));

	Exchanges->Status_ = 204;
	ASSERT_TRUE(pinged(Context, Channel));

	Exchanges->Error_ = std::make_error_code(std::errc::connection_refused);
	ASSERT_FALSE(pinged(Context, Channel));
	ASSERT_FALSE(Channel.isReachable());
}

TEST_CASE(postsSendCompactJson) {
	asio::io_context Context;
	auto Exchanges = std::make_shared<testing::Exchanges>();
	request::Channel Channel(testing::recordingExchange(Exchanges));

	testing::drive(Context, Channel.postJSON("nowPlaying", { { "title", "Song" }, { "isPlaying", true } }));
	ASSERT_TRUE(Channel.isReachable());

	const auto & Posted = Exchanges->Requests_.back();
	ASSERT_EQ(Posted.Method, "POST");
	ASSERT_EQ(Posted.Target, "/nowPlaying");
	ASSERT_EQ(Posted.ContentType, "application/json");
	ASSERT_EQ(Posted.Body, R"({"isPlaying":true,"title":"Song"})");

	Exchanges->Status_ = 500;
	testing::drive(Context, Channel.postJSON("/calendarUpdate", model::tJson::object()));
	ASSERT_EQ(Exchanges->Requests_.back().Target, "/calendarUpdate");
	ASSERT_FALSE(Channel.isReachable());
}

using tAcceptor = net::use_await::as_default_on_t<asio::ip::tcp::acceptor>;

// a REST side that answers one request with 'Status' and tells what it got
static auto serveOnce(tAcceptor & Acceptor, http::status Status, std::string & Seen)
    -> asio::awaitable<void> {
	auto [Error, Socket] = co_await Acceptor.async_accept();
	if (Error)
		co_return;

	beast::flat_buffer Buffer;
	http::request<http::string_body> Request;
	if (const auto [Failed, Size] = co_await http::async_read(Socket, Buffer, Request,
	                                                          net::use_await{});
	    Failed)
		co_return;
	const auto Method = Request.method_string();
	const auto Target = Request.target();
	Seen = std::format("{} {} {}", std::string_view{ Method.data(), Method.size() },
	                   std::string_view{ Target.data(), Target.size() }, Request.body());

	http::response<http::empty_body> Response{ Status, Request.version() };
	Response.keep_alive(false);
	Response.prepare_payload();
	co_await http::async_write(Socket, Response, net::use_await{});
}

TEST_CASE(exchangesSpeakHttpToTheDisplay) {
	asio::io_context Context;
	tAcceptor Acceptor(Context, { asio::ip::make_address("127.0.0.1"), 0 });
	std::string Seen;
	asio::co_spawn(Context, serveOnce(Acceptor, http::status::no_content, Seen), asio::detached);

	request::Channel Channel(request::makeHttpExchange(Context.get_executor(), "127.0.0.1",
	                                                   Acceptor.local_endpoint().port()));
	testing::drive(Context, Channel.postJSON("nowPlaying", { { "title", "Song" } }));
	ASSERT_EQ(Seen, R"(POST /nowPlaying {"title":"Song"})");
	ASSERT_TRUE(Channel.isReachable());
}

TEST_CASE(exchangesFailOnClosedPorts) {
	asio::io_context Context;
	std::uint16_t Port = 0;
	{
		tAcceptor Vacated(Context, { asio::ip::make_address("127.0.0.1"), 0 });
		Port = Vacated.local_endpoint().port();
	}
	auto Exchange = request::makeHttpExchange(Context.get_executor(), "127.0.0.1", Port, 1s);

	net::tExpected<unsigned> Status = 0u;
	testing::drive(Context,
	               [](request::tExchange & Exchange,
	                  net::tExpected<unsigned> & Status) -> asio::awaitable<void> {
		               Status = co_await Exchange(
		                   request::tRequest{ http::verb::get, "/ping", 11 });
	               }(Exchange, Status));
	ASSERT_FALSE(Status.has_value());
}

int main() {
	mirror::test::TestRunner::instance().name("request channel");
	return mirror::test::TestRunner::instance().runAll();
}
