#include <boost/test/unit_test.hpp>

#include "ApiCall.hpp"
#include "ClientError.hpp"
#include "FakeRequestExecutor.hpp"
#include "TestSupport.hpp"

using renterd::core::ClientError;
using renterd::core::ErrorKind;
using renterd::network::ApiRequest;
using renterd::network::ApiRequestBuilder;
using renterd::test::FakeRequestExecutor;
using renterd::test::MakeResponse;
using renterd::test::Run;

namespace {

struct ApiFixture {
    asio::io_context ioc;
    FakeRequestExecutor server{std::vector<uint8_t>{}};

    void reply(unsigned status, std::string body = {}) {
        server.handler = [status, body](const ApiRequest&) { return MakeResponse(status, body); };
    }
};

auto has_kind(ErrorKind kind) {
    return [kind](const ClientError& e) { return e.kind() == kind; };
}

}  // namespace

BOOST_AUTO_TEST_SUITE(api_call)

BOOST_AUTO_TEST_CASE(unauthorized_is_authentication_error) {
    ApiFixture f;
    f.reply(401, "unauthorized");
    BOOST_CHECK_EXCEPTION(
        Run(f.ioc, renterd::network::SendApiRequest(f.server, ApiRequestBuilder::get("bus/state").build())),
        ClientError, has_kind(ErrorKind::Authentication));
}

BOOST_AUTO_TEST_CASE(not_found_is_empty_optional) {
    ApiFixture f;
    f.reply(404);
    auto response = Run(f.ioc, renterd::network::SendApiRequestOptional(
                                   f.server, ApiRequestBuilder::head("worker/objects/x").build()));
    BOOST_CHECK(!response);
}

BOOST_AUTO_TEST_CASE(not_found_is_error_when_required) {
    ApiFixture f;
    f.reply(404);
    BOOST_CHECK_EXCEPTION(
        Run(f.ioc, renterd::network::SendApiRequest(f.server, ApiRequestBuilder::get("bus/state").build())),
        ClientError, has_kind(ErrorKind::NotFound));
}

BOOST_AUTO_TEST_CASE(other_errors_carry_status_and_trimmed_body) {
    ApiFixture f;
    f.reply(503, "\n  worker is busy \t\n");
    try {
        Run(f.ioc, renterd::network::SendApiRequest(f.server, ApiRequestBuilder::get("worker/id").build()));
        BOOST_FAIL("expected an error");
    } catch (const ClientError& e) {
        BOOST_CHECK(e.kind() == ErrorKind::HttpResponse);
        BOOST_CHECK_EQUAL(e.status(), 503u);
        BOOST_CHECK_EQUAL(e.body(), "worker is busy");
    }
}

BOOST_AUTO_TEST_CASE(success_passes_response_through) {
    ApiFixture f;
    f.reply(200, "ok");
    auto response = Run(f.ioc, renterd::network::SendApiRequest(
                                   f.server, ApiRequestBuilder::get("worker/id").build()));
    BOOST_CHECK_EQUAL(response.status, 200u);
    BOOST_REQUIRE(response.body);
    BOOST_CHECK_EQUAL(Run(f.ioc, renterd::network::ReadToString(*response.body, 100)), "ok");
}

BOOST_AUTO_TEST_CASE(get_json_parses_body) {
    ApiFixture f;
    f.reply(200, R"({"a": [1, 2, 3]})");
    auto value = Run(f.ioc, renterd::network::GetJson(f.server, "some/path"));
    BOOST_CHECK_EQUAL(value.at("a").as_array().size(), 3u);
    BOOST_CHECK_EQUAL(f.server.requests.at(0).path, "some/path");
}

BOOST_AUTO_TEST_CASE(get_json_rejects_malformed_body) {
    ApiFixture f;
    f.reply(200, "{not json");
    BOOST_CHECK_EXCEPTION(Run(f.ioc, renterd::network::GetJson(f.server, "some/path")), ClientError,
                          has_kind(ErrorKind::InvalidData));
}

BOOST_AUTO_TEST_SUITE_END()
