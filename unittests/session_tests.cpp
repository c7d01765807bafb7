#include <gtest/gtest.h>

#include <flow/endpoints.hpp>
#include <flow/exceptions.hpp>
#include <flow/session.hpp>
#include <test_support.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace testing;

namespace {

using session_t = Session<MockFetcher, test_reporting_t>;
using ids_t     = std::vector<std::string>;

// a:[] and b:[a], b sends what a returned
std::string const registration = R"(
inputs:
  - name: api_key
    secret: true
endpoints:
  registration_endpoint: /register
steps:
  - id: a
    title: Backend client registration
    extract: [client_id, client_secret]
  - id: b
    title: Frontend client registration
dependencies:
  b: [a]
curl_templates:
  a: |
    curl -X POST {registration_endpoint} -H "X-API-KEY: <api-key>" -d '{"client_name": "backend"}'
  b: |
    curl -X POST {registration_endpoint} -d "audience=<backend-client-id>&secret=<backend-client-secret>"
substitution_rules:
  a:
    <api-key>: input.api_key
  b:
    <backend-client-id>: step.a.client_id
    <backend-client-secret>: step.a.client_secret
)";

// g:[a, d, f] where f is a manual handover
std::string const exchange = R"(
endpoints:
  registration_endpoint: /register
  device_authorization_endpoint: /device
  token_endpoint: /token
steps:
  - id: a
    extract: [client_id, client_secret]
  - id: c
    absolute_urls: [verification_uri]
    instructions: "visit {{ c.verification_uri }}"
  - id: d
    extract: [access_token]
  - id: f
    manual: true
    instructions: "hand {{ d.access_token }} to {{ a.client_id }}"
  - id: g
dependencies:
  d: [c]
  f: [d]
  g: [a, d, f]
curl_templates:
  a: |
    curl -X POST {registration_endpoint} -d client_name=backend
  c: |
    curl -X POST {device_authorization_endpoint} -d client_id=device
  d: |
    curl -X POST {token_endpoint} -d "device_code=<device-code>"
  g: |
    curl -X POST {token_endpoint} \
      -u "<backend-client-id>:<backend-client-secret>" \
      -d "subject_token=<subject-token>"
substitution_rules:
  d:
    <device-code>: step.c.device_code
  g:
    auth:
      <backend-client-id>: step.a.client_id
      <backend-client-secret>: step.a.client_secret
    data:
      <subject-token>: step.d.access_token
)";

} // namespace

class SessionTest : public Test {
protected:
    StrictMock<MockFetcher> fetcher;
    RecordingRenderer renderer;
    test_reporting_t reporting{ di::Deps<RecordingRenderer>{ renderer }, true };

    std::unique_ptr<StepGraph> graph;
    std::unique_ptr<session_t> session;

    session_t &start(std::string const &yaml, InputMap inputs = {}) {
        graph = std::make_unique<StepGraph>(make_graph(yaml));

        SessionContext context;
        context.base_url = "https://as";
        context.defaults = resolve_default_endpoints(graph->default_endpoints(), context.base_url);
        context.inputs   = std::move(inputs);

        session = std::make_unique<session_t>(di::Deps<MockFetcher, test_reporting_t>{ fetcher, reporting }, *graph, std::move(context));
        return *session;
    }

    StepResult const &result(std::string const &id) const {
        auto const *res = session->state().result(id);
        if(res == nullptr)
            throw std::runtime_error{ "step has no result: " + id };
        return *res;
    }
};

TEST_F(SessionTest, UpstreamValueFlowsIntoDependentRequest) {
    auto &s = start(registration, { { "api_key", "K" } });

    EXPECT_CALL(fetcher, fetch(AllOf(HasUrl("https://as/register"), Field(&HttpRequest::body, R"({"client_name": "backend"})"))))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})", "Created")));
    EXPECT_CALL(fetcher, fetch(Field(&HttpRequest::body, "audience=C1&secret=S1")))
        .WillOnce(Return(json_response(201, R"({"client_id": "F1"})", "Created")));

    auto const outcome = s.run();

    EXPECT_EQ(outcome.type, session_t::Outcome::Type::DONE);
    EXPECT_EQ(result("a").http_status, 201u);
    EXPECT_EQ(result("a").http_reason, "Created");
    EXPECT_EQ(result("b").fields.at("client_id"), "F1");
    EXPECT_EQ(renderer.count("SUCCESS a"), 1u);
    EXPECT_EQ(renderer.count("SUCCESS b"), 1u);
}

TEST_F(SessionTest, ManualStepGatesTheTokenExchange) {
    auto &s = start(exchange);

    EXPECT_CALL(fetcher, fetch(HasUrl("https://as/register")))
        .WillOnce(Return(json_response(201, R"({"client_id": "BC", "client_secret": "BS"})")));
    EXPECT_CALL(fetcher, fetch(HasUrl("https://as/device")))
        .WillOnce(Return(json_response(200, R"({"device_code": "DC", "verification_uri": "/activate"})")));
    EXPECT_CALL(fetcher, fetch(AllOf(HasUrl("https://as/token"), Field(&HttpRequest::body, "device_code=DC"))))
        .WillOnce(Return(json_response(200, R"({"access_token": "AT"})")));

    auto const waiting = s.run();

    EXPECT_EQ(waiting.type, session_t::Outcome::Type::WAITING);
    EXPECT_EQ(waiting.waiting, ids_t{ "f" });
    EXPECT_EQ(s.state().status("g"), StepStatus::PENDING);
    EXPECT_EQ(result("c").fields.at("verification_uri"), "https://as/activate");
    EXPECT_EQ(renderer.count("NEXT visit https://as/activate"), 1u);
    ASSERT_EQ(renderer.manual.size(), 1u);
    EXPECT_EQ(renderer.manual[0].instructions, "hand AT to BC");

    // nothing changes until the handover is confirmed
    EXPECT_EQ(s.run().type, session_t::Outcome::Type::WAITING);
    EXPECT_EQ(renderer.count("MANUAL f"), 1u);

    EXPECT_CALL(fetcher, fetch(AllOf(Field(&HttpRequest::body, "subject_token=AT"),
                             Field(&HttpRequest::headers, Contains(Header{ "Authorization", "Basic QkM6QlM=" })))))
        .WillOnce(Return(json_response(200, R"({"access_token": "XT", "issued_token_type": "urn:ietf:params:oauth:token-type:access_token"})")));

    s.complete("f", {});
    auto const done = s.run();

    EXPECT_EQ(done.type, session_t::Outcome::Type::DONE);
    EXPECT_TRUE(result("f").manual);
    EXPECT_EQ(result("g").fields.at("access_token"), "XT");
}

TEST_F(SessionTest, HttpErrorFailsTheStepUntilRetried) {
    auto &s = start(registration, { { "api_key", "K" } });

    EXPECT_CALL(fetcher, fetch(HasUrl("https://as/register")))
        .WillOnce(Return(json_response(400, R"({"error": "invalid_client_metadata", "error_description": "bad name"})", "Bad Request")))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})")))
        .WillOnce(Return(json_response(201, R"({"client_id": "F1"})")));

    auto const failed = s.run();

    EXPECT_EQ(failed.type, session_t::Outcome::Type::FAILED);
    EXPECT_EQ(failed.failed, ids_t{ "a" });
    ASSERT_TRUE(result("a").error);
    EXPECT_EQ(result("a").error->type, StepError::Type::HTTP);
    EXPECT_EQ(result("a").error->http_status, 400u);
    EXPECT_THAT(result("a").error->message, HasSubstr("invalid_client_metadata (bad name)"));
    EXPECT_THAT(result("a").raw_response, HasSubstr("invalid_client_metadata"));
    EXPECT_TRUE(result("a").fields.empty());
    EXPECT_EQ(s.state().status("b"), StepStatus::PENDING);

    // failed steps are not attempted again on their own
    EXPECT_EQ(s.run().type, session_t::Outcome::Type::FAILED);

    s.retry("a");
    EXPECT_EQ(s.run().type, session_t::Outcome::Type::DONE);
    EXPECT_EQ(renderer.count("FAIL a"), 1u);
    EXPECT_EQ(renderer.count("RETRY a"), 1u);
}

TEST_F(SessionTest, TransportErrorFailsTheStep) {
    auto &s = start(registration, { { "api_key", "K" } });
    EXPECT_CALL(fetcher, fetch(_)).WillOnce(Throw(TransportError{ "connect: connection refused" }));

    s.run();

    ASSERT_TRUE(result("a").error);
    EXPECT_EQ(result("a").error->type, StepError::Type::TRANSPORT);
    EXPECT_THAT(result("a").error->message, HasSubstr("connection refused"));
    EXPECT_FALSE(result("a").http_status);
}

TEST_F(SessionTest, UnexpectedFetchFailureStillFailsTheStep) {
    auto &s = start(registration, { { "api_key", "K" } });
    EXPECT_CALL(fetcher, fetch(HasUrl("https://as/register")))
        .WillOnce(Throw(std::runtime_error{ "ssl context unavailable" }))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})")))
        .WillOnce(Return(json_response(201, "{}")));

    EXPECT_EQ(s.run().type, session_t::Outcome::Type::FAILED);
    EXPECT_EQ(s.state().status("a"), StepStatus::FAILED);
    EXPECT_EQ(result("a").error->type, StepError::Type::TRANSPORT);
    EXPECT_THAT(result("a").error->message, HasSubstr("ssl context unavailable"));
    EXPECT_EQ(renderer.count("FAIL a"), 1u);

    s.retry("a");
    EXPECT_EQ(s.run().type, session_t::Outcome::Type::DONE);
}

TEST_F(SessionTest, SubstitutionFailureNeverReachesTheNetwork) {
    auto &s = start(registration);

    auto const outcome = s.run();

    EXPECT_EQ(outcome.type, session_t::Outcome::Type::FAILED);
    EXPECT_EQ(result("a").error->type, StepError::Type::SUBSTITUTION);
    EXPECT_THAT(result("a").error->message, HasSubstr("api_key"));

    EXPECT_CALL(fetcher, fetch(Field(&HttpRequest::headers, Contains(Header{ "X-API-KEY", "K" }))))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})")));
    EXPECT_CALL(fetcher, fetch(Field(&HttpRequest::body, HasSubstr("audience=C1"))))
        .WillOnce(Return(json_response(201, "{}")));

    s.set_input("api_key", "K");
    s.retry("a");
    EXPECT_EQ(s.run().type, session_t::Outcome::Type::DONE);
}

TEST_F(SessionTest, PartialResponseBlocksOnlyTheStepsNeedingTheField) {
    auto &s = start(registration, { { "api_key", "K" } });
    EXPECT_CALL(fetcher, fetch(HasUrl("https://as/register")))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1"})")));

    auto const outcome = s.run();

    EXPECT_TRUE(s.state().is_completed("a"));
    EXPECT_EQ(renderer.count("PARTIAL a: response carried no client_secret"), 1u);
    EXPECT_EQ(outcome.failed, ids_t{ "b" });
    EXPECT_EQ(result("b").error->type, StepError::Type::SUBSTITUTION);
    EXPECT_THAT(result("b").error->message, HasSubstr("client_secret"));
}

TEST_F(SessionTest, NonJsonSuccessKeepsTheRawBody) {
    auto &s = start(R"(
steps:
  - id: a
curl_templates:
  a: curl https://as/ping
)");
    EXPECT_CALL(fetcher, fetch(_)).WillOnce(Return(HttpResponse{ 204, "No Content", {}, "" }));

    EXPECT_EQ(s.run().type, session_t::Outcome::Type::DONE);
    EXPECT_TRUE(result("a").fields.empty());
    EXPECT_EQ(result("a").http_status, 204u);
}

TEST_F(SessionTest, RestartInvalidatesTheDependentSubgraph) {
    auto &s = start(registration, { { "api_key", "K" } });
    EXPECT_CALL(fetcher, fetch(_))
        .Times(4)
        .WillRepeatedly(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})")));

    s.run();
    EXPECT_EQ(s.restart("a"), (ids_t{ "a", "b" }));
    EXPECT_TRUE(s.state().results().empty());
    EXPECT_EQ(renderer.count("RESET a, b"), 1u);

    EXPECT_EQ(s.run().type, session_t::Outcome::Type::DONE);
}

TEST_F(SessionTest, RejectedSignalsLeaveTheStateAlone) {
    auto &s = start(exchange);

    EXPECT_THROW(s.retry("a"), SessionError);
    EXPECT_THROW(s.restart("a"), SessionError);
    EXPECT_THROW(s.complete("a", {}), SessionError);
    EXPECT_THROW(s.complete("f", {}), SessionError);
    EXPECT_THROW(s.complete("ghost", {}), SessionError);
    EXPECT_THROW(s.set_input("api_key", "K"), SessionError);

    EXPECT_TRUE(s.state().results().empty());
}

TEST_F(SessionTest, StatusRowsDescribeEveryStep) {
    auto &s = start(registration, { { "api_key", "K" } });

    auto rows = s.status_rows();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].state, "candidate");
    EXPECT_EQ(rows[1].state, "blocked");
    EXPECT_EQ(rows[1].waiting_on, ids_t{ "a" });
    EXPECT_EQ(rows[1].title, "Frontend client registration");

    EXPECT_CALL(fetcher, fetch(_)).WillOnce(Return(json_response(500, "oops", "Internal Server Error")));
    s.run();

    rows = s.status_rows();
    EXPECT_EQ(rows[0].state, "failed");
    EXPECT_EQ(rows[1].state, "blocked");
}

TEST_F(SessionTest, DetailCarriesTheStoredResponse) {
    auto &s = start(registration, { { "api_key", "K" } });
    EXPECT_CALL(fetcher, fetch(_))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})")))
        .WillOnce(Return(json_response(409, R"({"error": "conflict"})", "Conflict")));
    s.run();

    auto const a = s.detail("a");
    EXPECT_EQ(a.state, "completed");
    EXPECT_EQ(a.http_status, 201u);
    EXPECT_EQ(a.fields.at("client_id"), "C1");
    EXPECT_THAT(a.request_template, HasSubstr("{registration_endpoint}"));

    auto const b = s.detail("b");
    EXPECT_EQ(b.state, "failed");
    EXPECT_EQ(b.error, "HTTP 409 Conflict: conflict");
}

TEST_F(SessionTest, ReportingTalliesStepOutcomes) {
    auto &s = start(registration, { { "api_key", "K" } });
    EXPECT_CALL(fetcher, fetch(_))
        .WillOnce(Return(json_response(201, R"({"client_id": "C1", "client_secret": "S1"})")))
        .WillOnce(Return(json_response(500, "{}", "Internal Server Error")));
    s.run();

    auto const tally = reporting.tally();
    EXPECT_EQ(tally.successes, 1u);
    EXPECT_EQ(tally.failures, 1u);
}
