#include <gtest/gtest.h>

#include <flow/exceptions.hpp>
#include <flow/impl/yaml_file_loader.hpp>
#include <flow/impl/yaml_string_loader.hpp>
#include <flow/reference.hpp>
#include <test_support.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

TEST(Yaml, DocumentDefaults) {
    auto const doc = impl::YamlStringLoader{ "steps:\n  - id: a\n    manual: true\n" }.load();

    EXPECT_EQ(doc.settings.timeout_seconds, 10u);
    EXPECT_EQ(doc.settings.user_agent, "oxflow");
    EXPECT_TRUE(doc.settings.verify_tls);
    EXPECT_TRUE(doc.inputs.empty());
    EXPECT_TRUE(doc.dependencies.empty());
    ASSERT_EQ(doc.steps.size(), 1u);
    EXPECT_FALSE(doc.steps[0].extract);
}

TEST(Yaml, ReadsEveryPartOfTheDocument) {
    auto const doc = impl::YamlStringLoader{ R"(
settings:
  timeout_seconds: 3
  user_agent: walkthrough
  verify_tls: false
inputs:
  - name: api_key
    description: registration key
    secret: true
  - name: scope
    default: openid
endpoint_defaults:
  token_endpoint: /token
steps:
  - id: a
    title: Register
    extract: [client_id]
    absolute_urls: [verification_uri]
    instructions: "{{ a.client_id }}"
  - id: b
dependencies:
  a:
  b: [a]
curl_templates:
  a: curl -X POST {token_endpoint}
  b:
substitution_rules:
  b:
    url:
      <u>: step.a.client_id
    <flat>: input.scope
    data:
      <d>: step.a.client_secret
)" }.load();

    EXPECT_EQ(doc.settings.timeout_seconds, 3u);
    EXPECT_EQ(doc.settings.user_agent, "walkthrough");
    EXPECT_FALSE(doc.settings.verify_tls);

    ASSERT_EQ(doc.inputs.size(), 2u);
    EXPECT_TRUE(doc.inputs[0].secret);
    EXPECT_EQ(doc.inputs[0].description, "registration key");
    EXPECT_EQ(doc.inputs[1].default_value, "openid");

    EXPECT_EQ(doc.endpoints.at("token_endpoint"), "/token");

    EXPECT_EQ(doc.steps[0].title, "Register");
    EXPECT_EQ(doc.steps[0].extract, (std::vector<std::string>{ "client_id" }));
    EXPECT_EQ(doc.steps[0].absolute_urls, (std::vector<std::string>{ "verification_uri" }));
    EXPECT_EQ(doc.steps[0].instructions, "{{ a.client_id }}");

    ASSERT_EQ(doc.dependencies.size(), 2u);
    EXPECT_TRUE(doc.dependencies[0].second.empty());
    EXPECT_EQ(doc.dependencies[1].second, (std::vector<std::string>{ "a" }));

    ASSERT_EQ(doc.templates.size(), 1u);
    EXPECT_EQ(doc.templates[0].first, "a");

    ASSERT_EQ(doc.substitution_rules.size(), 1u);
    auto const expected = descriptor::Rules{
        { "<u>", "step.a.client_id" },
        { "<flat>", "input.scope" },
        { "<d>", "step.a.client_secret" },
    };
    EXPECT_EQ(doc.substitution_rules[0].second, expected);
}

TEST(Yaml, MalformedRulesAreInvalid) {
    auto const loader = impl::YamlStringLoader{ R"(
steps:
  - id: a
    manual: true
substitution_rules:
  a: [1, 2]
)" };
    try {
        loader.load();
        FAIL() << "document accepted";
    } catch(ConfigError const &e) {
        EXPECT_EQ(e.kind, ConfigError::Kind::INVALID_DOCUMENT);
    }
}

TEST(Yaml, FileLoaderReportsMissingFile) {
    try {
        impl::YamlFileLoader{ "/nonexistent/oxflow.yaml" }.load();
        FAIL() << "missing file loaded";
    } catch(ConfigError const &e) {
        EXPECT_EQ(e.kind, ConfigError::Kind::INVALID_DOCUMENT);
        EXPECT_THAT(e.what(), testing::HasSubstr("/nonexistent/oxflow.yaml"));
    }
}

TEST(Yaml, FileLoaderReadsDocument) {
    auto const path = std::filesystem::temp_directory_path() / "oxflow_yaml_tests.yaml";
    {
        std::ofstream out{ path };
        out << "steps:\n  - id: only\n    manual: true\n";
    }

    auto const loader = impl::YamlFileLoader{ path };
    auto const graph  = StepGraph{ loader };
    std::filesystem::remove(path);

    EXPECT_EQ(loader.path(), path);
    EXPECT_TRUE(graph.contains("only"));
}

TEST(Yaml, ShippedFlowIsValid) {
    auto const graph = StepGraph{ impl::YamlFileLoader{ OXFLOW_EXAMPLE_FLOW } };

    EXPECT_EQ(graph.steps().size(), 10u);
    EXPECT_EQ(graph.step("g").dependencies, (std::vector<std::string>{ "a", "d", "f" }));
    EXPECT_TRUE(graph.step("f").manual());
    EXPECT_EQ(graph.step("g").rules.size(), 3u);
    EXPECT_EQ(graph.default_endpoints().at("token_endpoint"), "/token");
}

TEST(Reference, ParsesBothForms) {
    auto const field = ref::parse("step.a.authorization_details.type");
    ASSERT_TRUE(std::holds_alternative<ref::StepField>(field));
    EXPECT_EQ(std::get<ref::StepField>(field).step, "a");
    EXPECT_EQ(std::get<ref::StepField>(field).field, "authorization_details.type");
    EXPECT_EQ(ref::to_string(field), "step.a.authorization_details.type");

    auto const input = ref::parse("input.api_key");
    ASSERT_TRUE(std::holds_alternative<ref::Input>(input));
    EXPECT_EQ(std::get<ref::Input>(input).name, "api_key");
}

TEST(Reference, RejectsMalformedText) {
    for(auto const *text : { "", "a.client_id", "step.a", "step..x", "step.a.", "input." })
        EXPECT_THROW(ref::parse(text), std::invalid_argument) << text;
}
