#include <gtest/gtest.h>
#include "ligaproxy/dispatcher.hpp"
#include "ligaproxy/openliga_provider.hpp"
#include "test_support.hpp"

using namespace ligaproxy;
using nlohmann::json;
using nlohmann::ordered_json;

namespace {

const RequestContext kCtx{"dispatch-test", {}};

json raw_team(int id) {
    return {{"team_id", id}, {"name", "Team " + std::to_string(id)},
            {"short_name", "T" + std::to_string(id)}, {"icon_url", nullptr}};
}

class DispatcherTest : public ::testing::Test {
protected:
    test::FakeProvider provider;
    OperationDispatcher dispatcher{provider};
};

// Dispatcher wired to a real adapter whose network replies are scripted.
class DispatcherOpenLigaTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = std::make_unique<test::ScriptedTransport>();
        transport = owned.get();
        ProviderSettings settings{.retry = RetryPolicy{.max_retries = 0, .jitter_range = 0.0}};
        provider = std::make_unique<OpenLigaProvider>(
            settings, std::move(owned), std::make_shared<test::ManualClock>());
        dispatcher = std::make_unique<OperationDispatcher>(*provider);
    }

    test::ScriptedTransport* transport = nullptr;
    std::unique_ptr<OpenLigaProvider> provider;
    std::unique_ptr<OperationDispatcher> dispatcher;
};

} // namespace

TEST(ErrorCodes, StableNames) {
    EXPECT_EQ(to_string(ErrorCode::UnknownOperation), "UNKNOWN_OPERATION");
    EXPECT_EQ(to_string(ErrorCode::Validation), "VALIDATION_ERROR");
    EXPECT_EQ(to_string(ErrorCode::Upstream), "UPSTREAM_ERROR");
    EXPECT_EQ(to_string(ErrorCode::Internal), "INTERNAL_ERROR");
}

TEST(ErrorCodes, DetailsOmittedWhenNull) {
    auto j = error_to_json(OperationError{ErrorCode::Upstream, "Upstream API failed", nullptr});
    EXPECT_EQ(j.dump(), R"({"error":"Upstream API failed","code":"UPSTREAM_ERROR"})");

    auto with_details = error_to_json(
        OperationError{ErrorCode::Validation, "bad", {{"validation_errors", json::array()}}});
    EXPECT_TRUE(with_details.contains("details"));
}

TEST(Registry, HasFourOperationsInOrder) {
    auto registry = build_registry();
    ASSERT_EQ(registry.size(), 4u);
    EXPECT_EQ(registry[0].name, "ListLeagues");
    EXPECT_EQ(registry[1].name, "GetLeagueMatches");
    EXPECT_EQ(registry[2].name, "GetTeam");
    EXPECT_EQ(registry[3].name, "GetMatch");
    for (const auto& op : registry) {
        EXPECT_TRUE(op.validate && op.invoke && op.normalize) << op.name;
    }
}

TEST_F(DispatcherTest, UnknownOperationListsValidNames) {
    auto result = dispatcher.execute(kCtx, "DeleteLeague", json::object());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnknownOperation);
    EXPECT_EQ(result.error().message, "Unknown operationType: DeleteLeague");
    EXPECT_EQ(result.error().details["valid_operations"],
              json(dispatcher.operations()));
    EXPECT_TRUE(provider.calls.empty());
}

TEST_F(DispatcherTest, OperationNamesAreCaseSensitive) {
    auto result = dispatcher.execute(kCtx, "listleagues", json::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnknownOperation);
}

TEST_F(DispatcherTest, ValidationFailureSkipsProvider) {
    auto result = dispatcher.execute(kCtx, "GetLeagueMatches", {{"league_shortcut", "bl1"}});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
    const auto& errors = result.error().details["validation_errors"];
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["field"], "league_season");
    EXPECT_EQ(errors[0]["type"], "missing");
    EXPECT_TRUE(provider.calls.empty());
}

TEST_F(DispatcherTest, ArgumentsReachProvider) {
    provider.result = json{{"matches", json::array()}};
    auto matches = dispatcher.execute(kCtx, "GetLeagueMatches",
                                      {{"league_shortcut", "bl1"}, {"league_season", "2023"}});
    ASSERT_TRUE(matches.has_value());

    provider.result = json{{"team", raw_team(40)}};
    auto team = dispatcher.execute(kCtx, "GetTeam", {{"team_id", "40"}});
    ASSERT_TRUE(team.has_value());

    EXPECT_EQ(provider.calls,
              (std::vector<std::string>{"get_league_matches:bl1:2023", "get_team:40"}));
}

TEST_F(DispatcherTest, UpstreamErrorIsWrapped) {
    provider.result = std::unexpected(UpstreamError{503, "Upstream API failed with status 503"});

    auto result = dispatcher.execute(kCtx, "ListLeagues", json::object());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Upstream);
    EXPECT_EQ(result.error().message, "Upstream API failed");
    EXPECT_EQ(result.error().details["message"], "Upstream API failed with status 503");
    EXPECT_EQ(provider.calls.size(), 1u);
}

TEST_F(DispatcherTest, NormalizationFailureDoesNotLeakDetails) {
    provider.result = json{{"leagues", json::array({{{"id", "not-an-int"}}})}};

    auto result = dispatcher.execute(kCtx, "ListLeagues", json::object());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Internal);
    EXPECT_EQ(result.error().message, "Internal response normalization error");
    EXPECT_EQ(result.error().details, json({{"message", "Provider response format unexpected"}}));
    EXPECT_EQ(result.error().details.dump().find("not-an-int"), std::string::npos);
}

TEST_F(DispatcherTest, SuccessReturnsMatchingResponseType) {
    provider.result = json{{"team", raw_team(7)}};

    auto result = dispatcher.execute(kCtx, "GetTeam", {{"team_id", 7}});

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::holds_alternative<GetTeamResponse>(*result));
    EXPECT_EQ(result_to_json(*result)["team"]["id"], 7);
    EXPECT_EQ(provider.calls, std::vector<std::string>{"get_team:7"});
}

TEST_F(DispatcherTest, OperationInfoDescribesEveryOperation) {
    auto info = dispatcher.operation_info();

    ASSERT_EQ(info.size(), 4u);
    for (const auto& name : dispatcher.operations()) {
        ASSERT_TRUE(info.contains(name)) << name;
        EXPECT_TRUE(info[name].contains("payload_schema"));
        EXPECT_TRUE(info[name].contains("response_schema"));
    }
    EXPECT_EQ(info["GetMatch"]["payload_schema"]["required"], ordered_json::array({"match_id"}));
    EXPECT_EQ(dispatcher.provider_name(), "FakeProvider");
}

TEST_F(DispatcherTest, OperationInfoFollowsRegistryOrder) {
    auto info = dispatcher.operation_info();

    std::vector<std::string> keys;
    for (const auto& item : info.items()) keys.push_back(item.key());

    EXPECT_EQ(keys, dispatcher.operations());
    EXPECT_EQ(keys.front(), "ListLeagues");
    EXPECT_EQ(keys.back(), "GetMatch");
}

TEST_F(DispatcherOpenLigaTest, GetMatchOnEmptyArrayIsUpstreamError) {
    transport->push(test::reply(200, "[]"));

    auto result = dispatcher->execute(kCtx, "GetMatch", {{"match_id", 123}});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Upstream);
    EXPECT_EQ(result.error().details["message"], "Match not found");
}

TEST_F(DispatcherOpenLigaTest, GetTeamOnMalformedBodyYieldsDefaults) {
    transport->push(test::reply(200, R"(["unexpected"])"));

    auto result = dispatcher->execute(kCtx, "GetTeam", {{"team_id", 40}});

    ASSERT_TRUE(result.has_value());
    auto j = result_to_json(*result);
    EXPECT_EQ(j["team"]["id"], 0);
    EXPECT_EQ(j["team"]["name"], "");
    EXPECT_EQ(j["team"]["short_name"], "");
    EXPECT_TRUE(j["team"]["icon_url"].is_null());
}

TEST_F(DispatcherOpenLigaTest, UpstreamStatusBecomesUpstreamError) {
    transport->push(test::reply(404, "Not Found"));

    auto result = dispatcher->execute(kCtx, "GetTeam", {{"team_id", 40}});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Upstream);
    EXPECT_EQ(result.error().details["message"], "Upstream API failed with status 404");
}

TEST_F(DispatcherOpenLigaTest, ListLeaguesIsIdempotent) {
    const std::string body = R"([
        {"leagueId": 4608, "leagueName": "1. Bundesliga", "leagueShortcut": "bl1",
         "country": "DE", "leagueSeason": "2023"},
        {"leagueId": 4609, "leagueName": "2. Bundesliga", "leagueShortcut": "bl2"}
    ])";
    transport->push(test::reply(200, body));
    transport->push(test::reply(200, body));

    auto first = dispatcher->execute(kCtx, "ListLeagues", json::object());
    auto second = dispatcher->execute(kCtx, "ListLeagues", json::object());

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(result_to_json(*first).dump(), result_to_json(*second).dump());
    EXPECT_EQ(result_to_json(*first)["leagues"][1]["season"], "");
}

TEST_F(DispatcherOpenLigaTest, LeagueMatchesAreNormalized) {
    transport->push(test::reply(200, R"([{
        "matchID": 66, "matchDateTime": "2023-08-18T20:30:00", "matchIsFinished": true,
        "team1": {"teamId": 40, "teamName": "FC Bayern", "shortName": "FCB"},
        "team2": {"teamId": 7, "teamName": "Werder Bremen", "shortName": "SVW"},
        "matchResults": [{"pointsTeam1": 0, "pointsTeam2": 0}, {"pointsTeam1": 4, "pointsTeam2": 0}]
    }])"));

    auto result = dispatcher->execute(kCtx, "GetLeagueMatches",
                                      {{"league_shortcut", "bl1"}, {"league_season", "2023"}});

    ASSERT_TRUE(result.has_value());
    auto match = result_to_json(*result)["matches"][0];
    EXPECT_EQ(match["id"], 66);
    EXPECT_EQ(match["league_name"], "bl1");
    EXPECT_EQ(match["date_time"], "2023-08-18T20:30:00");
    EXPECT_EQ(match["score"].dump(), R"({"home":4,"away":0,"status":"finished"})");
    EXPECT_EQ(match["team_home"]["short_name"], "FCB");
}
