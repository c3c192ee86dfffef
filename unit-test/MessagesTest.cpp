#include "gtest/gtest.h"
#include "starjudge/common/messages.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace starjudge;
using nlohmann::json;

TEST(MessagesTest, ParseJudgeRequestTest) {
    json j = R"({
        "id": 7,
        "language": "C++",
        "code": "int main() {}",
        "testcases": [{"input": "1 2", "output": "3"}, {"output": "ok"}]
    })"_json;
    auto req = j.get<message::request>();
    EXPECT_EQ(req.type, message::request_type::JUDGE);
    EXPECT_JSON_EQ(req.id, json(7));
    EXPECT_EQ(req.language, "C++");
    ASSERT_EQ(req.testcases.size(), 2u);
    EXPECT_EQ(req.testcases[0].input, "1 2");
    EXPECT_EQ(req.testcases[0].expected_output, "3");
    EXPECT_EQ(req.testcases[1].input, "");
}

TEST(MessagesTest, ParseRunRequestTest) {
    json j = {{"type", "run"}, {"language", "Python"}, {"code", "print(1)"}, {"input", "x"}};
    auto req = j.get<message::request>();
    EXPECT_EQ(req.type, message::request_type::RUN);
    EXPECT_EQ(req.input, "x");
    EXPECT_FALSE(req.expected.has_value());
    EXPECT_TRUE(req.id.is_null());

    j["expected"] = "1";
    EXPECT_TRUE(j.get<message::request>().expected == string("1"));

    // expected 为 null 时视为没有提供
    j["expected"] = nullptr;
    EXPECT_FALSE(j.get<message::request>().expected.has_value());
}

TEST(MessagesTest, ParseBatchRequestTest) {
    json j = {{"type", "batch"}, {"language", "Java"}, {"code", ""}, {"inputs", {"a", "b", ""}}};
    auto req = j.get<message::request>();
    EXPECT_EQ(req.type, message::request_type::BATCH);
    ASSERT_EQ(req.inputs.size(), 3u);
    EXPECT_EQ(req.inputs[2], "");
}

TEST(MessagesTest, MalformedRequestTest) {
    EXPECT_THROW(json::array().get<message::request>(), invalid_argument);
    EXPECT_THROW((json{{"type", "compile"}, {"language", "C++"}, {"code", ""}}.get<message::request>()), invalid_argument);
    EXPECT_THROW((json{{"code", ""}, {"testcases", json::array()}}.get<message::request>()), invalid_argument);
    EXPECT_THROW((json{{"language", "C++"}, {"code", 42}, {"testcases", json::array()}}.get<message::request>()), invalid_argument);
    EXPECT_THROW((json{{"language", "C++"}, {"code", ""}, {"testcases", "1 2"}}.get<message::request>()), invalid_argument);
    EXPECT_THROW((json{{"language", "C++"}, {"code", ""}, {"testcases", json::array({json{{"input", "1"}}})}}.get<message::request>()), invalid_argument);
    EXPECT_THROW((json{{"type", "batch"}, {"language", "C++"}, {"code", ""}, {"inputs", {1, 2}}}.get<message::request>()), invalid_argument);

    try {
        json{{"language", "C++"}, {"testcases", json::array()}}.get<message::request>();
        FAIL() << "missing code should be rejected";
    } catch (invalid_argument &ex) {
        EXPECT_STREQ(ex.what(), "missing field: code");
    }
}

TEST(MessagesTest, ErrorResponseTest) {
    json expected = {{"status", "Judge Error"}, {"message", "boom"}};
    EXPECT_JSON_EQ(message::error_response("boom"), expected);

    expected["id"] = "req-1";
    EXPECT_JSON_EQ(message::error_response("boom", "req-1"), expected);

    json long_message = message::error_response(string(2000, 'x'));
    EXPECT_EQ(long_message["message"].get<string>().size(), 500u);
}

TEST(MessagesTest, JudgeVerdictTest) {
    judge_verdict verdict;
    verdict.status = status::WRONG_ANSWER;
    verdict.message = "Wrong Answer";
    verdict.time_ms = 12;
    verdict.score = 50;
    verdict.results.push_back({0, status::ACCEPTED, "accepted", 5});
    verdict.results.push_back({1, status::WRONG_ANSWER, "wrong answer", 7});

    json expected = R"({
        "status": "Wrong Answer",
        "message": "Wrong Answer",
        "timeMs": 12,
        "score": 50,
        "cached": false,
        "results": [
            {"index": 0, "status": "Accepted", "message": "accepted", "timeMs": 5},
            {"index": 1, "status": "Wrong Answer", "message": "wrong answer", "timeMs": 7}
        ]
    })"_json;
    EXPECT_JSON_EQ(json(verdict), expected);
}

TEST(MessagesTest, SampleResultTest) {
    sample_result result;
    result.status = status::OK;
    result.message = "finished";
    result.output = "hi\n";
    result.time_ms = 3;
    result.cached = true;

    json j = result;
    EXPECT_FALSE(j.contains("expected"));
    EXPECT_EQ(j["status"], "OK");
    EXPECT_EQ(j["output"], "hi\n");
    EXPECT_EQ(j["cached"], true);

    result.expected = "hi";
    EXPECT_EQ(json(result)["expected"], "hi");
}

TEST(MessagesTest, BatchResultTest) {
    batch_result result;
    result.status = status::TIME_LIMIT_EXCEEDED;
    result.message = "time limit exceeded";
    batch_item item;
    item.index = 0;
    item.status = status::TIME_LIMIT_EXCEEDED;
    item.message = "time limit exceeded";
    item.time_ms = 1500;
    result.results.push_back(item);

    json expected = R"({
        "status": "Time Limit Exceeded",
        "message": "time limit exceeded",
        "cached": false,
        "results": [
            {"index": 0, "status": "Time Limit Exceeded", "message": "time limit exceeded", "output": "", "timeMs": 1500}
        ]
    })"_json;
    EXPECT_JSON_EQ(json(result), expected);
}
