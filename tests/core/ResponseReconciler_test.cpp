#include <gtest/gtest.h>
#include "core/ResponseReconciler.hpp"

using namespace dify_bridge;

TEST(ResponseReconcilerTest, SuccessPassesOnlyResult) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"id":7,"result":{"x":1}})"), json(1));

    EXPECT_FALSE(out.notification.has_value());
    EXPECT_EQ(out.response, json::parse(R"({"jsonrpc":"2.0","id":7,"result":{"x":1}})"));
}

TEST(ResponseReconcilerTest, SuccessStripsExtraTopLevelFields) {
    auto out = ResponseReconciler::reconcile(
        json::parse(R"({"jsonrpc":"2.0","id":"a","result":null,"sessionId":"s","event":"message"})"),
        json("a"));

    EXPECT_EQ(out.response, json::parse(R"({"jsonrpc":"2.0","id":"a","result":null})"));
}

TEST(ResponseReconcilerTest, MissingIdUsesFallback) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"result":true})"), json(12));
    EXPECT_EQ(out.response["id"], 12);

    out = ResponseReconciler::reconcile(json::parse(R"({"id":null,"result":true})"), json(13));
    EXPECT_EQ(out.response["id"], 13);
}

TEST(ResponseReconcilerTest, RemoteErrorNormalized) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"id":7,"error":{"message":"boom"}})"), json(1));

    EXPECT_EQ(out.response,
              json::parse(R"({"jsonrpc":"2.0","id":7,"error":{"code":-32000,"message":"boom"}})"));
}

TEST(ResponseReconcilerTest, ErrorWinsOverResult) {
    auto out = ResponseReconciler::reconcile(
        json::parse(R"({"id":1,"result":{},"error":{"code":-32601,"message":"Method not found"}})"),
        json(1));

    EXPECT_FALSE(out.response.contains("result"));
    EXPECT_EQ(out.response["error"]["code"], -32601);
}

TEST(ResponseReconcilerTest, NullErrorIgnored) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"id":1,"result":"fine","error":null})"), json(1));
    EXPECT_EQ(out.response["result"], "fine");
}

TEST(ResponseReconcilerTest, StatusMessageShapedError) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"id":7,"status":"x","message":"down"})"), json(1));

    EXPECT_EQ(out.response["id"], 7);
    EXPECT_EQ(out.response["error"]["message"], "down");
    EXPECT_EQ(out.response["error"]["code"], -32000);
}

TEST(ResponseReconcilerTest, StatusOnlyShapedError) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"status":401})"), json("req"));

    EXPECT_EQ(out.response["id"], "req");
    EXPECT_EQ(out.response["error"]["code"], 401);
    EXPECT_EQ(out.response["error"]["message"], "Remote error");
}

TEST(ResponseReconcilerTest, NeitherResultNorError) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"id":99,"foo":"bar"})"), json(3));

    // Fallback id, not the payload's own
    EXPECT_EQ(out.response["id"], 3);
    EXPECT_EQ(out.response["error"]["code"], -32603);
    EXPECT_EQ(out.response["error"]["message"], "Remote missing result and error");
}

TEST(ResponseReconcilerTest, NonObjectPayload) {
    for (const json& payload : {json(), json(5), json("text"), json::array({1, 2})}) {
        auto out = ResponseReconciler::reconcile(payload, json(4));
        EXPECT_EQ(out.response["id"], 4);
        EXPECT_EQ(out.response["error"]["code"], -32603);
        EXPECT_EQ(out.response["error"]["message"], "Remote returned non-object");
    }
}

TEST(ResponseReconcilerTest, NotificationYieldsNotificationAndPlaceholder) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"method":"log","params":{"level":"info"}})"),
                                             json(8));

    ASSERT_TRUE(out.notification.has_value());
    EXPECT_EQ(*out.notification, json::parse(R"({"jsonrpc":"2.0","method":"log","params":{"level":"info"}})"));
    EXPECT_EQ(out.response, json::parse(R"({"jsonrpc":"2.0","id":8,"result":{"ok":true}})"));
}

TEST(ResponseReconcilerTest, NotificationParamsDefaulted) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"method":"ping"})"), json(1));
    ASSERT_TRUE(out.notification.has_value());
    EXPECT_EQ((*out.notification)["params"], json::object());

    out = ResponseReconciler::reconcile(json::parse(R"({"method":"ping","params":"x"})"), json(1));
    EXPECT_EQ((*out.notification)["params"], json::object());
}

TEST(ResponseReconcilerTest, NotificationWithNonStringMethod) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"method":17})"), json(1));
    ASSERT_TRUE(out.notification.has_value());
    EXPECT_EQ((*out.notification)["method"], "remote/notification");
}

TEST(ResponseReconcilerTest, MethodWithIdIsNotNotification) {
    auto out = ResponseReconciler::reconcile(json::parse(R"({"id":2,"method":"sampling/createMessage"})"),
                                             json(1));

    EXPECT_FALSE(out.notification.has_value());
    EXPECT_EQ(out.response["error"]["code"], -32603);
}

TEST(ResponseReconcilerTest, ClassifyShapes) {
    EXPECT_TRUE(std::holds_alternative<payload_shape::Notification>(
        ResponseReconciler::classify(json::parse(R"({"method":"m"})"), json())));
    EXPECT_TRUE(std::holds_alternative<payload_shape::NonObject>(
        ResponseReconciler::classify(json(), json())));
    EXPECT_TRUE(std::holds_alternative<payload_shape::Error>(
        ResponseReconciler::classify(json::parse(R"({"error":"x"})"), json())));
    EXPECT_TRUE(std::holds_alternative<payload_shape::Error>(
        ResponseReconciler::classify(json::parse(R"({"message":"x"})"), json())));
    EXPECT_TRUE(std::holds_alternative<payload_shape::MissingResult>(
        ResponseReconciler::classify(json::object(), json())));
    EXPECT_TRUE(std::holds_alternative<payload_shape::Result>(
        ResponseReconciler::classify(json::parse(R"({"result":0,"message":"m"})"), json())));
}
